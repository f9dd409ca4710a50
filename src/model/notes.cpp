// =============================================================================
// sgff - File Notes Implementation
// =============================================================================

#include "sgff/model/notes.h"

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::model {

const std::string* Notes::find(std::string_view key) const noexcept {
    for (const auto& [name, value] : entries) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::string Notes::valueOr(std::string_view key) const {
    const std::string* value = find(key);
    return value != nullptr ? *value : std::string{};
}

Notes parseNotes(const markup::MarkupNode& root) {
    if (root.name != "Notes") {
        throw MarkupError(fmt::format("expected <Notes>, found <{}>", root.name));
    }

    Notes notes;
    notes.entries.reserve(root.children.size());
    for (const auto& child : root.children) {
        notes.entries.emplace_back(child.name, child.text);
    }
    return notes;
}

}  // namespace sgff::model
