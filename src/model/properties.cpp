// =============================================================================
// sgff - Sequence Properties Implementation
// =============================================================================

#include "sgff/model/properties.h"

namespace sgff::model {

const std::string* Properties::find(std::string_view key) const noexcept {
    for (const auto& [name, value] : entries) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

Properties parseProperties(const markup::MarkupNode& root) {
    Properties properties;
    properties.rootName = root.name;
    properties.attributes = root.attributes;
    properties.entries.reserve(root.children.size());
    for (const auto& child : root.children) {
        properties.entries.emplace_back(child.name, child.text);
    }
    return properties;
}

}  // namespace sgff::model
