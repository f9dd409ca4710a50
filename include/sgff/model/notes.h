// =============================================================================
// sgff - File Notes
// =============================================================================

#ifndef SGFF_MODEL_NOTES_H
#define SGFF_MODEL_NOTES_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sgff/markup/markup.h"

namespace sgff::model {

/// @brief Key -> text entries of the <Notes> markup (block type 6).
struct Notes {
    std::vector<std::pair<std::string, std::string>> entries;

    /// @brief Value of a key, or nullptr.
    [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

    [[nodiscard]] std::string description() const { return valueOr("Description"); }
    [[nodiscard]] std::string created() const { return valueOr("Created"); }
    [[nodiscard]] std::string lastModified() const { return valueOr("LastModified"); }

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

private:
    [[nodiscard]] std::string valueOr(std::string_view key) const;
};

/// @throws MarkupError unless the root is <Notes>.
[[nodiscard]] Notes parseNotes(const markup::MarkupNode& root);

}  // namespace sgff::model

#endif  // SGFF_MODEL_NOTES_H
