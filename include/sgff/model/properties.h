// =============================================================================
// sgff - Sequence Properties
// =============================================================================

#ifndef SGFF_MODEL_PROPERTIES_H
#define SGFF_MODEL_PROPERTIES_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sgff/markup/markup.h"

namespace sgff::model {

/// @brief Key -> text entries of the additional-properties markup (block type 8).
/// @note Any document element is accepted; its name is kept in rootName.
struct Properties {
    std::string rootName;

    /// @brief Attributes of the document element.
    std::vector<std::pair<std::string, std::string>> attributes;

    /// @brief Child element name -> text, in document order.
    std::vector<std::pair<std::string, std::string>> entries;

    /// @brief Entry text, or nullptr.
    [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return attributes.empty() && entries.empty(); }
};

[[nodiscard]] Properties parseProperties(const markup::MarkupNode& root);

}  // namespace sgff::model

#endif  // SGFF_MODEL_PROPERTIES_H
