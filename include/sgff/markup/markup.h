// =============================================================================
// sgff - Markup Tree
// =============================================================================
// Generic element tree for the XML fragments embedded in markup blocks
// (types 5, 6, 7, 8, 10, 14, 17, 28, 29).
//
// XML parsing is delegated to Boost.PropertyTree; this module only converts
// the property tree into an order-preserving element/attribute shape.
// =============================================================================

#ifndef SGFF_MARKUP_MARKUP_H
#define SGFF_MARKUP_MARKUP_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sgff::markup {

/// @brief One markup element.
struct MarkupNode {
    /// @brief Element name.
    std::string name;

    /// @brief Attributes in document order.
    std::vector<std::pair<std::string, std::string>> attributes;

    /// @brief Character data directly inside the element.
    std::string text;

    /// @brief Child elements in document order.
    std::vector<MarkupNode> children;

    /// @brief Attribute value, or nullptr.
    [[nodiscard]] const std::string* attribute(std::string_view key) const noexcept;

    /// @brief Attribute value or a fallback.
    [[nodiscard]] std::string attributeOr(std::string_view key, std::string_view fallback) const;

    /// @brief First child with the given name, or nullptr.
    [[nodiscard]] const MarkupNode* child(std::string_view childName) const noexcept;

    /// @brief All children with the given name.
    [[nodiscard]] std::vector<const MarkupNode*> childrenNamed(std::string_view childName) const;

    [[nodiscard]] bool operator==(const MarkupNode& other) const = default;
};

/// @brief Parse an XML document.
/// @return The document element.
/// @throws MarkupError if the text is not well-formed or has no element.
[[nodiscard]] MarkupNode parseMarkup(std::string_view text);

/// @brief Parse an attribute as an unsigned integer.
/// @return nullopt when the attribute is missing or not a number.
[[nodiscard]] std::optional<std::uint64_t> attributeAsUnsigned(const MarkupNode& node,
                                                               std::string_view key);

/// @brief Interpret "1"/"true"/"yes" as true.
[[nodiscard]] bool attributeAsBool(const MarkupNode& node, std::string_view key);

/// @brief Parse a "first-last" range; a single number yields {n, n}.
/// @return nullopt when either bound is not a number.
[[nodiscard]] std::optional<std::pair<std::uint64_t, std::uint64_t>> parseRange(
    std::string_view text);

}  // namespace sgff::markup

#endif  // SGFF_MARKUP_MARKUP_H
