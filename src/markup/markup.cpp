// =============================================================================
// sgff - Markup Tree Implementation
// =============================================================================

#include "sgff/markup/markup.h"

#include <charconv>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::markup {

namespace pt = boost::property_tree;

namespace {

std::optional<std::uint64_t> parseUnsigned(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t result = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, result);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

constexpr std::string_view kAttributesKey = "<xmlattr>";
constexpr std::string_view kCommentKey = "<xmlcomment>";
constexpr std::string_view kTextKey = "<xmltext>";

MarkupNode convert(const std::string& name, const pt::ptree& tree) {
    MarkupNode node;
    node.name = name;
    node.text = tree.data();

    for (const auto& [key, child] : tree) {
        if (key == kAttributesKey) {
            for (const auto& [attrName, attrValue] : child) {
                node.attributes.emplace_back(attrName, attrValue.data());
            }
        } else if (key == kTextKey) {
            node.text += child.data();
        } else if (key != kCommentKey) {
            node.children.push_back(convert(key, child));
        }
    }
    return node;
}

}  // namespace

// =============================================================================
// MarkupNode
// =============================================================================

const std::string* MarkupNode::attribute(std::string_view key) const noexcept {
    for (const auto& [k, v] : attributes) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string MarkupNode::attributeOr(std::string_view key, std::string_view fallback) const {
    const std::string* value = attribute(key);
    return value != nullptr ? *value : std::string(fallback);
}

const MarkupNode* MarkupNode::child(std::string_view childName) const noexcept {
    for (const auto& c : children) {
        if (c.name == childName) {
            return &c;
        }
    }
    return nullptr;
}

std::vector<const MarkupNode*> MarkupNode::childrenNamed(std::string_view childName) const {
    std::vector<const MarkupNode*> out;
    for (const auto& c : children) {
        if (c.name == childName) {
            out.push_back(&c);
        }
    }
    return out;
}

// =============================================================================
// Parsing
// =============================================================================

MarkupNode parseMarkup(std::string_view text) {
    pt::ptree tree;
    std::istringstream input{std::string(text)};
    try {
        pt::read_xml(input, tree, pt::xml_parser::no_comments);
    } catch (const pt::xml_parser_error& ex) {
        throw MarkupError(fmt::format("malformed markup at line {}: {}", ex.line(), ex.message()));
    }

    for (const auto& [key, child] : tree) {
        if (key != kCommentKey && key != kAttributesKey && key != kTextKey) {
            return convert(key, child);
        }
    }
    throw MarkupError("markup contains no element");
}

std::optional<std::uint64_t> attributeAsUnsigned(const MarkupNode& node, std::string_view key) {
    const std::string* value = node.attribute(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return parseUnsigned(*value);
}

bool attributeAsBool(const MarkupNode& node, std::string_view key) {
    const std::string* value = node.attribute(key);
    return value != nullptr && (*value == "1" || *value == "true" || *value == "yes");
}

std::optional<std::pair<std::uint64_t, std::uint64_t>> parseRange(std::string_view text) {
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        auto single = parseUnsigned(text);
        if (!single) {
            return std::nullopt;
        }
        return std::pair{*single, *single};
    }

    auto first = parseUnsigned(text.substr(0, dash));
    auto last = parseUnsigned(text.substr(dash + 1));
    if (!first || !last) {
        return std::nullopt;
    }
    return std::pair{*first, *last};
}

}  // namespace sgff::markup
