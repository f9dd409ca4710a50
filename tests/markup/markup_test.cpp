// =============================================================================
// sgff - Markup Tree Tests
// =============================================================================

#include "sgff/markup/markup.h"

#include <gtest/gtest.h>

#include "sgff/common/error.h"

namespace sgff::markup {
namespace {

TEST(MarkupTest, ParsesAttributesInDocumentOrder) {
    auto root = parseMarkup(R"(<Feature name="lacZ" type="gene" color="#ff0000"/>)");

    EXPECT_EQ(root.name, "Feature");
    ASSERT_EQ(root.attributes.size(), 3u);
    EXPECT_EQ(root.attributes[0].first, "name");
    EXPECT_EQ(root.attributes[1].first, "type");
    EXPECT_EQ(root.attributes[2].first, "color");
    ASSERT_NE(root.attribute("type"), nullptr);
    EXPECT_EQ(*root.attribute("type"), "gene");
    EXPECT_EQ(root.attribute("missing"), nullptr);
    EXPECT_EQ(root.attributeOr("missing", "fallback"), "fallback");
    EXPECT_TRUE(root.children.empty());
}

TEST(MarkupTest, KeepsChildrenAndText) {
    auto root = parseMarkup(
        "<Notes><Type>Synthetic</Type><Description>a plasmid</Description>"
        "<Type>Natural</Type></Notes>");

    ASSERT_EQ(root.children.size(), 3u);
    EXPECT_EQ(root.children[0].name, "Type");
    EXPECT_EQ(root.children[0].text, "Synthetic");
    EXPECT_EQ(root.children[2].text, "Natural");

    const auto* description = root.child("Description");
    ASSERT_NE(description, nullptr);
    EXPECT_EQ(description->text, "a plasmid");
    EXPECT_EQ(root.child("Created"), nullptr);
    EXPECT_EQ(root.childrenNamed("Type").size(), 2u);
}

TEST(MarkupTest, SkipsCommentsAndDeclaration) {
    auto root = parseMarkup(
        "<?xml version=\"1.0\"?><!-- header --><Primers><!-- none yet --></Primers>");
    EXPECT_EQ(root.name, "Primers");
    EXPECT_TRUE(root.children.empty());
}

TEST(MarkupTest, MalformedMarkupThrows) {
    EXPECT_THROW((void)parseMarkup("<Features><Feature name=\"a\">"), MarkupError);
    EXPECT_THROW((void)parseMarkup("<Notes"), MarkupError);
}

TEST(MarkupTest, DocumentWithoutElementThrows) {
    EXPECT_THROW((void)parseMarkup(""), MarkupError);
}

TEST(MarkupTest, UnsignedAttributes) {
    auto root = parseMarkup(R"(<Node ID="42" seqLen="x12" neg="-1" empty=""/>)");
    EXPECT_EQ(attributeAsUnsigned(root, "ID"), 42u);
    EXPECT_FALSE(attributeAsUnsigned(root, "seqLen").has_value());
    EXPECT_FALSE(attributeAsUnsigned(root, "neg").has_value());
    EXPECT_FALSE(attributeAsUnsigned(root, "empty").has_value());
    EXPECT_FALSE(attributeAsUnsigned(root, "missing").has_value());
}

TEST(MarkupTest, BooleanAttributes) {
    auto root = parseMarkup(R"(<Node a="1" b="true" c="yes" d="0" e="no"/>)");
    EXPECT_TRUE(attributeAsBool(root, "a"));
    EXPECT_TRUE(attributeAsBool(root, "b"));
    EXPECT_TRUE(attributeAsBool(root, "c"));
    EXPECT_FALSE(attributeAsBool(root, "d"));
    EXPECT_FALSE(attributeAsBool(root, "e"));
    EXPECT_FALSE(attributeAsBool(root, "missing"));
}

TEST(ParseRangeTest, Ranges) {
    auto range = parseRange("11-20");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 11u);
    EXPECT_EQ(range->second, 20u);

    auto single = parseRange("7");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->first, 7u);
    EXPECT_EQ(single->second, 7u);

    // Wrapping ranges on circular sequences are stored high-low.
    auto reversed = parseRange("90-5");
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(reversed->first, 90u);
    EXPECT_EQ(reversed->second, 5u);
}

TEST(ParseRangeTest, MalformedRanges) {
    EXPECT_FALSE(parseRange("").has_value());
    EXPECT_FALSE(parseRange("-").has_value());
    EXPECT_FALSE(parseRange("1-").has_value());
    EXPECT_FALSE(parseRange("a-b").has_value());
    EXPECT_FALSE(parseRange("1-2-3").has_value());
}

}  // namespace
}  // namespace sgff::markup
