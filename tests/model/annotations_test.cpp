// =============================================================================
// sgff - Feature, Notes and Primer View Tests
// =============================================================================

#include <gtest/gtest.h>

#include "sgff/common/error.h"
#include "sgff/model/alignment.h"
#include "sgff/model/feature.h"
#include "sgff/model/notes.h"
#include "sgff/model/primer.h"
#include "sgff/model/properties.h"

namespace sgff::model {
namespace {

using markup::parseMarkup;

// =============================================================================
// Features
// =============================================================================

TEST(FeatureTest, ParsesSegmentsAndQualifiers) {
    auto features = parseFeatures(parseMarkup(
        "<Features nextValidID=\"2\">"
        "<Feature name=\"lacZ\" directionality=\"1\" type=\"gene\" color=\"#ffff00\">"
        "<Segment range=\"11-20\" color=\"#ffff00\" type=\"standard\"/>"
        "<Q name=\"gene\"><V text=\"lacZ\"/></Q>"
        "<Q name=\"codon_start\"><V int=\"1\"/></Q>"
        "<Q name=\"note\"><V text=\"first\"/><V text=\"second\"/></Q>"
        "</Feature>"
        "</Features>"));

    ASSERT_EQ(features.size(), 1u);
    const auto& lacZ = features[0];
    EXPECT_EQ(lacZ.name, "lacZ");
    EXPECT_EQ(lacZ.type, "gene");
    EXPECT_EQ(lacZ.color, "#ffff00");
    EXPECT_EQ(lacZ.strand, Strand::kForward);

    ASSERT_EQ(lacZ.segments.size(), 1u);
    EXPECT_EQ(lacZ.segments[0].start, 10u);
    EXPECT_EQ(lacZ.segments[0].end, 20u);
    EXPECT_EQ(lacZ.segments[0].length(), 10u);
    EXPECT_EQ(lacZ.segments[0].type, "standard");

    ASSERT_NE(lacZ.qualifier("gene"), nullptr);
    EXPECT_EQ(*lacZ.qualifier("gene"), "lacZ");
    EXPECT_EQ(*lacZ.qualifier("codon_start"), "1");
    EXPECT_EQ(*lacZ.qualifier("note"), "first,second");
    EXPECT_EQ(lacZ.qualifier("product"), nullptr);
}

TEST(FeatureTest, SpanCoversAllSegments) {
    auto features = parseFeatures(parseMarkup(
        "<Features><Feature name=\"ori\" directionality=\"2\">"
        "<Segment range=\"9-12\"/><Segment range=\"1-3\"/>"
        "</Feature></Features>"));

    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(features[0].strand, Strand::kReverse);
    EXPECT_EQ(features[0].start(), 0u);
    EXPECT_EQ(features[0].end(), 12u);
    EXPECT_EQ(features[0].length(), 12u);
}

TEST(FeatureTest, ReversedRangeIsNormalized) {
    auto features = parseFeatures(
        parseMarkup("<Features><Feature name=\"f\"><Segment range=\"20-11\"/></Feature></Features>"));
    ASSERT_EQ(features[0].segments.size(), 1u);
    EXPECT_EQ(features[0].segments[0].start, 10u);
    EXPECT_EQ(features[0].segments[0].end, 20u);
    EXPECT_EQ(features[0].strand, Strand::kNone);
}

TEST(FeatureTest, FeatureWithoutSegments) {
    auto features = parseFeatures(parseMarkup("<Features><Feature name=\"empty\"/></Features>"));
    ASSERT_EQ(features.size(), 1u);
    EXPECT_EQ(features[0].start(), 0u);
    EXPECT_EQ(features[0].end(), 0u);
}

TEST(FeatureTest, MalformedInputThrows) {
    EXPECT_THROW((void)parseFeatures(parseMarkup("<Notes/>")), MarkupError);
    EXPECT_THROW((void)parseFeatures(parseMarkup(
                     "<Features><Feature name=\"f\"><Segment range=\"x-3\"/></Feature></Features>")),
                 MarkupError);
    EXPECT_THROW((void)parseFeatures(parseMarkup(
                     "<Features><Feature name=\"f\"><Segment range=\"0-0\"/></Feature></Features>")),
                 MarkupError);
    EXPECT_THROW((void)parseFeatures(parseMarkup(
                     "<Features><Feature name=\"f\" directionality=\"7\"/></Features>")),
                 MarkupError);
}

// =============================================================================
// Notes
// =============================================================================

TEST(NotesTest, MapsChildElementsToText) {
    auto notes = parseNotes(parseMarkup(
        "<Notes><Type>Synthetic</Type><Description>test plasmid</Description>"
        "<Created UTC=\"12:00:00\">2024.1.1</Created>"
        "<LastModified>2024.2.1</LastModified></Notes>"));

    EXPECT_FALSE(notes.empty());
    EXPECT_EQ(notes.entries.size(), 4u);
    EXPECT_EQ(notes.description(), "test plasmid");
    EXPECT_EQ(notes.created(), "2024.1.1");
    EXPECT_EQ(notes.lastModified(), "2024.2.1");
    ASSERT_NE(notes.find("Type"), nullptr);
    EXPECT_EQ(*notes.find("Type"), "Synthetic");
    EXPECT_EQ(notes.find("Comments"), nullptr);
}

TEST(NotesTest, EmptyNotes) {
    auto notes = parseNotes(parseMarkup("<Notes/>"));
    EXPECT_TRUE(notes.empty());
    EXPECT_TRUE(notes.description().empty());
}

TEST(NotesTest, WrongRootThrows) {
    EXPECT_THROW((void)parseNotes(parseMarkup("<Primers/>")), MarkupError);
}

// =============================================================================
// Primers
// =============================================================================

TEST(PrimerTest, ParsesBindingSites) {
    auto primers = parsePrimers(parseMarkup(
        "<Primers nextValidID=\"2\">"
        "<Primer name=\"fwd\" sequence=\"ATGCAT\" description=\"forward\">"
        "<BindingSite location=\"0-5\" boundStrand=\"0\"/>"
        "</Primer>"
        "<Primer name=\"rev\" sequence=\"GCATGC\">"
        "<BindingSite location=\"6-11\" boundStrand=\"1\"/>"
        "<BindingSite location=\"20-25\" boundStrand=\"1\"/>"
        "</Primer>"
        "</Primers>"));

    ASSERT_EQ(primers.size(), 2u);
    EXPECT_EQ(primers[0].name, "fwd");
    EXPECT_EQ(primers[0].sequence, "ATGCAT");
    EXPECT_EQ(primers[0].description, "forward");
    ASSERT_EQ(primers[0].bindingSites.size(), 1u);
    EXPECT_EQ(primers[0].bindingSites[0], (BindingSite{0, 6, Strand::kForward}));

    EXPECT_TRUE(primers[1].description.empty());
    ASSERT_EQ(primers[1].bindingSites.size(), 2u);
    EXPECT_EQ(primers[1].bindingSites[1], (BindingSite{20, 26, Strand::kReverse}));
}

TEST(PrimerTest, MalformedLocationThrows) {
    EXPECT_THROW((void)parsePrimers(parseMarkup(
                     "<Primers><Primer name=\"p\"><BindingSite location=\"start-5\"/></Primer>"
                     "</Primers>")),
                 MarkupError);
    EXPECT_THROW((void)parsePrimers(parseMarkup(
                     "<Primers><Primer name=\"p\"><BindingSite/></Primer></Primers>")),
                 MarkupError);
}

TEST(PrimerTest, WrongRootThrows) {
    EXPECT_THROW((void)parsePrimers(parseMarkup("<Features/>")), MarkupError);
}

TEST(PrimerTest, BindingSiteUsesFeatureCoordinates) {
    auto primers = parsePrimers(parseMarkup(
        "<Primers><Primer name=\"p\"><BindingSite location=\"19-10\"/></Primer></Primers>"));
    auto features = parseFeatures(
        parseMarkup("<Features><Feature name=\"f\"><Segment range=\"11-20\"/></Feature></Features>"));

    ASSERT_EQ(primers[0].bindingSites.size(), 1u);
    const auto& site = primers[0].bindingSites[0];
    EXPECT_EQ(site.start, features[0].start());
    EXPECT_EQ(site.end, features[0].end());
}

// =============================================================================
// Properties
// =============================================================================

TEST(PropertiesTest, MapsChildElementsToText) {
    auto properties = parseProperties(parseMarkup(
        "<AdditionalSequenceProperties version=\"1\">"
        "<UpstreamStickiness>0</UpstreamStickiness>"
        "<DownstreamStickiness>4</DownstreamStickiness>"
        "</AdditionalSequenceProperties>"));

    EXPECT_EQ(properties.rootName, "AdditionalSequenceProperties");
    ASSERT_EQ(properties.attributes.size(), 1u);
    EXPECT_EQ(properties.attributes[0].second, "1");
    ASSERT_EQ(properties.entries.size(), 2u);
    ASSERT_NE(properties.find("DownstreamStickiness"), nullptr);
    EXPECT_EQ(*properties.find("DownstreamStickiness"), "4");
    EXPECT_EQ(properties.find("Missing"), nullptr);
    EXPECT_FALSE(properties.empty());
}

TEST(PropertiesTest, EmptyElement) {
    auto properties = parseProperties(parseMarkup("<AdditionalSequenceProperties/>"));
    EXPECT_TRUE(properties.empty());
}

// =============================================================================
// Alignable Sequences
// =============================================================================

TEST(AlignableSequenceTest, ParsesSequences) {
    auto sequences = parseAlignableSequences(parseMarkup(
        "<AlignableSequences trimStringency=\"Medium\">"
        "<Sequence name=\"read1\" sequence=\"ATGCAT\" trimmedRange=\"0-5\"/>"
        "<Sequence name=\"read2\" sequence=\"GGCC\"/>"
        "</AlignableSequences>"));

    ASSERT_EQ(sequences.size(), 2u);
    EXPECT_EQ(sequences[0].name, "read1");
    EXPECT_EQ(sequences[0].sequence, "ATGCAT");
    ASSERT_EQ(sequences[0].attributes.size(), 3u);
    EXPECT_EQ(sequences[0].attributes[2].first, "trimmedRange");
    EXPECT_EQ(sequences[1].sequence, "GGCC");
}

TEST(AlignableSequenceTest, EmptyListAndWrongRoot) {
    EXPECT_TRUE(parseAlignableSequences(parseMarkup("<AlignableSequences/>")).empty());
    EXPECT_THROW((void)parseAlignableSequences(parseMarkup("<Primers/>")), MarkupError);
}

}  // namespace
}  // namespace sgff::model
