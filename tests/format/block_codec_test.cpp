// =============================================================================
// sgff - TLV Dispatcher and Container Codec Tests
// =============================================================================

#include "sgff/format/block_codec.h"

#include <gtest/gtest.h>

#include <string>

#include "sgff/common/error.h"
#include "test_builders.h"

namespace sgff::format::test {

namespace {

BlockList parse(ByteSpan stream, const ParseOptions& options = {}) {
    return parseBlocks(stream, DecodeContext{options});
}

ByteBuffer serialize(const BlockList& blocks, const SerializeOptions& options = {}) {
    return serializeBlocks(blocks, EncodeContext{options});
}

/// @brief A type-30 payload nested `levels` deep around a notes block.
ByteBuffer nestedContainers(int levels) {
    ByteBuffer inner = frame(block::kNotes, "<Notes/>");
    for (int i = 0; i < levels; ++i) {
        inner = frame(block::kHistoryContent, lzma(inner));
    }
    return inner;
}

}  // namespace

// =============================================================================
// Codec Table
// =============================================================================

TEST(CodecTableTest, RegisteredAndRawTypes) {
    for (BlockTypeId type : {0, 1, 5, 6, 7, 8, 10, 11, 14, 16, 17, 18, 21, 28, 29, 30, 32}) {
        EXPECT_NE(findCodec(type), nullptr) << static_cast<int>(type);
    }
    for (BlockTypeId type : {2, 3, 4, 9, 13, 99, 255}) {
        EXPECT_EQ(findCodec(type), nullptr) << static_cast<int>(type);
    }
}

TEST(CodecTableTest, MismatchedValueFailsToEncode) {
    const SerializeOptions options;
    Block mismatched{block::kDnaSequence, MarkupBlock{"<Notes/>"}, 0};
    EXPECT_THROW((void)encodeBlock(mismatched, EncodeContext{options}), SerializeError);

    Block raw{block::kDnaSequence, RawBlock{{0x03, 'A'}}, 0};
    EXPECT_EQ(encodeBlock(raw, EncodeContext{options}), (ByteBuffer{0x03, 'A'}));
}

// =============================================================================
// Nested Containers
// =============================================================================

TEST(NestedContainerTest, DecodesRecursivelyAndRoundTrips) {
    const ByteBuffer stream = nestedContainers(3);
    const BlockList blocks = parse(stream);

    const auto* level1 = blocks.firstAs<NestedContainer>(block::kHistoryContent);
    ASSERT_NE(level1, nullptr);
    const auto* level2 = level1->blocks->firstAs<NestedContainer>(block::kHistoryContent);
    ASSERT_NE(level2, nullptr);
    const auto* level3 = level2->blocks->firstAs<NestedContainer>(block::kHistoryContent);
    ASSERT_NE(level3, nullptr);
    EXPECT_NE(level3->blocks->firstAs<MarkupBlock>(block::kNotes), nullptr);

    EXPECT_EQ(serialize(blocks), stream);
}

TEST(NestedContainerTest, DepthBudgetIsEnforced) {
    ParseOptions options;
    options.maxNestingDepth = 2;
    EXPECT_NO_THROW((void)parse(nestedContainers(2), options));

    try {
        (void)parse(nestedContainers(3), options);
        FAIL() << "expected NestingTooDeepError";
    } catch (const NestingTooDeepError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->blockType, std::uint8_t{block::kHistoryContent});
        EXPECT_EQ(ex.context()->nestingDepth, std::uint32_t{2});
    }
}

TEST(NestedContainerTest, CorruptPayloadIsHardError) {
    const ByteBuffer garbage{1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_THROW((void)parse(frame(block::kHistoryContent, garbage)), DecompressionError);
}

TEST(NestedContainerTest, EditedContentIsRecompressed) {
    BlockList blocks = parse(nestedContainers(1));
    auto& nested = std::get<NestedContainer>(blocks.valueAt(0));
    nested.blocks->append(block::kProperties, MarkupBlock{"<AdditionalSequenceProperties/>"});

    const BlockList reread = parse(serialize(blocks));
    const auto* inner = reread.firstAs<NestedContainer>(block::kHistoryContent);
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->blocks->size(), 2u);
}

// =============================================================================
// History Entries
// =============================================================================

TEST(HistoryEntryTest, PlainEntryWithNodeInfo) {
    const ByteBuffer info = frame(block::kProperties, "<P/>");
    const ByteBuffer payload = historyEntry(7, "ATGC", info);

    const ParseOptions options;
    const HistoryEntry entry = decodeHistoryEntry(payload, DecodeContext{options});
    EXPECT_EQ(entry.nodeIndex, 7u);
    EXPECT_EQ(entry.tag, HistorySequenceTag::kPlainDna);
    EXPECT_EQ(entry.bases(), std::optional<std::string>("ATGC"));
    EXPECT_EQ(entry.nodeInfo->size(), 1u);

    const SerializeOptions writeOptions;
    EXPECT_EQ(encodeHistoryEntry(entry, EncodeContext{writeOptions}), payload);
}

TEST(HistoryEntryTest, CompressedSnapshot) {
    io::ByteWriter writer;
    writer.writeU32(3);
    writer.writeU8(static_cast<std::uint8_t>(HistorySequenceTag::kCompressedDna));
    writer.writeBytes(encodeCompressed(CompressedSequence::fromBases("GATTACAGATTACA")));
    const ByteBuffer payload = writer.release();

    const ParseOptions options;
    const HistoryEntry entry = decodeHistoryEntry(payload, DecodeContext{options});
    ASSERT_NE(entry.compressedSequence(), nullptr);
    EXPECT_EQ(entry.bases(), std::optional<std::string>("GATTACAGATTACA"));
    EXPECT_TRUE(entry.nodeInfo->empty());

    const SerializeOptions writeOptions;
    EXPECT_EQ(encodeHistoryEntry(entry, EncodeContext{writeOptions}), payload);
}

TEST(HistoryEntryTest, ModifierOnlyHasNoSnapshot) {
    const ByteBuffer payload{0, 0, 0, 9, 29};
    const ParseOptions options;
    const HistoryEntry entry = decodeHistoryEntry(payload, DecodeContext{options});
    EXPECT_EQ(entry.tag, HistorySequenceTag::kModifierOnly);
    EXPECT_FALSE(entry.bases().has_value());
}

TEST(HistoryEntryTest, UnknownTagIsRejected) {
    const ByteBuffer payload{0, 0, 0, 1, 0x42, 0, 0, 0, 0};
    try {
        (void)parse(frame(block::kHistoryEntry, payload));
        FAIL() << "expected UnknownSequenceTypeError";
    } catch (const UnknownSequenceTypeError& ex) {
        EXPECT_EQ(ex.context()->blockType, std::uint8_t{block::kHistoryEntry});
        EXPECT_EQ(ex.context()->byteOffset, std::uint64_t{0});
    }
}

TEST(HistoryEntryTest, ShortSnapshotIsTruncatedSequence) {
    const ByteBuffer payload{0, 0, 0, 1, 0, 0, 0, 0, 20, 'A', 'T'};
    EXPECT_THROW((void)parse(frame(block::kHistoryEntry, payload)), TruncatedSequenceError);
}

TEST(HistoryEntryTest, MismatchedCompressedLengthFailsToEncode) {
    HistoryEntry entry;
    entry.nodeIndex = 1;
    entry.tag = HistorySequenceTag::kCompressedDna;
    CompressedSequence seq = CompressedSequence::fromBases("ATGC");
    seq.compressedLength += 1;
    entry.sequence = seq;

    const SerializeOptions options;
    EXPECT_THROW((void)encodeHistoryEntry(entry, EncodeContext{options}), SerializeError);
}

// =============================================================================
// Trace Containers
// =============================================================================

TEST(TraceContainerTest, ReverseDirectionIsKeptVerbatim) {
    const ByteBuffer payload = traceContainer(5, "ACGT");
    const ParseOptions options;
    const TraceContainer container = decodeTraceContainer(payload, DecodeContext{options});

    EXPECT_TRUE(container.isReverse());
    EXPECT_EQ(container.direction, 5u);
    ASSERT_NE(container.trace(), nullptr);
    EXPECT_EQ(container.trace()->bases(), "ACGT");
    EXPECT_TRUE(container.blocks->contains(block::kProperties));

    const SerializeOptions writeOptions;
    EXPECT_EQ(encodeTraceContainer(container, EncodeContext{writeOptions}), payload);
}

TEST(TraceContainerTest, MissingTraceIsRejected) {
    io::ByteWriter writer;
    writer.writeU32(0);
    writer.writeBytes(frame(block::kProperties, "<P/>"));
    EXPECT_THROW((void)parse(frame(block::kTraceContainer, writer.buffer())), MissingTraceError);
}

TEST(TraceContainerTest, InnermostBlockIsReported) {
    ByteBuffer ztr = ztrStream("ACGT", "x");
    ztr[0] = 0x00;

    io::ByteWriter writer;
    writer.writeU32(0);
    writer.writeBytes(frame(block::kTrace, ztr));

    ByteBuffer stream = frame(block::kNotes, "<Notes/>");
    append(stream, frame(block::kTraceContainer, writer.buffer()));

    try {
        (void)parse(stream);
        FAIL() << "expected InvalidMagicError";
    } catch (const InvalidMagicError& ex) {
        ASSERT_TRUE(ex.hasContext());
        EXPECT_EQ(ex.context()->blockType, std::uint8_t{block::kTrace});
        EXPECT_EQ(ex.context()->nestingDepth, std::uint32_t{1});
    }
}

// =============================================================================
// Compressed Markup
// =============================================================================

TEST(CompressedMarkupTest, UnchangedTextReusesOriginalBytes) {
    const ByteBuffer payload = io::lzmaCompress(io::asBytes("<HistoryModifier/>"), 9);
    const CompressedMarkupBlock markup = decodeCompressedMarkup(payload);
    EXPECT_EQ(markup.text, "<HistoryModifier/>");

    SerializeOptions options;
    EXPECT_EQ(encodeCompressedMarkup(markup, EncodeContext{options}), payload);

    options.reuseOriginalCompression = false;
    options.lzmaPreset = 0;
    const ByteBuffer fresh = encodeCompressedMarkup(markup, EncodeContext{options});
    EXPECT_EQ(io::toString(io::lzmaDecompress(fresh)), markup.text);
}

}  // namespace sgff::format::test
