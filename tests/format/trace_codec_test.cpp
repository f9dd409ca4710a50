// =============================================================================
// sgff - ZTR Trace Codec Tests
// =============================================================================

#include "sgff/format/trace_codec.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <string_view>
#include <vector>

#include "sgff/common/error.h"
#include "sgff/format/sgff_format.h"
#include "sgff/io/byte_io.h"
#include "sgff/io/compression.h"

namespace sgff::format::test {

namespace {

/// @brief Wrap a chunk body (without selector) in zlib framing.
ByteBuffer zlibFramed(ByteSpan body) {
    ByteBuffer framed{kZtrZlib, 0, 0, 0, 0};
    const ByteBuffer deflated = io::zlibDeflate(body, 6);
    framed.insert(framed.end(), deflated.begin(), deflated.end());
    return framed;
}

ByteBuffer rawFramed(ByteSpan body) {
    ByteBuffer framed{kZtrRaw};
    framed.insert(framed.end(), body.begin(), body.end());
    return framed;
}

struct ChunkBody {
    std::string type;
    ByteBuffer metadata;
    ByteBuffer data;
};

ByteBuffer ztrStream(const std::vector<ChunkBody>& chunks, std::uint16_t version = 0x0102) {
    io::ByteWriter writer;
    writer.writeBytes(kZtrMagic);
    writer.writeU16(version);
    for (const auto& chunk : chunks) {
        writer.writeBytes(chunk.type);
        writer.writeLengthPrefixed(chunk.metadata);
        writer.writeLengthPrefixed(chunk.data);
    }
    return writer.release();
}

/// @brief Bodies (after the selector) for every typed chunk.
std::vector<ChunkBody> sampleBodies() {
    return {
        {"BASE", {}, {'A', 'C', 'G', 'T', 'N'}},
        {"BPOS", {}, {0, 0, 0, 0, 0, 0, 10, 0, 0, 0, 20}},
        {"CNF4", {}, {40, 38, 12}},
        {"SMP4", {}, {0, 0, 1, 0, 2, 0, 3, 0, 4, 0, 5, 0, 6, 0, 7, 0, 8}},
        {"SAMP", {'G', 0, 0, 0}, {0, 0x01, 0x00, 0x02, 0x00}},
        {"TEXT", {}, {'N', 'A', 'M', 'E', 0, 'r', '1', 0, 0}},
        {"CLIP", {}, {0, 0, 0, 5, 0, 0, 1, 0}},
        {"COMM", {}, {'o', 'k'}},
    };
}

}  // namespace

// =============================================================================
// Compression Normalization
// =============================================================================

TEST(TraceChunkTest, ZlibFramingDecodesLikeRawFraming) {
    for (const auto& body : sampleBodies()) {
        SCOPED_TRACE(body.type);
        const ChunkPayload fromRaw =
            decodeChunkPayload(body.type, body.metadata, normalizeChunkData(rawFramed(body.data)));
        const ChunkPayload fromZlib = decodeChunkPayload(body.type, body.metadata,
                                                         normalizeChunkData(zlibFramed(body.data)));
        EXPECT_EQ(fromRaw, fromZlib);
    }
}

RC_GTEST_PROP(TraceChunkProperty, ZlibNormalizationPrependsRawSelector,
              (const std::vector<std::uint8_t>& body)) {
    const ByteBuffer normalized = normalizeChunkData(zlibFramed(body));
    RC_ASSERT(normalized == rawFramed(body));
}

TEST(TraceChunkTest, UnknownSelectorIsRejected) {
    const ByteBuffer data{0x01, 'A', 'C'};
    try {
        (void)normalizeChunkData(data);
        FAIL() << "expected UnsupportedTraceCompressionError";
    } catch (const UnsupportedTraceCompressionError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kUnsupportedTraceCompression);
    }
}

TEST(TraceChunkTest, EmptyOrShortDataIsTruncated) {
    EXPECT_THROW((void)normalizeChunkData(ByteSpan{}), TruncatedBlockError);
    const ByteBuffer shortZlib{kZtrZlib, 0, 0};
    EXPECT_THROW((void)normalizeChunkData(shortZlib), TruncatedBlockError);
}

// =============================================================================
// Typed Payloads
// =============================================================================

TEST(TraceChunkTest, TypedPayloads) {
    const auto bodies = sampleBodies();
    auto decode = [&](std::size_t i) {
        return decodeChunkPayload(bodies[i].type, bodies[i].metadata, rawFramed(bodies[i].data));
    };

    EXPECT_EQ(std::get<BaseCalls>(decode(0)).bases, "ACGTN");
    EXPECT_EQ(std::get<BasePositions>(decode(1)).positions, (std::vector<std::uint32_t>{10, 20}));
    EXPECT_EQ(std::get<Confidence>(decode(2)).values, (std::vector<std::uint8_t>{40, 38, 12}));

    const auto smp4 = std::get<FourChannelSamples>(decode(3));
    EXPECT_EQ(smp4.a(), (std::vector<std::uint16_t>{1, 5}));
    EXPECT_EQ(smp4.c(), (std::vector<std::uint16_t>{2, 6}));
    EXPECT_EQ(smp4.g(), (std::vector<std::uint16_t>{3, 7}));
    EXPECT_EQ(smp4.t(), (std::vector<std::uint16_t>{4, 8}));

    const auto samp = std::get<ChannelSamples>(decode(4));
    EXPECT_EQ(samp.channel, 'G');
    EXPECT_EQ(samp.samples, (std::vector<std::uint16_t>{0x0100, 0x0200}));

    const auto text = std::get<TextFields>(decode(5));
    ASSERT_NE(text.find("NAME"), nullptr);
    EXPECT_EQ(*text.find("NAME"), "r1");
    EXPECT_TRUE(text.terminated);

    const auto clip = std::get<ClipRange>(decode(6));
    EXPECT_EQ(clip.left, 5u);
    EXPECT_EQ(clip.right, 256u);

    EXPECT_EQ(std::get<Comment>(decode(7)).text, "ok");
}

TEST(TraceChunkTest, EncodeInvertsDecode) {
    for (const auto& body : sampleBodies()) {
        SCOPED_TRACE(body.type);
        const ByteBuffer normalized = rawFramed(body.data);
        EXPECT_EQ(encodeChunkPayload(decodeChunkPayload(body.type, body.metadata, normalized)),
                  normalized);
    }
}

TEST(TraceChunkTest, IrregularTextListsAreKeptVerbatim) {
    const std::vector<ByteBuffer> bodies{
        {'K', 0, 'V'},                              // last value without NUL
        {'K', 0},                                   // key without value
        {'A', 0, '1', 0, 0, 'x', 'y', 0},           // bytes after the terminator
        {0, 0xFF},                                  // empty list, then bytes
    };
    for (const auto& body : bodies) {
        const ByteBuffer normalized = rawFramed(body);
        const ChunkPayload payload = decodeChunkPayload(chunk::kText, {}, normalized);
        EXPECT_EQ(encodeChunkPayload(payload), normalized);
    }

    const auto openEnded =
        std::get<TextFields>(decodeChunkPayload(chunk::kText, {}, rawFramed(bodies[0])));
    EXPECT_TRUE(openEnded.lastValueUnterminated);
    EXPECT_FALSE(openEnded.terminated);
    ASSERT_NE(openEnded.find("K"), nullptr);
    EXPECT_EQ(*openEnded.find("K"), "V");

    const auto tail =
        std::get<TextFields>(decodeChunkPayload(chunk::kText, {}, rawFramed(bodies[2])));
    EXPECT_TRUE(tail.terminated);
    EXPECT_EQ(tail.entries.size(), 1u);
    EXPECT_EQ(tail.trailing, (ByteBuffer{'x', 'y', 0}));
}

TEST(TraceChunkTest, ContradictoryTextListFailsToEncode) {
    TextFields fields;
    fields.entries.emplace_back("K", "V");
    fields.lastValueUnterminated = true;
    fields.terminated = true;
    EXPECT_THROW((void)encodeChunkPayload(fields), SerializeError);

    TextFields dangling;
    dangling.trailing = {'x'};
    EXPECT_THROW((void)encodeChunkPayload(dangling), SerializeError);
}

TEST(TraceChunkTest, MalformedSizesAreFormatErrors) {
    const ByteBuffer bpos{kZtrRaw, 0, 0, 0, 1, 2};
    EXPECT_THROW((void)decodeChunkPayload(chunk::kBpos, {}, bpos), FormatError);

    const ByteBuffer clip{kZtrRaw, 1, 2, 3};
    EXPECT_THROW((void)decodeChunkPayload(chunk::kClip, {}, clip), FormatError);
}

TEST(TraceChunkTest, UnevenChannelsFailToEncode) {
    FourChannelSamples samples;
    samples.channels[0] = {1, 2};
    samples.channels[1] = {1};
    samples.channels[2] = {1, 2};
    samples.channels[3] = {1, 2};
    EXPECT_THROW((void)encodeChunkPayload(samples), SerializeError);
}

// =============================================================================
// Trace Stream
// =============================================================================

TEST(TraceTest, InvalidMagicIsRejected) {
    ByteBuffer stream = ztrStream({});
    stream[1] = 'X';
    EXPECT_THROW((void)decodeTrace(stream), InvalidMagicError);
    EXPECT_THROW((void)decodeTrace(ByteBuffer{0xAE, 'Z'}), InvalidMagicError);
}

TEST(TraceTest, DecodesMixedFramingAndReencodesExactly) {
    const auto bodies = sampleBodies();
    std::vector<ChunkBody> chunks;
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        chunks.push_back({bodies[i].type, bodies[i].metadata,
                          i % 2 == 0 ? rawFramed(bodies[i].data) : zlibFramed(bodies[i].data)});
    }
    const ByteBuffer stream = ztrStream(chunks, 0x0103);

    const Trace trace = decodeTrace(stream);
    EXPECT_EQ(trace.version, 0x0103);
    EXPECT_EQ(trace.chunks.size(), bodies.size());
    EXPECT_EQ(trace.bases(), "ACGTN");
    EXPECT_EQ(trace.samples('C'), (std::vector<std::uint16_t>{2, 6}));
    EXPECT_EQ(trace.text("NAME"), std::optional<std::string>("r1"));
    EXPECT_EQ(trace.comments(), (std::vector<std::string>{"ok"}));

    EXPECT_EQ(encodeTrace(trace), stream);
}

TEST(TraceTest, UnterminatedTextSurvivesUntouchedRoundTrip) {
    const ByteBuffer body{'N', 'A', 'M', 'E', 0, 'r', '1'};
    const ByteBuffer stream = ztrStream({{"TEXT", {}, zlibFramed(body)},
                                         {"TEXT", {}, rawFramed(ByteBuffer{0, 'z'})}});
    const Trace trace = decodeTrace(stream);
    EXPECT_EQ(trace.text("NAME"), std::optional<std::string>("r1"));
    EXPECT_EQ(encodeTrace(trace), stream);
}

TEST(TraceTest, EditedChunkIsReframed) {
    const ByteBuffer stream = ztrStream({{"BASE", {}, zlibFramed(io::asBytes("ACGT"))}});
    Trace trace = decodeTrace(stream);
    std::get<BaseCalls>(trace.chunks[0].payload).bases = "ACGA";

    SerializeOptions options;
    options.traceCompression = TraceCompression::kZlib;
    const Trace reread = decodeTrace(encodeTrace(trace, options));
    EXPECT_EQ(reread.bases(), "ACGA");
    EXPECT_EQ(reread.chunks[0].originalData[0], kZtrZlib);

    const Trace raw = decodeTrace(encodeTrace(trace));
    EXPECT_EQ(raw.chunks[0].originalData[0], kZtrRaw);
}

TEST(TraceTest, NewSampChunkGetsChannelMetadata) {
    Trace trace;
    trace.chunks.push_back(TraceChunk::make(chunk::kSamp, ChannelSamples{'T', {9, 8, 7}}));
    ASSERT_EQ(trace.chunks[0].metadata, (ByteBuffer{'T', 0, 0, 0}));

    const Trace reread = decodeTrace(encodeTrace(trace));
    EXPECT_EQ(reread.samples('T'), (std::vector<std::uint16_t>{9, 8, 7}));
}

TEST(TraceTest, TruncatedChunkIsReported) {
    ByteBuffer stream = ztrStream({{"COMM", {}, rawFramed(io::asBytes("hello"))}});
    stream.resize(stream.size() - 2);
    EXPECT_THROW((void)decodeTrace(stream), TruncatedBlockError);
}

}  // namespace sgff::format::test
