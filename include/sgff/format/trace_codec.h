// =============================================================================
// sgff - ZTR Trace Codec
// =============================================================================
// Codec for the ZTR chromatogram sub-format stored in block type 18.
//
// Stream layout:
//   magic (8) | version (2) | chunk*
//   chunk = type (4) | metaLength (4) | meta | dataLength (4) | data
//
// Chunk data begins with a compression selector. 0x00 means the rest is the
// literal body; 0x02 means bytes 1-4 are a size field and bytes 5.. a zlib
// stream whose inflated contents are the body. Decoding normalizes both forms
// to `0x00 + body` before the type-specific decoder runs.
//
// Typed bodies (after the selector byte):
//   BASE  ASCII base calls
//   BPOS  3 padding bytes, BE u32 per base
//   CNF4  u8 per value
//   SMP4  1 padding byte, BE u16 samples interleaved A, C, G, T
//   SAMP  1 padding byte, BE u16 samples; meta = channel letter + 3 NULs
//   TEXT  NUL-terminated key/value pairs
//   CLIP  BE u32 left, BE u32 right
//   COMM  ASCII text
// Other chunk types keep their normalized body verbatim.
// =============================================================================

#ifndef SGFF_FORMAT_TRACE_CODEC_H
#define SGFF_FORMAT_TRACE_CODEC_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sgff/common/config.h"
#include "sgff/common/types.h"

namespace sgff::format {

// =============================================================================
// Chunk Payloads
// =============================================================================

/// @brief BASE: called bases.
struct BaseCalls {
    std::string bases;
    [[nodiscard]] bool operator==(const BaseCalls&) const = default;
};

/// @brief BPOS: sample offset of each base.
struct BasePositions {
    std::vector<std::uint32_t> positions;
    [[nodiscard]] bool operator==(const BasePositions&) const = default;
};

/// @brief CNF4: confidence values.
struct Confidence {
    std::vector<std::uint8_t> values;
    [[nodiscard]] bool operator==(const Confidence&) const = default;
};

/// @brief SMP4: four-channel samples, channels ordered A, C, G, T.
struct FourChannelSamples {
    std::array<std::vector<std::uint16_t>, 4> channels;

    [[nodiscard]] const std::vector<std::uint16_t>& a() const noexcept { return channels[0]; }
    [[nodiscard]] const std::vector<std::uint16_t>& c() const noexcept { return channels[1]; }
    [[nodiscard]] const std::vector<std::uint16_t>& g() const noexcept { return channels[2]; }
    [[nodiscard]] const std::vector<std::uint16_t>& t() const noexcept { return channels[3]; }

    [[nodiscard]] bool operator==(const FourChannelSamples&) const = default;
};

/// @brief SAMP: samples of a single channel.
struct ChannelSamples {
    char channel = 'A';
    std::vector<std::uint16_t> samples;
    [[nodiscard]] bool operator==(const ChannelSamples&) const = default;
};

/// @brief TEXT: ordered key/value pairs.
struct TextFields {
    std::vector<std::pair<std::string, std::string>> entries;

    /// @brief The list ended with an empty-key terminator.
    bool terminated = false;

    /// @brief The chunk ended inside the last entry, with no NUL after its value.
    bool lastValueUnterminated = false;

    /// @brief Bytes after the empty-key terminator, kept verbatim.
    ByteBuffer trailing;

    [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

    [[nodiscard]] bool operator==(const TextFields&) const = default;
};

/// @brief CLIP: quality clip boundaries.
struct ClipRange {
    std::uint32_t left = 0;
    std::uint32_t right = 0;
    [[nodiscard]] bool operator==(const ClipRange&) const = default;
};

/// @brief COMM: free text comment.
struct Comment {
    std::string text;
    [[nodiscard]] bool operator==(const Comment&) const = default;
};

/// @brief Body of an unrecognized chunk type (without the selector byte).
struct OpaqueChunk {
    ByteBuffer body;
    [[nodiscard]] bool operator==(const OpaqueChunk&) const = default;
};

using ChunkPayload = std::variant<BaseCalls, BasePositions, Confidence, FourChannelSamples,
                                  ChannelSamples, TextFields, ClipRange, Comment, OpaqueChunk>;

// =============================================================================
// Trace
// =============================================================================

/// @brief One ZTR chunk.
struct TraceChunk {
    /// @brief Four-character chunk type.
    std::array<char, 4> type{};

    /// @brief Chunk metadata, verbatim.
    ByteBuffer metadata;

    /// @brief Decoded payload.
    ChunkPayload payload;

    /// @brief Chunk data exactly as read, empty for new chunks.
    ByteBuffer originalData;

    /// @brief Digest of the normalized data at decode time.
    Checksum normalizedDigest = 0;

    [[nodiscard]] std::string_view typeName() const noexcept { return {type.data(), type.size()}; }

    /// @brief Build a new chunk from a payload.
    [[nodiscard]] static TraceChunk make(std::string_view type, ChunkPayload payload,
                                         ByteBuffer metadata = {});
};

/// @brief Decoded ZTR trace.
struct Trace {
    /// @brief Version field, preserved opaquely.
    std::uint16_t version = 0x0102;

    std::vector<TraceChunk> chunks;

    /// @brief First chunk payload of type T.
    template <typename T>
    [[nodiscard]] const T* find() const noexcept {
        for (const auto& chunk : chunks) {
            if (const auto* p = std::get_if<T>(&chunk.payload)) {
                return p;
            }
        }
        return nullptr;
    }

    /// @brief Called bases, or empty.
    [[nodiscard]] std::string_view bases() const noexcept;

    /// @brief Number of called bases.
    [[nodiscard]] std::size_t length() const noexcept { return bases().size(); }

    /// @brief Samples of channel ('A', 'C', 'G', 'T'), from SMP4 or SAMP chunks.
    [[nodiscard]] std::vector<std::uint16_t> samples(char channel) const;

    /// @brief Value of a TEXT key.
    [[nodiscard]] std::optional<std::string> text(std::string_view key) const;

    /// @brief All comments in chunk order.
    [[nodiscard]] std::vector<std::string> comments() const;
};

// =============================================================================
// Codec
// =============================================================================

/// @brief Normalize chunk data to `0x00 + body`.
/// @throws UnsupportedTraceCompressionError for selectors other than 0x00/0x02.
/// @throws TruncatedBlockError if a zlib chunk is shorter than its header.
[[nodiscard]] ByteBuffer normalizeChunkData(ByteSpan data);

/// @brief Decode a chunk payload from normalized data.
[[nodiscard]] ChunkPayload decodeChunkPayload(std::string_view type, ByteSpan metadata,
                                              ByteSpan normalized);

/// @brief Encode a chunk payload to normalized data (`0x00 + body`).
[[nodiscard]] ByteBuffer encodeChunkPayload(const ChunkPayload& payload);

/// @brief Frame normalized data with the requested compression.
[[nodiscard]] ByteBuffer frameChunkData(ByteSpan normalized, TraceCompression compression,
                                        int zlibLevel);

/// @brief Decode a ZTR stream.
/// @throws InvalidMagicError if the magic bytes do not match.
[[nodiscard]] Trace decodeTrace(ByteSpan payload);

/// @brief Encode a ZTR stream.
[[nodiscard]] ByteBuffer encodeTrace(const Trace& trace, const SerializeOptions& options = {});

}  // namespace sgff::format

#endif  // SGFF_FORMAT_TRACE_CODEC_H
