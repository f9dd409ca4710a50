// =============================================================================
// sgff - TLV Dispatcher and Block Codecs
// =============================================================================
// Routes block payloads to per-type codecs and back.
//
// The codec table is a function-local static std::array<const BlockCodec*, 256>
// built once; an empty slot means the type is kept as RawBlock. A recognized
// type whose payload fails to decode is a hard error, never a raw fallback.
//
// Nested streams (types 11, 16, 30) are parsed with DecodeContext::nested(),
// which enforces ParseOptions::maxNestingDepth. Offsets inside types 11 and 16
// stay in the coordinates of the enclosing stream; offsets inside a type-30
// payload are relative to its decompressed stream.
// =============================================================================

#ifndef SGFF_FORMAT_BLOCK_CODEC_H
#define SGFF_FORMAT_BLOCK_CODEC_H

#include <cstdint>
#include <string_view>

#include "sgff/common/config.h"
#include "sgff/common/types.h"
#include "sgff/format/block_list.h"
#include "sgff/io/byte_io.h"

namespace sgff::format {

// =============================================================================
// Contexts
// =============================================================================

/// @brief State threaded through recursive decoding.
struct DecodeContext {
    const ParseOptions& options;

    /// @brief Nesting depth of the stream being decoded (0 = top level).
    std::uint32_t depth = 0;

    /// @brief Offset of the current payload within its stream.
    std::uint64_t payloadOffset = 0;

    /// @brief Context for a stream nested one level deeper.
    /// @throws NestingTooDeepError when the depth budget is exhausted.
    [[nodiscard]] DecodeContext nested() const;

    /// @brief Same depth, different payload offset.
    [[nodiscard]] DecodeContext at(std::uint64_t offset) const noexcept {
        return DecodeContext{options, depth, offset};
    }
};

/// @brief State threaded through encoding.
struct EncodeContext {
    const SerializeOptions& options;
    std::uint32_t depth = 0;

    [[nodiscard]] EncodeContext nested() const noexcept { return EncodeContext{options, depth + 1}; }
};

// =============================================================================
// Codec Table
// =============================================================================

using DecodeFn = BlockValue (*)(ByteSpan payload, BlockTypeId type, const DecodeContext& ctx);
using EncodeFn = ByteBuffer (*)(const BlockValue& value, BlockTypeId type,
                                const EncodeContext& ctx);

/// @brief Decoder/encoder pair for one family of block types.
struct BlockCodec {
    std::string_view name;
    DecodeFn decode;
    EncodeFn encode;
};

/// @brief Codec registered for a type, or nullptr for raw types.
[[nodiscard]] const BlockCodec* findCodec(BlockTypeId type) noexcept;

// =============================================================================
// Stream Parsing / Writing
// =============================================================================

/// @brief Parse a TLV stream.
/// @param baseOffset Offset of data[0] within its stream, used in errors.
/// @throws TruncatedBlockError if a frame or payload runs past the data.
[[nodiscard]] BlockList parseBlocks(ByteSpan data, const DecodeContext& ctx,
                                    std::uint64_t baseOffset = 0);

/// @brief Encode one block payload.
/// @throws SerializeError if the value does not fit its type's codec.
[[nodiscard]] ByteBuffer encodeBlock(const Block& block, const EncodeContext& ctx);

/// @brief Append the TLV encoding of every block in stored order.
void writeBlocks(const BlockList& blocks, io::ByteWriter& writer, const EncodeContext& ctx);

/// @brief Encode a BlockList into a TLV stream.
[[nodiscard]] ByteBuffer serializeBlocks(const BlockList& blocks, const EncodeContext& ctx);

// =============================================================================
// Container Codecs
// =============================================================================

/// @brief Decode a type-30 payload (LZMA + nested TLV).
[[nodiscard]] NestedContainer decodeNestedContainer(ByteSpan payload, const DecodeContext& ctx);

/// @brief Encode a type-30 payload.
[[nodiscard]] ByteBuffer encodeNestedContainer(const NestedContainer& container,
                                               const EncodeContext& ctx);

/// @brief Decode a type-11 payload.
/// @throws UnknownSequenceTypeError for unknown sequence tags.
[[nodiscard]] HistoryEntry decodeHistoryEntry(ByteSpan payload, const DecodeContext& ctx);

/// @brief Encode a type-11 payload.
[[nodiscard]] ByteBuffer encodeHistoryEntry(const HistoryEntry& entry, const EncodeContext& ctx);

/// @brief Decode a type-16 payload.
/// @throws MissingTraceError if the nested stream has no type-18 block.
[[nodiscard]] TraceContainer decodeTraceContainer(ByteSpan payload, const DecodeContext& ctx);

/// @brief Encode a type-16 payload.
[[nodiscard]] ByteBuffer encodeTraceContainer(const TraceContainer& container,
                                              const EncodeContext& ctx);

/// @brief Decode an LZMA-compressed markup payload (types 7, 29).
[[nodiscard]] CompressedMarkupBlock decodeCompressedMarkup(ByteSpan payload);

/// @brief Encode an LZMA-compressed markup payload.
[[nodiscard]] ByteBuffer encodeCompressedMarkup(const CompressedMarkupBlock& markup,
                                                const EncodeContext& ctx);

}  // namespace sgff::format

#endif  // SGFF_FORMAT_BLOCK_CODEC_H
