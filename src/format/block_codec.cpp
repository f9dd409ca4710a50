// =============================================================================
// sgff - TLV Dispatcher and Block Codecs Implementation
// =============================================================================

#include "sgff/format/block_codec.h"

#include <array>
#include <exception>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "sgff/common/error.h"
#include "sgff/common/logger.h"
#include "sgff/io/compression.h"

namespace sgff::format {

namespace {

// =============================================================================
// Value Access
// =============================================================================

template <typename T>
const T& expectValue(const BlockValue& value, BlockTypeId type, std::string_view codec) {
    if (const auto* typed = std::get_if<T>(&value)) {
        return *typed;
    }
    throw SerializeError(fmt::format("block type {} holds a value the {} codec cannot encode",
                                     type, codec));
}

// =============================================================================
// Per-Type Adapters
// =============================================================================

BlockValue decodePlainSequenceBlock(ByteSpan payload, BlockTypeId type, const DecodeContext&) {
    return decodePlain(payload, kindForSequenceBlock(type));
}

ByteBuffer encodePlainSequenceBlock(const BlockValue& value, BlockTypeId type,
                                    const EncodeContext&) {
    return encodePlain(expectValue<Sequence>(value, type, "sequence"));
}

BlockValue decodeCompressedSequenceBlock(ByteSpan payload, BlockTypeId, const DecodeContext&) {
    return decodeCompressed(payload);
}

ByteBuffer encodeCompressedSequenceBlock(const BlockValue& value, BlockTypeId type,
                                         const EncodeContext&) {
    return encodeCompressed(expectValue<CompressedSequence>(value, type, "compressed sequence"));
}

BlockValue decodeMarkupBlock(ByteSpan payload, BlockTypeId, const DecodeContext&) {
    return MarkupBlock{io::toString(payload)};
}

ByteBuffer encodeMarkupBlock(const BlockValue& value, BlockTypeId type, const EncodeContext&) {
    const auto& markup = expectValue<MarkupBlock>(value, type, "markup");
    ByteSpan bytes = io::asBytes(markup.text);
    return ByteBuffer(bytes.begin(), bytes.end());
}

BlockValue decodeCompressedMarkupBlock(ByteSpan payload, BlockTypeId, const DecodeContext&) {
    return decodeCompressedMarkup(payload);
}

ByteBuffer encodeCompressedMarkupBlock(const BlockValue& value, BlockTypeId type,
                                       const EncodeContext& ctx) {
    return encodeCompressedMarkup(
        expectValue<CompressedMarkupBlock>(value, type, "compressed markup"), ctx);
}

BlockValue decodeHistoryEntryBlock(ByteSpan payload, BlockTypeId, const DecodeContext& ctx) {
    return decodeHistoryEntry(payload, ctx);
}

ByteBuffer encodeHistoryEntryBlock(const BlockValue& value, BlockTypeId type,
                                   const EncodeContext& ctx) {
    return encodeHistoryEntry(expectValue<HistoryEntry>(value, type, "history entry"), ctx);
}

BlockValue decodeTraceContainerBlock(ByteSpan payload, BlockTypeId, const DecodeContext& ctx) {
    return decodeTraceContainer(payload, ctx);
}

ByteBuffer encodeTraceContainerBlock(const BlockValue& value, BlockTypeId type,
                                     const EncodeContext& ctx) {
    return encodeTraceContainer(expectValue<TraceContainer>(value, type, "trace container"), ctx);
}

BlockValue decodeTraceBlock(ByteSpan payload, BlockTypeId, const DecodeContext&) {
    return decodeTrace(payload);
}

ByteBuffer encodeTraceBlock(const BlockValue& value, BlockTypeId type, const EncodeContext& ctx) {
    return encodeTrace(expectValue<Trace>(value, type, "trace"), ctx.options);
}

BlockValue decodeNestedContainerBlock(ByteSpan payload, BlockTypeId, const DecodeContext& ctx) {
    return decodeNestedContainer(payload, ctx);
}

ByteBuffer encodeNestedContainerBlock(const BlockValue& value, BlockTypeId type,
                                      const EncodeContext& ctx) {
    return encodeNestedContainer(expectValue<NestedContainer>(value, type, "nested container"),
                                 ctx);
}

constexpr BlockCodec kPlainSequenceCodec{"sequence", &decodePlainSequenceBlock,
                                         &encodePlainSequenceBlock};
constexpr BlockCodec kCompressedSequenceCodec{"compressed sequence",
                                              &decodeCompressedSequenceBlock,
                                              &encodeCompressedSequenceBlock};
constexpr BlockCodec kMarkupCodec{"markup", &decodeMarkupBlock, &encodeMarkupBlock};
constexpr BlockCodec kCompressedMarkupCodec{"compressed markup", &decodeCompressedMarkupBlock,
                                            &encodeCompressedMarkupBlock};
constexpr BlockCodec kHistoryEntryCodec{"history entry", &decodeHistoryEntryBlock,
                                        &encodeHistoryEntryBlock};
constexpr BlockCodec kTraceContainerCodec{"trace container", &decodeTraceContainerBlock,
                                          &encodeTraceContainerBlock};
constexpr BlockCodec kTraceCodec{"trace", &decodeTraceBlock, &encodeTraceBlock};
constexpr BlockCodec kNestedContainerCodec{"nested container", &decodeNestedContainerBlock,
                                           &encodeNestedContainerBlock};

using CodecTable = std::array<const BlockCodec*, 256>;

const CodecTable& codecTable() {
    static const CodecTable table = [] {
        CodecTable t{};
        t[block::kDnaSequence] = &kPlainSequenceCodec;
        t[block::kProteinSequence] = &kPlainSequenceCodec;
        t[block::kRnaSequence] = &kPlainSequenceCodec;
        t[block::kCompressedDna] = &kCompressedSequenceCodec;
        for (BlockTypeId type : {block::kPrimers, block::kNotes, block::kProperties,
                                 block::kFeatures, block::kEnzymeSets,
                                 block::kAlignableSequences, block::kEnzymeVisibilities}) {
            t[type] = &kMarkupCodec;
        }
        t[block::kHistoryTree] = &kCompressedMarkupCodec;
        t[block::kHistoryModifier] = &kCompressedMarkupCodec;
        t[block::kHistoryEntry] = &kHistoryEntryCodec;
        t[block::kTraceContainer] = &kTraceContainerCodec;
        t[block::kTrace] = &kTraceCodec;
        t[block::kHistoryContent] = &kNestedContainerCodec;
        return t;
    }();
    return table;
}

// =============================================================================
// Frame Decoding
// =============================================================================

/// @brief One TLV frame located in a stream.
struct Frame {
    BlockTypeId type = 0;
    std::uint64_t offset = 0;
    ByteSpan payload;
};

/// @brief Read the next frame.
/// @throws TruncatedBlockError with block type and offset attached.
Frame readFrame(io::ByteReader& reader, std::uint32_t depth) {
    Frame frame;
    frame.offset = reader.absoluteOffset();

    if (reader.remaining() < kBlockFrameSize) {
        throw TruncatedBlockError(
            fmt::format("block header needs {} bytes but only {} remain", kBlockFrameSize,
                        reader.remaining()),
            ErrorContext{}.withBlock(reader.readU8()).withOffset(frame.offset).withDepth(depth));
    }

    frame.type = reader.readU8();
    const std::uint32_t length = reader.readU32();
    if (length > reader.remaining()) {
        throw TruncatedBlockError(
            fmt::format("block declares {} payload bytes but only {} remain", length,
                        reader.remaining()),
            ErrorContext{}.withBlock(frame.type).withOffset(frame.offset).withDepth(depth));
    }
    frame.payload = reader.readBytes(length);
    return frame;
}

/// @brief Attribute an exception raised inside a block to that block.
/// @note Errors already naming a block come from a deeper stream and are kept.
void attributeToBlock(SGFFException& ex, const Frame& frame, std::uint32_t depth) {
    if (!ex.hasContext()) {
        ex.attachContext(
            ErrorContext{}.withBlock(frame.type).withOffset(frame.offset).withDepth(depth));
        return;
    }
    if (!ex.context()->blockType.has_value()) {
        ErrorContext context = *ex.context();
        context.withBlock(frame.type).withDepth(depth);
        if (!context.byteOffset.has_value()) {
            context.withOffset(frame.offset);
        }
        ex.attachContext(std::move(context));
    }
}

Block decodeFrame(const Frame& frame, const DecodeContext& ctx) {
    const BlockCodec* codec = findCodec(frame.type);
    if (codec == nullptr) {
        SGFF_LOG_WARNING("block type {} at offset {} (depth {}) is not recognized, keeping {} raw bytes",
                         frame.type, frame.offset, ctx.depth, frame.payload.size());
        return Block{frame.type, RawBlock{ByteBuffer(frame.payload.begin(), frame.payload.end())},
                     frame.offset};
    }

    try {
        Block decoded{frame.type,
                      codec->decode(frame.payload, frame.type,
                                    ctx.at(frame.offset + kBlockFrameSize)),
                      frame.offset};
        SGFF_LOG_DEBUG("decoded block type {} ({}) at offset {}: {} bytes, depth {}", frame.type,
                       codec->name, frame.offset, frame.payload.size(), ctx.depth);
        return decoded;
    } catch (SGFFException& ex) {
        attributeToBlock(ex, frame, ctx.depth);
        throw;
    }
}

BlockList parseSequential(ByteSpan data, const DecodeContext& ctx, std::uint64_t baseOffset) {
    BlockList blocks;
    io::ByteReader reader(data, baseOffset);
    while (!reader.atEnd()) {
        const Frame frame = readFrame(reader, ctx.depth);
        blocks.append(decodeFrame(frame, ctx));
    }
    return blocks;
}

/// @brief Locate every frame first, then decode them on TBB workers.
/// @note Blocks and the reported error match parseSequential.
BlockList parseParallel(ByteSpan data, const DecodeContext& ctx, std::uint64_t baseOffset) {
    std::vector<Frame> frames;
    std::exception_ptr framingError;
    io::ByteReader reader(data, baseOffset);
    try {
        while (!reader.atEnd()) {
            frames.push_back(readFrame(reader, ctx.depth));
        }
    } catch (const TruncatedBlockError&) {
        framingError = std::current_exception();
    }

    std::vector<std::optional<Block>> decoded(frames.size());
    std::vector<std::exception_ptr> errors(frames.size());

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, frames.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                          for (std::size_t i = range.begin(); i < range.end(); ++i) {
                              try {
                                  decoded[i].emplace(decodeFrame(frames[i], ctx));
                              } catch (...) {
                                  errors[i] = std::current_exception();
                              }
                          }
                      });

    BlockList blocks;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (errors[i]) {
            std::rethrow_exception(errors[i]);
        }
        blocks.append(std::move(*decoded[i]));
    }
    if (framingError) {
        std::rethrow_exception(framingError);
    }

    SGFF_LOG_DEBUG("decoded {} top-level blocks in parallel", blocks.size());
    return blocks;
}

}  // namespace

// =============================================================================
// Contexts
// =============================================================================

DecodeContext DecodeContext::nested() const {
    if (depth + 1 > options.maxNestingDepth) {
        throw NestingTooDeepError(fmt::format("nested stream at depth {} exceeds the limit of {}",
                                              depth + 1, options.maxNestingDepth));
    }
    return DecodeContext{options, depth + 1, 0};
}

// =============================================================================
// Dispatcher
// =============================================================================

const BlockCodec* findCodec(BlockTypeId type) noexcept {
    return codecTable()[type];
}

BlockList parseBlocks(ByteSpan data, const DecodeContext& ctx, std::uint64_t baseOffset) {
    if (ctx.options.parallelNestedDecode && ctx.depth == 0) {
        return parseParallel(data, ctx, baseOffset);
    }
    return parseSequential(data, ctx, baseOffset);
}

ByteBuffer encodeBlock(const Block& block, const EncodeContext& ctx) {
    if (const auto* raw = std::get_if<RawBlock>(&block.value)) {
        return raw->bytes;
    }

    const BlockCodec* codec = findCodec(block.type);
    if (codec == nullptr) {
        throw SerializeError(
            fmt::format("block type {} has no codec but holds a decoded value", block.type));
    }
    return codec->encode(block.value, block.type, ctx);
}

void writeBlocks(const BlockList& blocks, io::ByteWriter& writer, const EncodeContext& ctx) {
    for (const auto& block : blocks.blocks()) {
        const std::uint64_t offset = writer.size();
        try {
            ByteBuffer payload = encodeBlock(block, ctx);
            writer.writeU8(block.type);
            writer.writeLengthPrefixed(payload);
            SGFF_LOG_DEBUG("encoded block type {} at offset {}: {} bytes, depth {}", block.type,
                           offset, payload.size(), ctx.depth);
        } catch (SGFFException& ex) {
            if (!ex.hasContext()) {
                ex.attachContext(
                    ErrorContext{}.withBlock(block.type).withOffset(offset).withDepth(ctx.depth));
            }
            throw;
        }
    }
}

ByteBuffer serializeBlocks(const BlockList& blocks, const EncodeContext& ctx) {
    io::ByteWriter writer;
    writeBlocks(blocks, writer, ctx);
    return writer.release();
}

// =============================================================================
// Nested Container (type 30)
// =============================================================================

NestedContainer decodeNestedContainer(ByteSpan payload, const DecodeContext& ctx) {
    const DecodeContext inner = ctx.nested();
    const ByteBuffer stream = io::lzmaDecompress(payload);

    NestedContainer container;
    container.blocks = parseBlocks(stream, inner);
    container.originalCompressed.assign(payload.begin(), payload.end());
    container.originalDigest = io::digest(stream);
    return container;
}

ByteBuffer encodeNestedContainer(const NestedContainer& container, const EncodeContext& ctx) {
    ByteBuffer stream = serializeBlocks(*container.blocks, ctx.nested());

    if (ctx.options.reuseOriginalCompression && !container.originalCompressed.empty() &&
        io::digest(stream) == container.originalDigest) {
        SGFF_LOG_DEBUG("nested stream unchanged, reusing {} original compressed bytes",
                       container.originalCompressed.size());
        return container.originalCompressed;
    }

    SGFF_LOG_DEBUG("recompressing {}-byte nested stream (preset {})", stream.size(),
                   ctx.options.lzmaPreset);
    return io::lzmaCompress(stream, ctx.options.lzmaPreset);
}

// =============================================================================
// Compressed Markup (types 7, 29)
// =============================================================================

CompressedMarkupBlock decodeCompressedMarkup(ByteSpan payload) {
    const ByteBuffer text = io::lzmaDecompress(payload);

    CompressedMarkupBlock markup;
    markup.text = io::toString(text);
    markup.originalCompressed.assign(payload.begin(), payload.end());
    markup.originalDigest = io::digest(text);
    return markup;
}

ByteBuffer encodeCompressedMarkup(const CompressedMarkupBlock& markup, const EncodeContext& ctx) {
    ByteSpan text = io::asBytes(markup.text);

    if (ctx.options.reuseOriginalCompression && !markup.originalCompressed.empty() &&
        io::digest(text) == markup.originalDigest) {
        return markup.originalCompressed;
    }
    return io::lzmaCompress(text, ctx.options.lzmaPreset);
}

// =============================================================================
// History Entry (type 11)
// =============================================================================

HistoryEntry decodeHistoryEntry(ByteSpan payload, const DecodeContext& ctx) {
    io::ByteReader reader(payload, ctx.payloadOffset);

    HistoryEntry entry;
    entry.nodeIndex = reader.readU32();
    const std::uint8_t rawTag = reader.readU8();
    if (!isKnownHistoryTag(rawTag)) {
        throw UnknownSequenceTypeError(fmt::format("history entry {} has unknown sequence type {}",
                                                   entry.nodeIndex, rawTag));
    }
    entry.tag = static_cast<HistorySequenceTag>(rawTag);

    switch (entry.tag) {
        case HistorySequenceTag::kPlainDna:
        case HistorySequenceTag::kProtein:
        case HistorySequenceTag::kRna: {
            if (reader.remaining() < 4) {
                throw TruncatedSequenceError(fmt::format(
                    "history entry {} ends before its sequence length", entry.nodeIndex));
            }
            const std::uint32_t length = reader.readU32();
            if (length > reader.remaining()) {
                throw TruncatedSequenceError(fmt::format(
                    "history entry {} declares {} bases but only {} bytes remain",
                    entry.nodeIndex, length, reader.remaining()));
            }
            Sequence seq;
            seq.kind = kindForHistoryTag(entry.tag);
            seq.bases = io::toString(reader.readBytes(length));
            entry.sequence = std::move(seq);
            break;
        }
        case HistorySequenceTag::kCompressedDna: {
            if (reader.remaining() < 4) {
                throw TruncatedSequenceError(fmt::format(
                    "history entry {} ends before its compressed length", entry.nodeIndex));
            }
            ByteSpan rest = payload.subspan(reader.position());
            const std::uint64_t length = io::loadU32BE(rest.data());
            if (length > rest.size() - 4) {
                throw TruncatedSequenceError(fmt::format(
                    "history entry {} declares {} compressed bytes but only {} remain",
                    entry.nodeIndex, length, rest.size() - 4));
            }
            entry.sequence = decodeCompressed(reader.readBytes(static_cast<std::size_t>(length) + 4));
            break;
        }
        case HistorySequenceTag::kModifierOnly:
            break;
    }

    if (!reader.atEnd()) {
        const std::uint64_t infoOffset = reader.absoluteOffset();
        entry.nodeInfo = parseBlocks(reader.readRemaining(), ctx.nested(), infoOffset);
    }
    return entry;
}

ByteBuffer encodeHistoryEntry(const HistoryEntry& entry, const EncodeContext& ctx) {
    io::ByteWriter writer;
    writer.writeU32(entry.nodeIndex);
    writer.writeU8(static_cast<std::uint8_t>(entry.tag));

    switch (entry.tag) {
        case HistorySequenceTag::kPlainDna:
        case HistorySequenceTag::kProtein:
        case HistorySequenceTag::kRna: {
            const Sequence* seq = entry.plainSequence();
            if (seq == nullptr) {
                throw SerializeError(fmt::format("history entry {} is tagged {} but has no plain sequence",
                                                 entry.nodeIndex, historyTagToString(entry.tag)));
            }
            writer.writeLengthPrefixed(io::asBytes(seq->bases));
            break;
        }
        case HistorySequenceTag::kCompressedDna: {
            const CompressedSequence* seq = entry.compressedSequence();
            if (seq == nullptr) {
                throw SerializeError(fmt::format(
                    "history entry {} is tagged compressed but has no packed sequence",
                    entry.nodeIndex));
            }
            writer.writeBytes(encodeCompressed(*seq));
            break;
        }
        case HistorySequenceTag::kModifierOnly:
            if (!std::holds_alternative<std::monostate>(entry.sequence)) {
                throw SerializeError(fmt::format(
                    "history entry {} is modifier-only but carries a sequence", entry.nodeIndex));
            }
            break;
    }

    writeBlocks(*entry.nodeInfo, writer, ctx.nested());
    return writer.release();
}

// =============================================================================
// Trace Container (type 16)
// =============================================================================

TraceContainer decodeTraceContainer(ByteSpan payload, const DecodeContext& ctx) {
    io::ByteReader reader(payload, ctx.payloadOffset);

    TraceContainer container;
    container.direction = reader.readU32();
    const std::uint64_t nestedOffset = reader.absoluteOffset();
    container.blocks = parseBlocks(reader.readRemaining(), ctx.nested(), nestedOffset);

    if (container.trace() == nullptr) {
        throw MissingTraceError(fmt::format("trace container ({}) holds no type-{} trace block",
                                            container.isReverse() ? "reverse" : "forward",
                                            block::kTrace));
    }
    return container;
}

ByteBuffer encodeTraceContainer(const TraceContainer& container, const EncodeContext& ctx) {
    if (container.trace() == nullptr) {
        throw SerializeError("trace container holds no trace block");
    }

    io::ByteWriter writer;
    writer.writeU32(container.direction);
    writeBlocks(*container.blocks, writer, ctx.nested());
    return writer.release();
}

}  // namespace sgff::format
