// =============================================================================
// sgff - ZTR Trace Codec Implementation
// =============================================================================

#include "sgff/format/trace_codec.h"

#include <algorithm>
#include <cstring>
#include <type_traits>

#include <fmt/format.h>

#include "sgff/common/error.h"
#include "sgff/common/logger.h"
#include "sgff/format/sgff_format.h"
#include "sgff/io/byte_io.h"
#include "sgff/io/compression.h"

namespace sgff::format {

namespace {

/// @brief Channel letter to SMP4 channel index.
int channelIndex(char channel) noexcept {
    switch (channel) {
        case 'A':
        case 'a':
            return 0;
        case 'C':
        case 'c':
            return 1;
        case 'G':
        case 'g':
            return 2;
        case 'T':
        case 't':
            return 3;
        default:
            return -1;
    }
}

[[noreturn]] void throwMalformed(std::string_view type, std::string_view detail) {
    throw FormatError(fmt::format("malformed {} chunk: {}", type, detail));
}

std::vector<std::uint16_t> readU16Array(ByteSpan bytes) {
    std::vector<std::uint16_t> values(bytes.size() / 2);
    for (std::size_t i = 0; i < values.size(); ++i) {
        values[i] = io::loadU16BE(bytes.data() + 2 * i);
    }
    return values;
}

TextFields decodeText(ByteSpan body) {
    TextFields fields;
    const auto* begin = reinterpret_cast<const char*>(body.data());
    std::size_t pos = 0;

    auto readString = [&](bool requireTerminator) -> std::string {
        const auto* start = begin + pos;
        const auto* nul = static_cast<const char*>(std::memchr(start, 0, body.size() - pos));
        if (nul == nullptr) {
            if (requireTerminator) {
                throwMalformed(chunk::kText, "key is not NUL-terminated");
            }
            fields.lastValueUnterminated = true;
            pos = body.size();
            return {start, static_cast<std::size_t>(begin + body.size() - start)};
        }
        pos = static_cast<std::size_t>(nul - begin) + 1;
        return {start, static_cast<std::size_t>(nul - start)};
    };

    while (pos < body.size()) {
        if (body[pos] == 0) {
            fields.terminated = true;
            ByteSpan rest = body.subspan(pos + 1);
            fields.trailing.assign(rest.begin(), rest.end());
            break;
        }
        std::string key = readString(true);
        std::string value;
        if (pos < body.size()) {
            value = readString(false);
        } else {
            fields.lastValueUnterminated = true;
        }
        fields.entries.emplace_back(std::move(key), std::move(value));
    }
    return fields;
}

ByteBuffer sampMetadata(char channel) {
    return {static_cast<std::uint8_t>(channel), 0, 0, 0};
}

}  // namespace

// =============================================================================
// Payload Accessors
// =============================================================================

const std::string* TextFields::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : entries) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

TraceChunk TraceChunk::make(std::string_view type, ChunkPayload payload, ByteBuffer metadata) {
    TraceChunk chunk;
    if (type.size() != chunk.type.size()) {
        throw UsageError(fmt::format("chunk type '{}' is not four characters", type));
    }
    std::copy(type.begin(), type.end(), chunk.type.begin());
    if (metadata.empty()) {
        if (const auto* samp = std::get_if<ChannelSamples>(&payload)) {
            metadata = sampMetadata(samp->channel);
        }
    }
    chunk.metadata = std::move(metadata);
    chunk.payload = std::move(payload);
    return chunk;
}

std::string_view Trace::bases() const noexcept {
    const auto* calls = find<BaseCalls>();
    return calls != nullptr ? std::string_view(calls->bases) : std::string_view{};
}

std::vector<std::uint16_t> Trace::samples(char channel) const {
    const int index = channelIndex(channel);
    if (index < 0) {
        return {};
    }
    if (const auto* smp4 = find<FourChannelSamples>()) {
        return smp4->channels[static_cast<std::size_t>(index)];
    }
    for (const auto& chunk : chunks) {
        const auto* samp = std::get_if<ChannelSamples>(&chunk.payload);
        if (samp != nullptr && channelIndex(samp->channel) == index) {
            return samp->samples;
        }
    }
    return {};
}

std::optional<std::string> Trace::text(std::string_view key) const {
    for (const auto& chunk : chunks) {
        if (const auto* fields = std::get_if<TextFields>(&chunk.payload)) {
            if (const auto* value = fields->find(key)) {
                return *value;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> Trace::comments() const {
    std::vector<std::string> out;
    for (const auto& chunk : chunks) {
        if (const auto* comment = std::get_if<Comment>(&chunk.payload)) {
            out.push_back(comment->text);
        }
    }
    return out;
}

// =============================================================================
// Chunk Data Framing
// =============================================================================

ByteBuffer normalizeChunkData(ByteSpan data) {
    if (data.empty()) {
        throw TruncatedBlockError("chunk data has no compression selector");
    }

    switch (data[0]) {
        case kZtrRaw:
            return ByteBuffer(data.begin(), data.end());
        case kZtrZlib: {
            if (data.size() < kZtrZlibHeaderSize) {
                throw TruncatedBlockError(fmt::format(
                    "zlib chunk needs a {}-byte header, got {} bytes", kZtrZlibHeaderSize,
                    data.size()));
            }
            ByteBuffer body = io::zlibInflate(data.subspan(kZtrZlibHeaderSize));
            ByteBuffer normalized;
            normalized.reserve(body.size() + 1);
            normalized.push_back(kZtrRaw);
            normalized.insert(normalized.end(), body.begin(), body.end());
            return normalized;
        }
        default:
            throw UnsupportedTraceCompressionError(data[0]);
    }
}

ByteBuffer frameChunkData(ByteSpan normalized, TraceCompression compression, int zlibLevel) {
    if (compression == TraceCompression::kRaw || normalized.empty()) {
        return ByteBuffer(normalized.begin(), normalized.end());
    }

    ByteSpan body = normalized.subspan(1);
    ByteBuffer deflated = io::zlibDeflate(body, zlibLevel);
    const std::uint32_t size = io::checkedLength(body.size(), "trace chunk body");

    // ZTR stores the inflated size little-endian.
    ByteBuffer framed;
    framed.reserve(deflated.size() + kZtrZlibHeaderSize);
    framed.push_back(kZtrZlib);
    for (unsigned shift = 0; shift < 32; shift += 8) {
        framed.push_back(static_cast<std::uint8_t>(size >> shift));
    }
    framed.insert(framed.end(), deflated.begin(), deflated.end());
    return framed;
}

// =============================================================================
// Chunk Payloads
// =============================================================================

ChunkPayload decodeChunkPayload(std::string_view type, ByteSpan metadata, ByteSpan normalized) {
    ByteSpan body = normalized.empty() ? normalized : normalized.subspan(1);

    if (type == chunk::kBase) {
        return BaseCalls{io::toString(body)};
    }

    if (type == chunk::kBpos) {
        if (body.size() < kBposPadding || (body.size() - kBposPadding) % 4 != 0) {
            throwMalformed(type, fmt::format("{} body bytes is not 3 + 4n", body.size()));
        }
        BasePositions out;
        ByteSpan values = body.subspan(kBposPadding);
        out.positions.resize(values.size() / 4);
        for (std::size_t i = 0; i < out.positions.size(); ++i) {
            out.positions[i] = io::loadU32BE(values.data() + 4 * i);
        }
        return out;
    }

    if (type == chunk::kCnf4) {
        return Confidence{std::vector<std::uint8_t>(body.begin(), body.end())};
    }

    if (type == chunk::kSmp4) {
        if (body.size() < kSamplePadding || (body.size() - kSamplePadding) % 8 != 0) {
            throwMalformed(type, fmt::format("{} body bytes is not 1 + 8n", body.size()));
        }
        const std::vector<std::uint16_t> interleaved = readU16Array(body.subspan(kSamplePadding));
        FourChannelSamples out;
        for (auto& channel : out.channels) {
            channel.reserve(interleaved.size() / 4);
        }
        for (std::size_t i = 0; i < interleaved.size(); ++i) {
            out.channels[i % 4].push_back(interleaved[i]);
        }
        return out;
    }

    if (type == chunk::kSamp) {
        if (metadata.empty()) {
            throwMalformed(type, "missing channel metadata");
        }
        if (body.size() < kSamplePadding || (body.size() - kSamplePadding) % 2 != 0) {
            throwMalformed(type, fmt::format("{} body bytes is not 1 + 2n", body.size()));
        }
        return ChannelSamples{static_cast<char>(metadata[0]),
                              readU16Array(body.subspan(kSamplePadding))};
    }

    if (type == chunk::kText) {
        return decodeText(body);
    }

    if (type == chunk::kClip) {
        if (body.size() != 8) {
            throwMalformed(type, fmt::format("expected 8 body bytes, got {}", body.size()));
        }
        return ClipRange{io::loadU32BE(body.data()), io::loadU32BE(body.data() + 4)};
    }

    if (type == chunk::kComm) {
        return Comment{io::toString(body)};
    }

    return OpaqueChunk{ByteBuffer(body.begin(), body.end())};
}

ByteBuffer encodeChunkPayload(const ChunkPayload& payload) {
    io::ByteWriter writer;
    writer.writeU8(kZtrRaw);

    std::visit(
        [&writer](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, BaseCalls>) {
                writer.writeBytes(value.bases);
            } else if constexpr (std::is_same_v<T, BasePositions>) {
                writer.writeZeros(kBposPadding);
                for (std::uint32_t pos : value.positions) {
                    writer.writeU32(pos);
                }
            } else if constexpr (std::is_same_v<T, Confidence>) {
                writer.writeBytes(value.values);
            } else if constexpr (std::is_same_v<T, FourChannelSamples>) {
                const std::size_t count = value.channels[0].size();
                for (const auto& channel : value.channels) {
                    if (channel.size() != count) {
                        throw SerializeError("SMP4 channels have different sample counts");
                    }
                }
                writer.writeZeros(kSamplePadding);
                for (std::size_t i = 0; i < count; ++i) {
                    for (const auto& channel : value.channels) {
                        writer.writeU16(channel[i]);
                    }
                }
            } else if constexpr (std::is_same_v<T, ChannelSamples>) {
                writer.writeZeros(kSamplePadding);
                for (std::uint16_t sample : value.samples) {
                    writer.writeU16(sample);
                }
            } else if constexpr (std::is_same_v<T, TextFields>) {
                const bool openEnded = value.lastValueUnterminated && !value.entries.empty();
                if (openEnded && value.terminated) {
                    throw SerializeError("TEXT list cannot end both open and terminated");
                }
                if (!value.trailing.empty() && !value.terminated) {
                    throw SerializeError("TEXT bytes after the list need a terminator");
                }
                for (std::size_t i = 0; i < value.entries.size(); ++i) {
                    const auto& [key, text] = value.entries[i];
                    if (key.empty() || key.find('\0') != std::string::npos ||
                        text.find('\0') != std::string::npos) {
                        throw SerializeError(
                            fmt::format("TEXT entry '{}' cannot be NUL-delimited", key));
                    }
                    writer.writeBytes(key);
                    writer.writeU8(0);
                    writer.writeBytes(text);
                    if (!openEnded || i + 1 < value.entries.size()) {
                        writer.writeU8(0);
                    }
                }
                if (value.terminated) {
                    writer.writeU8(0);
                    writer.writeBytes(value.trailing);
                }
            } else if constexpr (std::is_same_v<T, ClipRange>) {
                writer.writeU32(value.left);
                writer.writeU32(value.right);
            } else if constexpr (std::is_same_v<T, Comment>) {
                writer.writeBytes(value.text);
            } else {
                writer.writeBytes(value.body);
            }
        },
        payload);

    return writer.release();
}

// =============================================================================
// Trace Stream
// =============================================================================

Trace decodeTrace(ByteSpan payload) {
    if (payload.size() < kZtrMagic.size() ||
        !std::equal(kZtrMagic.begin(), kZtrMagic.end(), payload.begin())) {
        throw InvalidMagicError("trace payload does not start with the ZTR magic");
    }

    io::ByteReader reader(payload);
    reader.skip(kZtrMagic.size());

    Trace trace;
    trace.version = reader.readU16();

    while (!reader.atEnd()) {
        TraceChunk chunk;
        ByteSpan type = reader.readBytes(chunk.type.size());
        std::copy(type.begin(), type.end(), chunk.type.begin());

        const std::uint32_t metaLength = reader.readU32();
        ByteSpan metadata = reader.readBytes(metaLength);
        const std::uint32_t dataLength = reader.readU32();
        ByteSpan data = reader.readBytes(dataLength);

        const ByteBuffer normalized = normalizeChunkData(data);
        chunk.payload = decodeChunkPayload(chunk.typeName(), metadata, normalized);
        chunk.metadata.assign(metadata.begin(), metadata.end());
        chunk.originalData.assign(data.begin(), data.end());
        chunk.normalizedDigest = io::digest(normalized);

        SGFF_LOG_TRACE("ZTR chunk {} ({} data bytes, selector 0x{:02x})", chunk.typeName(),
                       dataLength, data[0]);
        trace.chunks.push_back(std::move(chunk));
    }

    return trace;
}

ByteBuffer encodeTrace(const Trace& trace, const SerializeOptions& options) {
    io::ByteWriter writer;
    writer.writeBytes(kZtrMagic);
    writer.writeU16(trace.version);

    for (const auto& chunk : trace.chunks) {
        writer.writeBytes(io::asBytes(chunk.typeName()));

        const auto* samp = std::get_if<ChannelSamples>(&chunk.payload);
        if (samp != nullptr &&
            (chunk.metadata.empty() || chunk.metadata[0] != static_cast<std::uint8_t>(samp->channel))) {
            writer.writeLengthPrefixed(sampMetadata(samp->channel));
        } else {
            writer.writeLengthPrefixed(chunk.metadata);
        }

        const ByteBuffer normalized = encodeChunkPayload(chunk.payload);
        if (options.reuseOriginalCompression && !chunk.originalData.empty() &&
            io::digest(normalized) == chunk.normalizedDigest) {
            writer.writeLengthPrefixed(chunk.originalData);
        } else {
            writer.writeLengthPrefixed(
                frameChunkData(normalized, options.traceCompression, options.zlibLevel));
        }
    }

    return writer.release();
}

}  // namespace sgff::format
