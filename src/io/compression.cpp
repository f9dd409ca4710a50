// =============================================================================
// sgff - Compression Primitives Implementation
// =============================================================================

#include "sgff/io/compression.h"

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <lzma.h>
#include <xxhash.h>
#include <zlib.h>

#include "sgff/common/error.h"

namespace sgff::io {

namespace {

/// @brief Initial output capacity as a multiple of the input size.
constexpr std::size_t kInflateGrowthFactor = 4;

/// @brief Minimum output chunk for streaming decoders.
constexpr std::size_t kMinOutputChunk = 4096;

const char* lzmaErrorString(lzma_ret ret) {
    switch (ret) {
        case LZMA_MEM_ERROR:
            return "out of memory";
        case LZMA_MEMLIMIT_ERROR:
            return "memory limit reached";
        case LZMA_FORMAT_ERROR:
            return "not an xz/lzma stream";
        case LZMA_OPTIONS_ERROR:
            return "unsupported options";
        case LZMA_DATA_ERROR:
            return "corrupt data";
        case LZMA_BUF_ERROR:
            return "truncated input";
        case LZMA_UNSUPPORTED_CHECK:
            return "unsupported integrity check";
        default:
            return "internal error";
    }
}

/// @brief Releases an lzma_stream on scope exit.
class LzmaStreamGuard {
public:
    explicit LzmaStreamGuard(lzma_stream& stream) noexcept : stream_(stream) {}
    ~LzmaStreamGuard() { lzma_end(&stream_); }

    LzmaStreamGuard(const LzmaStreamGuard&) = delete;
    LzmaStreamGuard& operator=(const LzmaStreamGuard&) = delete;

private:
    lzma_stream& stream_;
};

/// @brief Releases a z_stream opened with inflateInit on scope exit.
class InflateGuard {
public:
    explicit InflateGuard(z_stream& stream) noexcept : stream_(stream) {}
    ~InflateGuard() { inflateEnd(&stream_); }

    InflateGuard(const InflateGuard&) = delete;
    InflateGuard& operator=(const InflateGuard&) = delete;

private:
    z_stream& stream_;
};

}  // namespace

// =============================================================================
// LZMA
// =============================================================================

ByteBuffer lzmaDecompress(ByteSpan input) {
    lzma_stream stream = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_auto_decoder(&stream, std::numeric_limits<std::uint64_t>::max(),
                                     LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        throw DecompressionError(
            fmt::format("failed to initialize LZMA decoder: {}", lzmaErrorString(ret)));
    }
    LzmaStreamGuard guard(stream);

    ByteBuffer output(std::max(input.size() * kInflateGrowthFactor, kMinOutputChunk));
    stream.next_in = input.data();
    stream.avail_in = input.size();
    stream.next_out = output.data();
    stream.avail_out = output.size();

    while (true) {
        ret = lzma_code(&stream, LZMA_FINISH);
        if (ret == LZMA_STREAM_END) {
            break;
        }
        if (ret != LZMA_OK) {
            throw DecompressionError(fmt::format("LZMA decompression failed after {} input bytes: {}",
                                                 stream.total_in, lzmaErrorString(ret)));
        }
        if (stream.avail_out == 0) {
            const std::size_t used = output.size();
            output.resize(used * 2);
            stream.next_out = output.data() + used;
            stream.avail_out = output.size() - used;
        }
    }

    output.resize(static_cast<std::size_t>(stream.total_out));
    return output;
}

ByteBuffer lzmaCompress(ByteSpan input, std::uint32_t preset) {
    ByteBuffer output(lzma_stream_buffer_bound(input.size()));
    std::size_t outPos = 0;

    const lzma_ret ret = lzma_easy_buffer_encode(preset, LZMA_CHECK_CRC64, nullptr, input.data(),
                                                 input.size(), output.data(), &outPos,
                                                 output.size());
    if (ret != LZMA_OK) {
        throw CompressionError(
            fmt::format("LZMA compression (preset {}) failed: {}", preset, lzmaErrorString(ret)));
    }

    output.resize(outPos);
    return output;
}

// =============================================================================
// zlib
// =============================================================================

ByteBuffer zlibInflate(ByteSpan input) {
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw DecompressionError("zlib input exceeds the 4 GiB stream limit");
    }

    z_stream stream{};
    int ret = inflateInit(&stream);
    if (ret != Z_OK) {
        throw DecompressionError(fmt::format("failed to initialize zlib: error {}", ret));
    }
    InflateGuard guard(stream);

    ByteBuffer output(std::max(input.size() * kInflateGrowthFactor, kMinOutputChunk));
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    std::size_t produced = 0;
    while (true) {
        if (produced == output.size()) {
            output.resize(output.size() * 2);
        }
        const std::size_t room =
            std::min<std::size_t>(output.size() - produced, std::numeric_limits<uInt>::max());
        stream.next_out = output.data() + produced;
        stream.avail_out = static_cast<uInt>(room);

        ret = inflate(&stream, Z_NO_FLUSH);
        produced += room - stream.avail_out;

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) {
            throw DecompressionError("zlib stream is truncated");
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw DecompressionError(fmt::format("zlib inflate failed: {}",
                                                 stream.msg != nullptr ? stream.msg : "error"));
        }
    }

    output.resize(produced);
    return output;
}

ByteBuffer zlibDeflate(ByteSpan input, int level) {
    uLongf destLen = compressBound(static_cast<uLong>(input.size()));
    ByteBuffer output(destLen);

    const int ret = compress2(output.data(), &destLen, input.data(),
                              static_cast<uLong>(input.size()), level);
    if (ret != Z_OK) {
        throw CompressionError(fmt::format("zlib deflate (level {}) failed: error {}", level, ret));
    }

    output.resize(destLen);
    return output;
}

// =============================================================================
// Digest
// =============================================================================

Checksum digest(ByteSpan input) noexcept {
    return XXH64(input.data(), input.size(), 0);
}

}  // namespace sgff::io
