// =============================================================================
// sgff - Compression Primitives
// =============================================================================
// One-shot wrappers over liblzma and zlib, plus the xxHash64 digest used to
// decide whether original compressed bytes can be reused on write.
//
// All functions operate on complete in-memory buffers. Failures throw
// DecompressionError / CompressionError.
// =============================================================================

#ifndef SGFF_IO_COMPRESSION_H
#define SGFF_IO_COMPRESSION_H

#include <cstdint>

#include "sgff/common/types.h"

namespace sgff::io {

/// @brief Decompress an .xz (or legacy .lzma) stream.
/// @throws DecompressionError on corrupt or truncated input.
[[nodiscard]] ByteBuffer lzmaDecompress(ByteSpan input);

/// @brief Compress into an .xz stream with a CRC64 check.
/// @param preset LZMA preset 0-9.
/// @throws CompressionError on encoder failure.
[[nodiscard]] ByteBuffer lzmaCompress(ByteSpan input, std::uint32_t preset);

/// @brief Inflate a zlib-wrapped deflate stream.
/// @throws DecompressionError on corrupt or truncated input.
[[nodiscard]] ByteBuffer zlibInflate(ByteSpan input);

/// @brief Deflate into a zlib-wrapped stream.
/// @param level zlib level 0-9.
/// @throws CompressionError on encoder failure.
[[nodiscard]] ByteBuffer zlibDeflate(ByteSpan input, int level);

/// @brief xxHash64 digest (seed 0).
[[nodiscard]] Checksum digest(ByteSpan input) noexcept;

}  // namespace sgff::io

#endif  // SGFF_IO_COMPRESSION_H
