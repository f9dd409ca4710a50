// =============================================================================
// sgff - Big-Endian Byte I/O
// =============================================================================
// Cursor-style reader and append-only writer for big-endian binary data.
//
// ByteReader never reads past its span: every read checks the remaining
// length first and throws TruncatedBlockError on underflow. Offsets reported
// in errors are absolute within the stream the reader was created for
// (baseOffset + position).
// =============================================================================

#ifndef SGFF_IO_BYTE_IO_H
#define SGFF_IO_BYTE_IO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "sgff/common/types.h"

namespace sgff::io {

// =============================================================================
// Free Helpers
// =============================================================================

/// @brief Load a big-endian u16 from two bytes.
[[nodiscard]] constexpr std::uint16_t loadU16BE(const std::uint8_t* p) noexcept {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(p[0]) << 8) | p[1]);
}

/// @brief Load a big-endian u32 from four bytes.
[[nodiscard]] constexpr std::uint32_t loadU32BE(const std::uint8_t* p) noexcept {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

/// @brief View a string as bytes.
[[nodiscard]] inline ByteSpan asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

/// @brief Copy bytes into a string.
[[nodiscard]] inline std::string toString(ByteSpan bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

// =============================================================================
// ByteReader
// =============================================================================

/// @brief Bounds-checked big-endian reader over a byte span.
class ByteReader {
public:
    /// @brief Construct over data.
    /// @param data Bytes to read; must outlive the reader.
    /// @param baseOffset Offset of data[0] within the enclosing stream.
    explicit ByteReader(ByteSpan data, std::uint64_t baseOffset = 0) noexcept
        : data_(data), baseOffset_(baseOffset) {}

    [[nodiscard]] std::uint8_t readU8();
    [[nodiscard]] std::uint16_t readU16();
    [[nodiscard]] std::uint32_t readU32();

    /// @brief Read count bytes as a view into the underlying span.
    [[nodiscard]] ByteSpan readBytes(std::size_t count);

    /// @brief Consume and return everything that is left.
    [[nodiscard]] ByteSpan readRemaining() noexcept;

    /// @brief Skip count bytes.
    void skip(std::size_t count);

    /// @brief Throw TruncatedBlockError unless count bytes remain.
    /// @param what Field name used in the error message.
    void require(std::size_t count, std::string_view what) const;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= data_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    /// @brief Offset of the cursor within the enclosing stream.
    [[nodiscard]] std::uint64_t absoluteOffset() const noexcept { return baseOffset_ + pos_; }

private:
    ByteSpan data_;
    std::uint64_t baseOffset_ = 0;
    std::size_t pos_ = 0;
};

// =============================================================================
// ByteWriter
// =============================================================================

/// @brief Append-only big-endian writer.
class ByteWriter {
public:
    ByteWriter() = default;

    /// @brief Reserve capacity for the expected output size.
    void reserve(std::size_t bytes) { buffer_.reserve(bytes); }

    void writeU8(std::uint8_t value) { buffer_.push_back(value); }
    void writeU16(std::uint16_t value);
    void writeU32(std::uint32_t value);
    void writeBytes(ByteSpan bytes);
    void writeBytes(std::string_view text) { writeBytes(asBytes(text)); }

    /// @brief Append count zero bytes.
    void writeZeros(std::size_t count) { buffer_.insert(buffer_.end(), count, 0); }

    /// @brief Append a u32 length prefix followed by the bytes.
    /// @throws SerializeError if bytes exceed the u32 range.
    void writeLengthPrefixed(ByteSpan bytes);

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }
    [[nodiscard]] const ByteBuffer& buffer() const noexcept { return buffer_; }

    /// @brief Move the accumulated bytes out of the writer.
    [[nodiscard]] ByteBuffer release() noexcept { return std::move(buffer_); }

private:
    ByteBuffer buffer_;
};

/// @brief Convert a size to a u32 length field.
/// @throws SerializeError if size exceeds the u32 range.
[[nodiscard]] std::uint32_t checkedLength(std::size_t size, std::string_view what);

}  // namespace sgff::io

#endif  // SGFF_IO_BYTE_IO_H
