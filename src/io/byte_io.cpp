// =============================================================================
// sgff - Big-Endian Byte I/O Implementation
// =============================================================================

#include "sgff/io/byte_io.h"

#include <limits>

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::io {

// =============================================================================
// ByteReader Implementation
// =============================================================================

void ByteReader::require(std::size_t count, std::string_view what) const {
    if (count > remaining()) {
        throw TruncatedBlockError(
            fmt::format("{} needs {} bytes but only {} remain", what, count, remaining()),
            ErrorContext{}.withOffset(absoluteOffset()));
    }
}

std::uint8_t ByteReader::readU8() {
    require(1, "u8");
    return data_[pos_++];
}

std::uint16_t ByteReader::readU16() {
    require(2, "u16");
    const std::uint16_t value = loadU16BE(data_.data() + pos_);
    pos_ += 2;
    return value;
}

std::uint32_t ByteReader::readU32() {
    require(4, "u32");
    const std::uint32_t value = loadU32BE(data_.data() + pos_);
    pos_ += 4;
    return value;
}

ByteSpan ByteReader::readBytes(std::size_t count) {
    require(count, "byte range");
    ByteSpan out = data_.subspan(pos_, count);
    pos_ += count;
    return out;
}

ByteSpan ByteReader::readRemaining() noexcept {
    ByteSpan out = data_.subspan(pos_);
    pos_ = data_.size();
    return out;
}

void ByteReader::skip(std::size_t count) {
    require(count, "skip");
    pos_ += count;
}

// =============================================================================
// ByteWriter Implementation
// =============================================================================

void ByteWriter::writeU16(std::uint16_t value) {
    buffer_.push_back(static_cast<std::uint8_t>(value >> 8));
    buffer_.push_back(static_cast<std::uint8_t>(value));
}

void ByteWriter::writeU32(std::uint32_t value) {
    buffer_.push_back(static_cast<std::uint8_t>(value >> 24));
    buffer_.push_back(static_cast<std::uint8_t>(value >> 16));
    buffer_.push_back(static_cast<std::uint8_t>(value >> 8));
    buffer_.push_back(static_cast<std::uint8_t>(value));
}

void ByteWriter::writeBytes(ByteSpan bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::writeLengthPrefixed(ByteSpan bytes) {
    writeU32(checkedLength(bytes.size(), "length-prefixed field"));
    writeBytes(bytes);
}

std::uint32_t checkedLength(std::size_t size, std::string_view what) {
    if (size > std::numeric_limits<std::uint32_t>::max()) {
        throw SerializeError(fmt::format("{} of {} bytes does not fit a u32 length", what, size));
    }
    return static_cast<std::uint32_t>(size);
}

}  // namespace sgff::io
