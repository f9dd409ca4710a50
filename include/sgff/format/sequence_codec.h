// =============================================================================
// sgff - Sequence Block Codec
// =============================================================================
// Codecs for plain sequence blocks (types 0, 21, 32) and the 2-bit packed DNA
// block (type 1).
//
// Plain layout:      flags (1) | bases (N)
// Compressed layout: compressedLength (4) | baseCount (4) | opaque (14) |
//                    packed (ceil(baseCount * 2 / 8)) | trailing bytes
//
// 2-bit table: 00 -> G, 01 -> A, 10 -> T, 11 -> C, most significant pair first.
// =============================================================================

#ifndef SGFF_FORMAT_SEQUENCE_CODEC_H
#define SGFF_FORMAT_SEQUENCE_CODEC_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "sgff/common/types.h"
#include "sgff/format/sgff_format.h"

namespace sgff::format {

// =============================================================================
// Sequence
// =============================================================================

/// @brief Plain sequence with its property flags.
struct Sequence {
    /// @brief Residues in the alphabet of kind.
    std::string bases;

    SequenceKind kind = SequenceKind::kDNA;
    Topology topology = Topology::kLinear;
    Strandedness strandedness = Strandedness::kSingle;

    bool dam = false;
    bool dcm = false;
    bool ecoKI = false;

    /// @brief Flag bits 5-7, preserved verbatim.
    std::uint8_t unknownFlags = 0;

    /// @brief Compose the property-flag byte.
    [[nodiscard]] std::uint8_t flags() const noexcept;

    /// @brief Apply a property-flag byte.
    void applyFlags(std::uint8_t flags) noexcept;

    [[nodiscard]] std::size_t length() const noexcept { return bases.size(); }
    [[nodiscard]] bool isCircular() const noexcept { return topology == Topology::kCircular; }
    [[nodiscard]] bool isDoubleStranded() const noexcept {
        return strandedness == Strandedness::kDouble;
    }

    [[nodiscard]] bool operator==(const Sequence& other) const noexcept = default;
};

// =============================================================================
// CompressedSequence
// =============================================================================

/// @brief 2-bit packed DNA sequence.
/// @note Invariants: packed.size() == packedSize(baseCount) and
///       compressedLength == encodedSize() - 4.
struct CompressedSequence {
    /// @brief Stored compressed-length field (bytes following the field).
    std::uint32_t compressedLength = 0;

    /// @brief Number of bases encoded in packed.
    std::uint32_t baseCount = 0;

    /// @brief Undocumented field kept for round-tripping.
    std::array<std::uint8_t, kCompressedOpaqueSize> opaque{};

    /// @brief Packed 2-bit payload.
    ByteBuffer packed;

    /// @brief Bytes after the packed payload, kept verbatim.
    ByteBuffer trailing;

    /// @brief Unpack to ASCII bases.
    [[nodiscard]] std::string bases() const;

    /// @brief Check the packed-length invariant.
    [[nodiscard]] bool isConsistent() const noexcept {
        return packed.size() == packedSize(baseCount);
    }

    /// @brief Size of the encoded block.
    [[nodiscard]] std::size_t encodedSize() const noexcept {
        return kCompressedPrefixSize + packed.size() + trailing.size();
    }

    /// @brief True if compressedLength counts exactly the bytes after the field.
    [[nodiscard]] bool hasMatchingLengthField() const noexcept {
        return compressedLength == encodedSize() - 4;
    }

    /// @brief Recompute compressedLength after packed or trailing changed.
    /// @throws SerializeError if the encoded block would exceed 4 GiB.
    void updateLengthField();

    /// @brief Build from ASCII bases over {G, A, T, C}.
    /// @throws SerializeError for any other character.
    [[nodiscard]] static CompressedSequence fromBases(std::string_view bases);

    [[nodiscard]] bool operator==(const CompressedSequence& other) const noexcept = default;
};

// =============================================================================
// 2-bit Packing
// =============================================================================

/// @brief Pack bases four per byte, low bits of a partial byte left zero.
/// @throws SerializeError for characters outside {G, A, T, C} (case-insensitive).
[[nodiscard]] ByteBuffer packBases(std::string_view bases);

/// @brief Unpack count bases from packed data.
/// @pre packed.size() >= packedSize(count).
[[nodiscard]] std::string unpackBases(ByteSpan packed, std::size_t count);

// =============================================================================
// Block Codecs
// =============================================================================

/// @brief Decode a plain sequence block.
/// @throws TruncatedSequenceError if the flag byte is missing.
[[nodiscard]] Sequence decodePlain(ByteSpan payload, SequenceKind kind);

/// @brief Encode a plain sequence block.
[[nodiscard]] ByteBuffer encodePlain(const Sequence& sequence);

/// @brief Decode a compressed DNA block.
/// @throws TruncatedSequenceError if payload is shorter than the declared lengths.
[[nodiscard]] CompressedSequence decodeCompressed(ByteSpan payload);

/// @brief Encode a compressed DNA block.
/// @throws SerializeError if the packed length or the length field no longer
///         matches the payload.
[[nodiscard]] ByteBuffer encodeCompressed(const CompressedSequence& sequence);

}  // namespace sgff::format

#endif  // SGFF_FORMAT_SEQUENCE_CODEC_H
