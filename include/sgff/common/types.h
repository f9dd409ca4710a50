// =============================================================================
// sgff - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codecs and the model accessors.
//
// This module defines:
// - ByteBuffer, ByteSpan: owning and non-owning byte storage
// - SequenceKind: molecule kind stored in the file header
// - Topology, Strandedness: plain-sequence properties
// - Strand: feature orientation
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SGFF_COMMON_TYPES_H
#define SGFF_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sgff {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owning byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Read-only view over bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief TLV block type identifier (0-255).
using BlockTypeId = std::uint8_t;

/// @brief Digest values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Sequence Kind Enumeration
// =============================================================================

/// @brief Molecule kind.
/// @note Stored as a big-endian u16 in the file header.
enum class SequenceKind : std::uint16_t {
    kDNA = 1,
    kRNA = 2,
    kProtein = 3
};

/// @brief Convert SequenceKind to string representation.
[[nodiscard]] constexpr std::string_view sequenceKindToString(SequenceKind kind) noexcept {
    switch (kind) {
        case SequenceKind::kDNA:
            return "DNA";
        case SequenceKind::kRNA:
            return "RNA";
        case SequenceKind::kProtein:
            return "protein";
    }
    return "unknown";
}

/// @brief Check whether a raw header value names a known kind.
[[nodiscard]] constexpr bool isValidSequenceKind(std::uint16_t value) noexcept {
    return value >= 1 && value <= 3;
}

// =============================================================================
// Topology / Strandedness
// =============================================================================

/// @brief Sequence topology.
enum class Topology : std::uint8_t {
    kLinear = 0,
    kCircular = 1
};

[[nodiscard]] constexpr std::string_view topologyToString(Topology topology) noexcept {
    return topology == Topology::kCircular ? "circular" : "linear";
}

/// @brief Sequence strandedness.
enum class Strandedness : std::uint8_t {
    kSingle = 0,
    kDouble = 1
};

[[nodiscard]] constexpr std::string_view strandednessToString(Strandedness s) noexcept {
    return s == Strandedness::kDouble ? "double" : "single";
}

// =============================================================================
// Feature Strand Enumeration
// =============================================================================

/// @brief Feature orientation.
/// @note Values match the `directionality` attribute of feature markup.
enum class Strand : std::uint8_t {
    kNone = 0,
    kForward = 1,
    kReverse = 2,
    kBoth = 3
};

/// @brief Convert Strand to its conventional symbol.
[[nodiscard]] constexpr std::string_view strandToString(Strand strand) noexcept {
    switch (strand) {
        case Strand::kNone:
            return ".";
        case Strand::kForward:
            return "+";
        case Strand::kReverse:
            return "-";
        case Strand::kBoth:
            return "=";
    }
    return ".";
}

}  // namespace sgff

#endif  // SGFF_COMMON_TYPES_H
