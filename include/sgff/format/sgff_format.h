// =============================================================================
// sgff - SnapGene Container Format Definitions
// =============================================================================
// Binary layout constants for the SnapGene TLV container.
//
// File Layout:
// +----------------+
// |  File Header   |  (19 bytes)
// +----------------+
// |    Block 0     |  type (1) | length (4, BE) | payload (length)
// +----------------+
// |      ...       |
// +----------------+
// |    Block N     |
// +----------------+
//
// Header Layout:
//   byte 0       magic 0x09
//   bytes 1-4    BE u32 header length, always 14
//   bytes 5-12   ASCII "SnapGene"
//   bytes 13-14  BE u16 sequence kind (1 DNA, 2 RNA, 3 protein)
//   bytes 15-16  BE u16 export version
//   bytes 17-18  BE u16 import version
//
// All multi-byte integers in the container are big-endian.
// =============================================================================

#ifndef SGFF_FORMAT_SGFF_FORMAT_H
#define SGFF_FORMAT_SGFF_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "sgff/common/types.h"

namespace sgff::format {

// =============================================================================
// File Header Constants
// =============================================================================

/// @brief First byte of every file.
inline constexpr std::uint8_t kHeaderMagic = 0x09;

/// @brief Value of the header length field.
inline constexpr std::uint32_t kHeaderLength = 14;

/// @brief Title tag following the length field.
inline constexpr std::string_view kHeaderTitle = "SnapGene";

/// @brief Total header size in bytes.
inline constexpr std::size_t kHeaderSize = 19;

/// @brief TLV frame size (type + length).
inline constexpr std::size_t kBlockFrameSize = 5;

// =============================================================================
// Block Type Identifiers
// =============================================================================

namespace block {

/// @brief Plain DNA sequence with property flags.
inline constexpr BlockTypeId kDnaSequence = 0;

/// @brief 2-bit packed DNA sequence.
inline constexpr BlockTypeId kCompressedDna = 1;

/// @brief Primers markup.
inline constexpr BlockTypeId kPrimers = 5;

/// @brief Notes markup.
inline constexpr BlockTypeId kNotes = 6;

/// @brief LZMA-compressed history tree markup.
inline constexpr BlockTypeId kHistoryTree = 7;

/// @brief Sequence properties markup.
inline constexpr BlockTypeId kProperties = 8;

/// @brief Features markup.
inline constexpr BlockTypeId kFeatures = 10;

/// @brief History entry (node snapshot).
inline constexpr BlockTypeId kHistoryEntry = 11;

/// @brief Custom enzyme sets markup.
inline constexpr BlockTypeId kEnzymeSets = 14;

/// @brief Trace container (direction flag + nested TLV).
inline constexpr BlockTypeId kTraceContainer = 16;

/// @brief Alignable sequences markup.
inline constexpr BlockTypeId kAlignableSequences = 17;

/// @brief ZTR chromatogram trace.
inline constexpr BlockTypeId kTrace = 18;

/// @brief Plain protein sequence with property flags.
inline constexpr BlockTypeId kProteinSequence = 21;

/// @brief Enzyme visibilities markup.
inline constexpr BlockTypeId kEnzymeVisibilities = 28;

/// @brief LZMA-compressed history modifier markup.
inline constexpr BlockTypeId kHistoryModifier = 29;

/// @brief LZMA-compressed nested TLV stream (history node content).
inline constexpr BlockTypeId kHistoryContent = 30;

/// @brief Plain RNA sequence with property flags.
inline constexpr BlockTypeId kRnaSequence = 32;

}  // namespace block

/// @brief Check whether a block type holds a plain sequence.
[[nodiscard]] constexpr bool isPlainSequenceBlock(BlockTypeId type) noexcept {
    return type == block::kDnaSequence || type == block::kProteinSequence ||
           type == block::kRnaSequence;
}

/// @brief Molecule kind carried by a plain sequence block type.
[[nodiscard]] constexpr SequenceKind kindForSequenceBlock(BlockTypeId type) noexcept {
    switch (type) {
        case block::kProteinSequence:
            return SequenceKind::kProtein;
        case block::kRnaSequence:
            return SequenceKind::kRNA;
        default:
            return SequenceKind::kDNA;
    }
}

// =============================================================================
// Sequence Property Flags (first byte of types 0, 21, 32)
// =============================================================================

inline constexpr std::uint8_t kFlagCircular = 1u << 0;
inline constexpr std::uint8_t kFlagDoubleStranded = 1u << 1;
inline constexpr std::uint8_t kFlagDam = 1u << 2;
inline constexpr std::uint8_t kFlagDcm = 1u << 3;
inline constexpr std::uint8_t kFlagEcoKI = 1u << 4;

/// @brief Bits without a documented meaning, kept verbatim.
inline constexpr std::uint8_t kFlagUnknownMask = 0xE0;

// =============================================================================
// Compressed DNA Layout (type 1)
// =============================================================================

/// @brief Size of the opaque field after the two length fields.
inline constexpr std::size_t kCompressedOpaqueSize = 14;

/// @brief Bytes before the packed payload (2 x u32 + opaque field).
inline constexpr std::size_t kCompressedPrefixSize = 8 + kCompressedOpaqueSize;

/// @brief Packed payload size for a base count: ceil(n * 2 / 8).
[[nodiscard]] constexpr std::uint64_t packedSize(std::uint64_t baseCount) noexcept {
    return (baseCount * 2 + 7) / 8;
}

// =============================================================================
// History Entry Sequence Tags (type 11)
// =============================================================================

/// @brief Sequence-type tag of a history entry.
enum class HistorySequenceTag : std::uint8_t {
    kPlainDna = 0,
    kCompressedDna = 1,
    kProtein = 21,
    kModifierOnly = 29,
    kRna = 32
};

/// @brief Check whether a raw tag value is known.
[[nodiscard]] constexpr bool isKnownHistoryTag(std::uint8_t value) noexcept {
    return value == 0 || value == 1 || value == 21 || value == 29 || value == 32;
}

[[nodiscard]] constexpr std::string_view historyTagToString(HistorySequenceTag tag) noexcept {
    switch (tag) {
        case HistorySequenceTag::kPlainDna:
            return "dna";
        case HistorySequenceTag::kCompressedDna:
            return "compressed-dna";
        case HistorySequenceTag::kProtein:
            return "protein";
        case HistorySequenceTag::kModifierOnly:
            return "modifier-only";
        case HistorySequenceTag::kRna:
            return "rna";
    }
    return "unknown";
}

/// @brief Molecule kind of a plain history tag.
[[nodiscard]] constexpr SequenceKind kindForHistoryTag(HistorySequenceTag tag) noexcept {
    switch (tag) {
        case HistorySequenceTag::kProtein:
            return SequenceKind::kProtein;
        case HistorySequenceTag::kRna:
            return SequenceKind::kRNA;
        default:
            return SequenceKind::kDNA;
    }
}

// =============================================================================
// ZTR Trace Constants (type 18)
// =============================================================================

/// @brief ZTR magic: 0xAE 'Z' 'T' 'R' CR LF 0x1A LF.
inline constexpr std::array<std::uint8_t, 8> kZtrMagic = {
    0xAE, 'Z', 'T', 'R', 0x0D, 0x0A, 0x1A, 0x0A
};

/// @brief Chunk data selector: literal body.
inline constexpr std::uint8_t kZtrRaw = 0x00;

/// @brief Chunk data selector: zlib-compressed body.
inline constexpr std::uint8_t kZtrZlib = 0x02;

/// @brief Bytes preceding the zlib stream (selector + 4-byte size).
inline constexpr std::size_t kZtrZlibHeaderSize = 5;

namespace chunk {

inline constexpr std::string_view kBase = "BASE";
inline constexpr std::string_view kBpos = "BPOS";
inline constexpr std::string_view kCnf4 = "CNF4";
inline constexpr std::string_view kSmp4 = "SMP4";
inline constexpr std::string_view kSamp = "SAMP";
inline constexpr std::string_view kText = "TEXT";
inline constexpr std::string_view kClip = "CLIP";
inline constexpr std::string_view kComm = "COMM";

}  // namespace chunk

/// @brief Padding bytes after the selector in a BPOS body.
inline constexpr std::size_t kBposPadding = 3;

/// @brief Padding bytes after the selector in SMP4 and SAMP bodies.
inline constexpr std::size_t kSamplePadding = 1;

/// @brief Trace direction flag value for forward reads (type 16).
inline constexpr std::uint32_t kTraceForward = 0;

}  // namespace sgff::format

#endif  // SGFF_FORMAT_SGFF_FORMAT_H
