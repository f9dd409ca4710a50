// =============================================================================
// sgff - Sequence Block Codec Implementation
// =============================================================================

#include "sgff/format/sequence_codec.h"

#include <algorithm>

#include <fmt/format.h>

#include "sgff/common/error.h"
#include "sgff/io/byte_io.h"

namespace sgff::format {

namespace {

/// @brief 2-bit code to base.
constexpr std::array<char, 4> kCodeToBase = {'G', 'A', 'T', 'C'};

/// @brief Base to 2-bit code, or -1.
constexpr int baseToCode(char base) noexcept {
    switch (base) {
        case 'G':
        case 'g':
            return 0;
        case 'A':
        case 'a':
            return 1;
        case 'T':
        case 't':
            return 2;
        case 'C':
        case 'c':
            return 3;
        default:
            return -1;
    }
}

}  // namespace

// =============================================================================
// Sequence
// =============================================================================

std::uint8_t Sequence::flags() const noexcept {
    std::uint8_t value = unknownFlags & kFlagUnknownMask;
    if (topology == Topology::kCircular) value |= kFlagCircular;
    if (strandedness == Strandedness::kDouble) value |= kFlagDoubleStranded;
    if (dam) value |= kFlagDam;
    if (dcm) value |= kFlagDcm;
    if (ecoKI) value |= kFlagEcoKI;
    return value;
}

void Sequence::applyFlags(std::uint8_t flags) noexcept {
    topology = (flags & kFlagCircular) != 0 ? Topology::kCircular : Topology::kLinear;
    strandedness = (flags & kFlagDoubleStranded) != 0 ? Strandedness::kDouble
                                                      : Strandedness::kSingle;
    dam = (flags & kFlagDam) != 0;
    dcm = (flags & kFlagDcm) != 0;
    ecoKI = (flags & kFlagEcoKI) != 0;
    unknownFlags = flags & kFlagUnknownMask;
}

// =============================================================================
// 2-bit Packing
// =============================================================================

ByteBuffer packBases(std::string_view bases) {
    ByteBuffer packed(packedSize(bases.size()), 0);
    for (std::size_t i = 0; i < bases.size(); ++i) {
        const int code = baseToCode(bases[i]);
        if (code < 0) {
            throw SerializeError(fmt::format(
                "base '{}' at position {} cannot be 2-bit packed", bases[i], i));
        }
        const unsigned shift = 6 - 2 * static_cast<unsigned>(i % 4);
        packed[i / 4] |= static_cast<std::uint8_t>(code << shift);
    }
    return packed;
}

std::string unpackBases(ByteSpan packed, std::size_t count) {
    std::string bases;
    bases.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned shift = 6 - 2 * static_cast<unsigned>(i % 4);
        bases.push_back(kCodeToBase[(packed[i / 4] >> shift) & 0x3]);
    }
    return bases;
}

// =============================================================================
// CompressedSequence
// =============================================================================

std::string CompressedSequence::bases() const {
    const std::size_t count =
        std::min<std::size_t>(baseCount, packed.size() * 4);
    return unpackBases(packed, count);
}

CompressedSequence CompressedSequence::fromBases(std::string_view bases) {
    CompressedSequence seq;
    seq.baseCount = io::checkedLength(bases.size(), "base count");
    seq.packed = packBases(bases);
    seq.updateLengthField();
    return seq;
}

void CompressedSequence::updateLengthField() {
    compressedLength = io::checkedLength(encodedSize() - 4, "compressed sequence");
}

// =============================================================================
// Plain Codec
// =============================================================================

Sequence decodePlain(ByteSpan payload, SequenceKind kind) {
    if (payload.empty()) {
        throw TruncatedSequenceError("sequence block has no property-flag byte");
    }

    Sequence seq;
    seq.kind = kind;
    seq.applyFlags(payload[0]);
    seq.bases = io::toString(payload.subspan(1));
    return seq;
}

ByteBuffer encodePlain(const Sequence& sequence) {
    ByteBuffer out;
    out.reserve(sequence.bases.size() + 1);
    out.push_back(sequence.flags());
    out.insert(out.end(), sequence.bases.begin(), sequence.bases.end());
    return out;
}

// =============================================================================
// Compressed Codec
// =============================================================================

CompressedSequence decodeCompressed(ByteSpan payload) {
    if (payload.size() < kCompressedPrefixSize) {
        throw TruncatedSequenceError(fmt::format(
            "compressed sequence needs {} header bytes, got {}", kCompressedPrefixSize,
            payload.size()));
    }

    io::ByteReader reader(payload);
    CompressedSequence seq;
    seq.compressedLength = reader.readU32();
    seq.baseCount = reader.readU32();
    ByteSpan opaque = reader.readBytes(kCompressedOpaqueSize);
    std::copy(opaque.begin(), opaque.end(), seq.opaque.begin());

    const std::uint64_t need = packedSize(seq.baseCount);
    if (need > reader.remaining()) {
        throw TruncatedSequenceError(fmt::format(
            "{} bases need {} packed bytes but only {} remain", seq.baseCount, need,
            reader.remaining()));
    }

    ByteSpan packed = reader.readBytes(static_cast<std::size_t>(need));
    seq.packed.assign(packed.begin(), packed.end());
    ByteSpan trailing = reader.readRemaining();
    seq.trailing.assign(trailing.begin(), trailing.end());
    return seq;
}

ByteBuffer encodeCompressed(const CompressedSequence& sequence) {
    if (!sequence.isConsistent()) {
        throw SerializeError(fmt::format(
            "packed payload holds {} bytes but {} bases need {}", sequence.packed.size(),
            sequence.baseCount, packedSize(sequence.baseCount)));
    }
    if (!sequence.hasMatchingLengthField()) {
        throw SerializeError(fmt::format(
            "compressed length field {} does not match the {} bytes that follow it",
            sequence.compressedLength, sequence.encodedSize() - 4));
    }

    io::ByteWriter writer;
    writer.reserve(sequence.encodedSize());
    writer.writeU32(sequence.compressedLength);
    writer.writeU32(sequence.baseCount);
    writer.writeBytes(sequence.opaque);
    writer.writeBytes(sequence.packed);
    writer.writeBytes(sequence.trailing);
    return writer.release();
}

}  // namespace sgff::format
