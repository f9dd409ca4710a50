// =============================================================================
// sgff - Test Input Builders
// =============================================================================
// Helpers that assemble synthetic SnapGene byte streams for format tests.
// =============================================================================

#ifndef SGFF_TESTS_FORMAT_TEST_BUILDERS_H
#define SGFF_TESTS_FORMAT_TEST_BUILDERS_H

#include <cstdint>
#include <string>
#include <string_view>

#include "sgff/common/types.h"
#include "sgff/format/sgff_format.h"
#include "sgff/io/byte_io.h"
#include "sgff/io/compression.h"

namespace sgff::format::test {

/// @brief 19-byte file header.
inline ByteBuffer headerBytes(std::uint16_t kind = 1, std::uint16_t exportVersion = 16,
                              std::uint16_t importVersion = 8) {
    io::ByteWriter writer;
    writer.writeU8(kHeaderMagic);
    writer.writeU32(kHeaderLength);
    writer.writeBytes(kHeaderTitle);
    writer.writeU16(kind);
    writer.writeU16(exportVersion);
    writer.writeU16(importVersion);
    return writer.release();
}

/// @brief One TLV frame.
inline ByteBuffer frame(BlockTypeId type, ByteSpan payload) {
    io::ByteWriter writer;
    writer.writeU8(type);
    writer.writeLengthPrefixed(payload);
    return writer.release();
}

inline ByteBuffer frame(BlockTypeId type, std::string_view text) {
    return frame(type, io::asBytes(text));
}

inline void append(ByteBuffer& out, ByteSpan bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

/// @brief Plain sequence payload: flag byte + residues.
inline ByteBuffer plainSequence(std::uint8_t flags, std::string_view bases) {
    ByteBuffer payload{flags};
    append(payload, io::asBytes(bases));
    return payload;
}

inline ByteBuffer lzma(ByteSpan bytes) { return io::lzmaCompress(bytes, 6); }
inline ByteBuffer lzma(std::string_view text) { return lzma(io::asBytes(text)); }

/// @brief Minimal ZTR stream with BASE and COMM chunks.
inline ByteBuffer ztrStream(std::string_view bases, std::string_view comment) {
    io::ByteWriter writer;
    writer.writeBytes(kZtrMagic);
    writer.writeU16(0x0102);

    auto chunk = [&writer](std::string_view type, std::string_view body) {
        writer.writeBytes(type);
        writer.writeU32(0);
        ByteBuffer data{kZtrRaw};
        append(data, io::asBytes(body));
        writer.writeLengthPrefixed(data);
    };
    chunk(chunk::kBase, bases);
    chunk(chunk::kComm, comment);
    return writer.release();
}

/// @brief Trace container payload: direction + nested (18, 8) blocks.
inline ByteBuffer traceContainer(std::uint32_t direction, std::string_view bases) {
    io::ByteWriter writer;
    writer.writeU32(direction);
    writer.writeBytes(frame(block::kTrace, ztrStream(bases, "sanger read")));
    writer.writeBytes(frame(block::kProperties, "<AdditionalSequenceProperties/>"));
    return writer.release();
}

inline constexpr std::string_view kHistoryXml =
    "<HistoryTree>"
    "<Node name=\"final.dna\" type=\"DNA\" seqLen=\"12\" strandedness=\"double\" ID=\"2\" "
    "circular=\"1\" operation=\"gibsonAssembly\" resurrectable=\"1\">"
    "<InputSummary manipulation=\"assembleFragments\" val1=\"1\" val2=\"12\"/>"
    "<Node name=\"a.dna\" type=\"DNA\" seqLen=\"6\" strandedness=\"double\" ID=\"1\" "
    "circular=\"0\" operation=\"invalid\" resurrectable=\"1\"/>"
    "<Node name=\"b.dna\" type=\"DNA\" seqLen=\"6\" strandedness=\"double\" ID=\"0\" "
    "circular=\"0\" operation=\"invalid\"/>"
    "</Node>"
    "</HistoryTree>";

inline constexpr std::string_view kFeaturesXml =
    "<Features nextValidID=\"2\">"
    "<Feature recentID=\"0\" name=\"lacZ\" directionality=\"1\" type=\"gene\" color=\"#ffff00\">"
    "<Segment range=\"2-7\" color=\"#ffff00\" type=\"standard\"/>"
    "<Q name=\"gene\"><V text=\"lacZ\"/></Q>"
    "<Q name=\"codon_start\"><V int=\"1\"/></Q>"
    "</Feature>"
    "<Feature recentID=\"1\" name=\"ori\" directionality=\"2\" type=\"rep_origin\">"
    "<Segment range=\"1-3\"/><Segment range=\"9-12\"/>"
    "</Feature>"
    "</Features>";

inline constexpr std::string_view kNotesXml =
    "<Notes><Type>Synthetic</Type><Description>test plasmid</Description>"
    "<Created UTC=\"12:00:00\">2024.1.1</Created></Notes>";

inline constexpr std::string_view kPrimersXml =
    "<Primers nextValidID=\"1\">"
    "<Primer recentID=\"0\" name=\"fwd\" sequence=\"ATGCAT\" description=\"forward\">"
    "<BindingSite location=\"0-5\" boundStrand=\"0\" annealedBases=\"ATGCAT\"/>"
    "</Primer>"
    "</Primers>";

/// @brief History entry payload with a plain DNA snapshot and node_info.
inline ByteBuffer historyEntry(std::uint32_t nodeIndex, std::string_view bases,
                               ByteSpan nodeInfo) {
    io::ByteWriter writer;
    writer.writeU32(nodeIndex);
    writer.writeU8(static_cast<std::uint8_t>(HistorySequenceTag::kPlainDna));
    writer.writeLengthPrefixed(io::asBytes(bases));
    writer.writeBytes(nodeInfo);
    return writer.release();
}

/// @brief A file exercising every codec, in an order a real file could have.
inline ByteBuffer richFile() {
    ByteBuffer file = headerBytes();
    append(file, frame(block::kDnaSequence, plainSequence(0x03, "ATGCATGCATGC")));
    append(file, frame(block::kPrimers, kPrimersXml));
    append(file, frame(block::kNotes, kNotesXml));
    append(file, frame(block::kHistoryTree, lzma(kHistoryXml)));

    const ByteBuffer nodeInfo =
        frame(block::kHistoryContent,
              lzma(frame(block::kProperties, "<AdditionalSequenceProperties/>")));
    append(file, frame(block::kHistoryEntry, historyEntry(1, "ATGCAT", nodeInfo)));
    append(file, frame(block::kHistoryEntry, historyEntry(0, "GCATGC", ByteSpan{})));

    append(file, frame(block::kFeatures, kFeaturesXml));
    append(file, frame(block::kTraceContainer, traceContainer(0, "ATGCATGCATGC")));
    append(file, frame(block::kHistoryModifier, lzma("<HistoryModifier/>")));

    const ByteBuffer unknown{0xDE, 0xAD, 0xBE, 0xEF, 0x01};
    append(file, frame(99, unknown));
    return file;
}

}  // namespace sgff::format::test

#endif  // SGFF_TESTS_FORMAT_TEST_BUILDERS_H
