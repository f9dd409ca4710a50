// =============================================================================
// sgff - Parsed SnapGene File Implementation
// =============================================================================

#include "sgff/format/container.h"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/format.h>

#include "sgff/markup/markup.h"

namespace sgff::format {

// =============================================================================
// Header
// =============================================================================

Header parseHeader(ByteSpan data) {
    if (data.size() < kHeaderSize) {
        throw InvalidHeaderError(
            fmt::format("file is {} bytes, shorter than the {}-byte header", data.size(),
                        kHeaderSize),
            ErrorContext{}.withOffset(0));
    }

    io::ByteReader reader(data.first(kHeaderSize));
    if (const auto magic = reader.readU8(); magic != kHeaderMagic) {
        throw InvalidHeaderError(
            fmt::format("bad header magic 0x{:02x}, expected 0x{:02x}", magic, kHeaderMagic),
            ErrorContext{}.withOffset(0));
    }
    if (const auto length = reader.readU32(); length != kHeaderLength) {
        throw InvalidHeaderError(
            fmt::format("bad header length {}, expected {}", length, kHeaderLength),
            ErrorContext{}.withOffset(1));
    }
    if (const auto title = io::toString(reader.readBytes(kHeaderTitle.size()));
        title != kHeaderTitle) {
        throw InvalidHeaderError(fmt::format("bad header title tag, expected '{}'", kHeaderTitle),
                                 ErrorContext{}.withOffset(5));
    }

    const std::uint16_t kind = reader.readU16();
    if (!isValidSequenceKind(kind)) {
        throw InvalidHeaderError(fmt::format("unknown sequence kind {}", kind),
                                 ErrorContext{}.withOffset(13));
    }

    Header header;
    header.kind = static_cast<SequenceKind>(kind);
    header.exportVersion = reader.readU16();
    header.importVersion = reader.readU16();
    return header;
}

void writeHeader(const Header& header, io::ByteWriter& writer) {
    writer.writeU8(kHeaderMagic);
    writer.writeU32(kHeaderLength);
    writer.writeBytes(kHeaderTitle);
    writer.writeU16(static_cast<std::uint16_t>(header.kind));
    writer.writeU16(header.exportVersion);
    writer.writeU16(header.importVersion);
}

// =============================================================================
// Container
// =============================================================================

Container::Container(Header header, BlockList blocks)
    : header_(header), blocks_(std::move(blocks)) {}

std::optional<Sequence> Container::sequence() const {
    for (BlockTypeId type : {block::kDnaSequence, block::kRnaSequence, block::kProteinSequence}) {
        if (const auto* seq = blocks_.firstAs<Sequence>(type)) {
            return *seq;
        }
    }
    if (const auto* packed = blocks_.firstAs<CompressedSequence>(block::kCompressedDna)) {
        Sequence seq;
        seq.kind = SequenceKind::kDNA;
        seq.bases = packed->bases();
        return seq;
    }
    return std::nullopt;
}

const std::string* Container::markupText(BlockTypeId type) const noexcept {
    if (const auto* plain = blocks_.firstAs<MarkupBlock>(type)) {
        return &plain->text;
    }
    if (const auto* compressed = blocks_.firstAs<CompressedMarkupBlock>(type)) {
        return &compressed->text;
    }
    return nullptr;
}

Result<std::vector<model::Feature>> Container::features() const {
    return tryExecute([this] {
        const std::string* text = markupText(block::kFeatures);
        if (text == nullptr) {
            return std::vector<model::Feature>{};
        }
        return model::parseFeatures(markup::parseMarkup(*text));
    });
}

Result<model::Notes> Container::notes() const {
    return tryExecute([this] {
        const std::string* text = markupText(block::kNotes);
        if (text == nullptr) {
            return model::Notes{};
        }
        return model::parseNotes(markup::parseMarkup(*text));
    });
}

Result<std::vector<model::Primer>> Container::primers() const {
    return tryExecute([this] {
        const std::string* text = markupText(block::kPrimers);
        if (text == nullptr) {
            return std::vector<model::Primer>{};
        }
        return model::parsePrimers(markup::parseMarkup(*text));
    });
}

Result<model::Properties> Container::properties() const {
    return tryExecute([this] {
        const std::string* text = markupText(block::kProperties);
        if (text == nullptr) {
            return model::Properties{};
        }
        return model::parseProperties(markup::parseMarkup(*text));
    });
}

Result<std::vector<model::AlignableSequence>> Container::alignableSequences() const {
    return tryExecute([this] {
        const std::string* text = markupText(block::kAlignableSequences);
        if (text == nullptr) {
            return std::vector<model::AlignableSequence>{};
        }
        return model::parseAlignableSequences(markup::parseMarkup(*text));
    });
}

VoidResult Container::rebuildHistoryTree(std::uint32_t maxDepth) {
    return tryExecute([this, maxDepth] {
        const std::string* text = markupText(block::kHistoryTree);
        if (text == nullptr) {
            historyTree_.reset();
            return;
        }
        try {
            historyTree_ = model::buildHistoryTree(markup::parseMarkup(*text), maxDepth);
        } catch (SGFFException& ex) {
            if (!ex.hasContext()) {
                ex.attachContext(ErrorContext{}.withBlock(block::kHistoryTree));
            }
            throw;
        }
    });
}

const HistoryEntry* Container::historyEntry(std::uint32_t nodeId) const noexcept {
    for (std::size_t pos : blocks_.indicesOf(block::kHistoryEntry)) {
        const auto* entry = std::get_if<HistoryEntry>(&blocks_[pos].value);
        if (entry != nullptr && entry->nodeIndex == nodeId) {
            return entry;
        }
    }
    return nullptr;
}

std::vector<const TraceContainer*> Container::traceContainers() const {
    return blocks_.allAs<TraceContainer>(block::kTraceContainer);
}

std::vector<const Trace*> Container::traces() const {
    std::vector<const Trace*> out;
    for (const auto* container : traceContainers()) {
        if (const auto* trace = container->trace()) {
            out.push_back(trace);
        }
    }
    for (const auto* trace : blocks_.allAs<Trace>(block::kTrace)) {
        out.push_back(trace);
    }
    return out;
}

std::vector<BlockTypeId> Container::undecodedTypes() const {
    std::vector<BlockTypeId> out;
    for (const auto& block : blocks_.blocks()) {
        if (!block.isDecoded() && std::find(out.begin(), out.end(), block.type) == out.end()) {
            out.push_back(block.type);
        }
    }
    return out;
}

Container Container::filtered(std::span<const BlockTypeId> keep) const {
    Container out(header_, blocks_.filtered(keep));
    if (std::find(keep.begin(), keep.end(), block::kHistoryTree) != keep.end()) {
        out.historyTree_ = historyTree_;
    }
    return out;
}

}  // namespace sgff::format
