// =============================================================================
// sgff - Parsed SnapGene File
// =============================================================================
// Container = 19-byte header + top-level BlockList, plus read-only typed
// views (sequence, features, notes, primers, properties, alignable
// sequences, history, traces) derived from the stored blocks.
//
// Views over markup blocks parse on demand and return Result<T>; the history
// tree is built once by the reader (or rebuildHistoryTree) because history
// entries are looked up against it.
// =============================================================================

#ifndef SGFF_FORMAT_CONTAINER_H
#define SGFF_FORMAT_CONTAINER_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "sgff/common/error.h"
#include "sgff/common/types.h"
#include "sgff/format/block_list.h"
#include "sgff/io/byte_io.h"
#include "sgff/model/alignment.h"
#include "sgff/model/feature.h"
#include "sgff/model/history_tree.h"
#include "sgff/model/notes.h"
#include "sgff/model/primer.h"
#include "sgff/model/properties.h"

namespace sgff::format {

// =============================================================================
// Header
// =============================================================================

/// @brief Fixed file prefix.
struct Header {
    SequenceKind kind = SequenceKind::kDNA;
    std::uint16_t exportVersion = 16;
    std::uint16_t importVersion = 8;

    [[nodiscard]] bool operator==(const Header&) const = default;
};

/// @brief Decode the 19-byte header.
/// @throws InvalidHeaderError if any fixed field mismatches or data is short.
[[nodiscard]] Header parseHeader(ByteSpan data);

/// @brief Append the 19-byte header.
void writeHeader(const Header& header, io::ByteWriter& writer);

// =============================================================================
// Container
// =============================================================================

class Container {
public:
    Container() = default;
    Container(Header header, BlockList blocks);

    [[nodiscard]] const Header& header() const noexcept { return header_; }
    void setHeader(const Header& header) noexcept { header_ = header; }

    [[nodiscard]] const BlockList& blocks() const noexcept { return blocks_; }
    [[nodiscard]] BlockList& blocks() noexcept { return blocks_; }

    /// @brief Current sequence from block 0/21/32, else unpacked from block 1.
    [[nodiscard]] std::optional<Sequence> sequence() const;

    /// @brief Features from block 10 (empty if absent).
    [[nodiscard]] Result<std::vector<model::Feature>> features() const;

    /// @brief Notes from block 6 (empty if absent).
    [[nodiscard]] Result<model::Notes> notes() const;

    /// @brief Primers from block 5 (empty if absent).
    [[nodiscard]] Result<std::vector<model::Primer>> primers() const;

    /// @brief Additional sequence properties from block 8 (empty if absent).
    [[nodiscard]] Result<model::Properties> properties() const;

    /// @brief Alignable sequences from block 17 (empty if absent).
    [[nodiscard]] Result<std::vector<model::AlignableSequence>> alignableSequences() const;

    /// @brief History tree built from block 7, or nullptr.
    [[nodiscard]] const model::HistoryTree* historyTree() const noexcept {
        return historyTree_ ? &*historyTree_ : nullptr;
    }

    /// @brief Rebuild the history tree after block 7 was edited.
    [[nodiscard]] VoidResult rebuildHistoryTree(std::uint32_t maxDepth);

    /// @brief Top-level history entry (block 11) for a node identifier.
    [[nodiscard]] const HistoryEntry* historyEntry(std::uint32_t nodeId) const noexcept;

    /// @brief Trace containers (block 16) in stored order.
    [[nodiscard]] std::vector<const TraceContainer*> traceContainers() const;

    /// @brief Traces of every trace container, then bare top-level traces.
    [[nodiscard]] std::vector<const Trace*> traces() const;

    /// @brief True if blocks of the type are present and decoded.
    [[nodiscard]] bool isDecoded(BlockTypeId type) const noexcept { return blocks_.isDecoded(type); }

    /// @brief Block types in order of first appearance.
    [[nodiscard]] std::vector<BlockTypeId> blockTypes() const { return blocks_.types(); }

    /// @brief Types kept as raw bytes because no codec recognizes them.
    [[nodiscard]] std::vector<BlockTypeId> undecodedTypes() const;

    /// @brief Copy keeping only the listed block types.
    [[nodiscard]] Container filtered(std::span<const BlockTypeId> keep) const;

private:
    /// @brief Markup text of the first block of a type, or nullptr.
    [[nodiscard]] const std::string* markupText(BlockTypeId type) const noexcept;

    Header header_;
    BlockList blocks_;
    std::optional<model::HistoryTree> historyTree_;
};

}  // namespace sgff::format

#endif  // SGFF_FORMAT_CONTAINER_H
