// =============================================================================
// sgff - Block Values and BlockList
// =============================================================================
// In-memory representation of a TLV block stream.
//
// BlockList owns its blocks in arrival order and keeps a type -> indices map
// for typed access. Serialization always follows the stored order, so an
// unmodified parse is re-emitted in exactly the order it was read. Callers
// that need a different order edit the list explicitly (insert / erase);
// appended blocks go to the end.
//
// Containers nest: history entries (11), trace containers (16) and nested
// containers (30) each own a BlockList through a deep-copying Box.
// =============================================================================

#ifndef SGFF_FORMAT_BLOCK_LIST_H
#define SGFF_FORMAT_BLOCK_LIST_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sgff/common/types.h"
#include "sgff/format/sequence_codec.h"
#include "sgff/format/sgff_format.h"
#include "sgff/format/trace_codec.h"

namespace sgff::format {

class BlockList;

// =============================================================================
// Box
// =============================================================================

/// @brief Owning pointer with value semantics (copies deep-copy the pointee).
/// @note Lets recursive block values hold a BlockList before it is complete.
template <typename T>
class Box {
public:
    Box() : ptr_(std::make_unique<T>()) {}
    Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}  // NOLINT(google-explicit-constructor)

    Box(const Box& other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
    Box(Box&& other) noexcept = default;

    Box& operator=(const Box& other) {
        if (this != &other) {
            ptr_ = std::make_unique<T>(*other.ptr_);
        }
        return *this;
    }
    Box& operator=(Box&& other) noexcept = default;

    ~Box() = default;

    [[nodiscard]] T& operator*() noexcept { return *ptr_; }
    [[nodiscard]] const T& operator*() const noexcept { return *ptr_; }
    [[nodiscard]] T* operator->() noexcept { return ptr_.get(); }
    [[nodiscard]] const T* operator->() const noexcept { return ptr_.get(); }

private:
    std::unique_ptr<T> ptr_;
};

// =============================================================================
// Block Values
// =============================================================================

/// @brief Payload of a block type without a codec, kept verbatim.
struct RawBlock {
    ByteBuffer bytes;
};

/// @brief Plain XML markup block (types 5, 6, 8, 10, 14, 17, 28).
struct MarkupBlock {
    std::string text;
};

/// @brief LZMA-compressed XML markup block (types 7, 29).
struct CompressedMarkupBlock {
    /// @brief Decompressed markup.
    std::string text;

    /// @brief Payload as read, reused on write while text is unchanged.
    ByteBuffer originalCompressed;

    /// @brief Digest of the decompressed bytes at decode time.
    Checksum originalDigest = 0;
};

/// @brief LZMA-wrapped nested TLV stream (type 30).
struct NestedContainer {
    Box<BlockList> blocks;

    /// @brief Payload as read, reused on write while the stream is unchanged.
    ByteBuffer originalCompressed;

    /// @brief Digest of the decompressed stream at decode time.
    Checksum originalDigest = 0;
};

/// @brief History entry (type 11).
struct HistoryEntry {
    /// @brief Identifier of the history node this entry belongs to.
    std::uint32_t nodeIndex = 0;

    HistorySequenceTag tag = HistorySequenceTag::kModifierOnly;

    /// @brief Snapshot; monostate for modifier-only entries.
    /// @note Plain snapshots store bases only; the entry carries no flag byte.
    std::variant<std::monostate, Sequence, CompressedSequence> sequence;

    /// @brief Nested node_info blocks.
    Box<BlockList> nodeInfo;

    [[nodiscard]] const Sequence* plainSequence() const noexcept {
        return std::get_if<Sequence>(&sequence);
    }

    [[nodiscard]] const CompressedSequence* compressedSequence() const noexcept {
        return std::get_if<CompressedSequence>(&sequence);
    }

    /// @brief Bases of the snapshot, nullopt for modifier-only entries.
    [[nodiscard]] std::optional<std::string> bases() const;
};

/// @brief Trace container (type 16).
struct TraceContainer {
    /// @brief Direction flag as stored; 0 is forward.
    std::uint32_t direction = kTraceForward;

    /// @brief Nested blocks holding one type-18 trace and optionally type 8.
    Box<BlockList> blocks;

    [[nodiscard]] bool isReverse() const noexcept { return direction != kTraceForward; }

    /// @brief The embedded trace, or nullptr.
    [[nodiscard]] const Trace* trace() const noexcept;
};

/// @brief Value stored for one block.
using BlockValue = std::variant<RawBlock, Sequence, CompressedSequence, MarkupBlock,
                                CompressedMarkupBlock, HistoryEntry, NestedContainer,
                                TraceContainer, Trace>;

/// @brief One block of a stream.
struct Block {
    BlockTypeId type = 0;
    BlockValue value;

    /// @brief Offset of the block frame in the stream it was read from.
    std::uint64_t offset = 0;

    /// @brief False for blocks kept as raw bytes.
    [[nodiscard]] bool isDecoded() const noexcept {
        return !std::holds_alternative<RawBlock>(value);
    }
};

// =============================================================================
// BlockList
// =============================================================================

/// @brief Ordered, owning list of blocks with a type index.
class BlockList {
public:
    BlockList() = default;

    /// @brief Append a block at the end.
    void append(BlockTypeId type, BlockValue value, std::uint64_t offset = 0);

    /// @brief Append an already constructed block.
    void append(Block block);

    /// @brief Insert a block before position.
    /// @throws UsageError if position > size().
    void insert(std::size_t position, BlockTypeId type, BlockValue value);

    /// @brief Remove the block at position.
    /// @throws UsageError if position is out of range.
    void erase(std::size_t position);

    /// @brief Remove every block of a type.
    /// @return Number of blocks removed.
    std::size_t eraseType(BlockTypeId type);

    [[nodiscard]] std::size_t size() const noexcept { return blocks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return blocks_.empty(); }

    /// @brief Blocks in stored order.
    [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return blocks_; }

    [[nodiscard]] const Block& operator[](std::size_t position) const { return blocks_.at(position); }

    /// @brief Mutable access to a block value; the block type is fixed.
    [[nodiscard]] BlockValue& valueAt(std::size_t position) { return blocks_.at(position).value; }

    /// @brief Positions of the blocks of a type, in stored order.
    [[nodiscard]] std::span<const std::size_t> indicesOf(BlockTypeId type) const noexcept;

    [[nodiscard]] bool contains(BlockTypeId type) const noexcept { return index_.count(type) != 0; }

    /// @brief True if blocks of this type are present and all were decoded.
    [[nodiscard]] bool isDecoded(BlockTypeId type) const noexcept;

    /// @brief Distinct block types in order of first appearance.
    [[nodiscard]] std::vector<BlockTypeId> types() const;

    /// @brief First block of a type holding a T, or nullptr.
    template <typename T>
    [[nodiscard]] const T* firstAs(BlockTypeId type) const noexcept {
        for (std::size_t pos : indicesOf(type)) {
            if (const auto* value = std::get_if<T>(&blocks_[pos].value)) {
                return value;
            }
        }
        return nullptr;
    }

    /// @brief All blocks of a type holding a T.
    template <typename T>
    [[nodiscard]] std::vector<const T*> allAs(BlockTypeId type) const {
        std::vector<const T*> out;
        for (std::size_t pos : indicesOf(type)) {
            if (const auto* value = std::get_if<T>(&blocks_[pos].value)) {
                out.push_back(value);
            }
        }
        return out;
    }

    /// @brief Copy keeping only the listed types, order preserved.
    [[nodiscard]] BlockList filtered(std::span<const BlockTypeId> keep) const;

private:
    void reindex();

    std::vector<Block> blocks_;
    std::map<BlockTypeId, std::vector<std::size_t>> index_;
};

}  // namespace sgff::format

#endif  // SGFF_FORMAT_BLOCK_LIST_H
