// =============================================================================
// sgff - BlockList Implementation
// =============================================================================

#include "sgff/format/block_list.h"

#include <algorithm>

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::format {

// =============================================================================
// Block Values
// =============================================================================

std::optional<std::string> HistoryEntry::bases() const {
    if (const auto* plain = plainSequence()) {
        return plain->bases;
    }
    if (const auto* packed = compressedSequence()) {
        return packed->bases();
    }
    return std::nullopt;
}

const Trace* TraceContainer::trace() const noexcept {
    return blocks->firstAs<Trace>(block::kTrace);
}

// =============================================================================
// BlockList
// =============================================================================

void BlockList::append(BlockTypeId type, BlockValue value, std::uint64_t offset) {
    append(Block{type, std::move(value), offset});
}

void BlockList::append(Block block) {
    index_[block.type].push_back(blocks_.size());
    blocks_.push_back(std::move(block));
}

void BlockList::insert(std::size_t position, BlockTypeId type, BlockValue value) {
    if (position > blocks_.size()) {
        throw UsageError(fmt::format("insert position {} is past the end of a {}-block list",
                                     position, blocks_.size()));
    }
    blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(position),
                   Block{type, std::move(value), 0});
    reindex();
}

void BlockList::erase(std::size_t position) {
    if (position >= blocks_.size()) {
        throw UsageError(fmt::format("erase position {} is out of range for a {}-block list",
                                     position, blocks_.size()));
    }
    blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(position));
    reindex();
}

std::size_t BlockList::eraseType(BlockTypeId type) {
    const std::size_t before = blocks_.size();
    std::erase_if(blocks_, [type](const Block& block) { return block.type == type; });
    const std::size_t removed = before - blocks_.size();
    if (removed != 0) {
        reindex();
    }
    return removed;
}

std::span<const std::size_t> BlockList::indicesOf(BlockTypeId type) const noexcept {
    auto it = index_.find(type);
    if (it == index_.end()) {
        return {};
    }
    return it->second;
}

bool BlockList::isDecoded(BlockTypeId type) const noexcept {
    auto positions = indicesOf(type);
    if (positions.empty()) {
        return false;
    }
    return std::all_of(positions.begin(), positions.end(),
                       [this](std::size_t pos) { return blocks_[pos].isDecoded(); });
}

std::vector<BlockTypeId> BlockList::types() const {
    std::vector<BlockTypeId> out;
    out.reserve(index_.size());
    for (const auto& block : blocks_) {
        if (std::find(out.begin(), out.end(), block.type) == out.end()) {
            out.push_back(block.type);
        }
    }
    return out;
}

BlockList BlockList::filtered(std::span<const BlockTypeId> keep) const {
    BlockList out;
    for (const auto& block : blocks_) {
        if (std::find(keep.begin(), keep.end(), block.type) != keep.end()) {
            out.append(block);
        }
    }
    return out;
}

void BlockList::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        index_[blocks_[i].type].push_back(i);
    }
}

}  // namespace sgff::format
