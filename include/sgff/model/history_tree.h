// =============================================================================
// sgff - Cloning History Tree
// =============================================================================
// In-memory form of the history-tree markup (block type 7).
//
// Nodes live in an arena owned by HistoryTree; index 0 is the root (the
// current sequence state) and children are referenced by arena index. An
// identifier -> index map serves lookups from history entries (block 11),
// which refer to nodes by identifier only.
// =============================================================================

#ifndef SGFF_MODEL_HISTORY_TREE_H
#define SGFF_MODEL_HISTORY_TREE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sgff/common/types.h"
#include "sgff/markup/markup.h"

namespace sgff::model {

// =============================================================================
// Operations
// =============================================================================

/// @brief Cloning operation that produced a history node.
enum class HistoryOperation : std::uint8_t {
    kInvalid = 0,  ///< Leaf or imported state
    kOther,        ///< Operation name not in this list, kept verbatim
    kNewFile,
    kImportFile,
    kAmplifyFragment,
    kInsertFragment,
    kInsertFragments,
    kReplace,
    kRestrictionCloning,
    kLigateFragments,
    kGibsonAssembly,
    kInFusionCloning,
    kGoldenGateAssembly,
    kGatewayLRCloning,
    kGatewayBPCloning,
    kTaCloning,
    kTopoCloning,
    kMutagenesis,
    kPrimerDirectedMutagenesis,
    kChangeMethylation,
    kChangeTopology,
    kFlip
};

/// @brief Parse an operation name; unknown names give kOther.
[[nodiscard]] HistoryOperation historyOperationFromString(std::string_view name) noexcept;

/// @brief Canonical name of an operation ("other" for kOther).
[[nodiscard]] std::string_view historyOperationToString(HistoryOperation op) noexcept;

// =============================================================================
// HistoryNode
// =============================================================================

/// @brief One state in the cloning history.
struct HistoryNode {
    std::uint32_t id = 0;
    std::string name;
    SequenceKind kind = SequenceKind::kDNA;
    std::uint64_t sequenceLength = 0;
    Topology topology = Topology::kLinear;
    Strandedness strandedness = Strandedness::kDouble;

    HistoryOperation operation = HistoryOperation::kInvalid;

    /// @brief Operation name as written in the markup.
    std::string operationName;

    std::string upstreamModification;
    std::string downstreamModification;
    bool resurrectable = false;

    /// @brief Arena indices of the children, in document order.
    std::vector<std::size_t> children;

    /// @brief InputSummary, Oligo, Parameter and other non-node elements.
    std::vector<markup::MarkupNode> subRecords;

    /// @brief Every attribute of the element, in document order.
    std::vector<std::pair<std::string, std::string>> attributes;

    [[nodiscard]] bool isLeaf() const noexcept { return children.empty(); }

    /// @brief Sub-records with the given element name.
    [[nodiscard]] std::vector<const markup::MarkupNode*> subRecordsNamed(
        std::string_view recordName) const;
};

// =============================================================================
// HistoryTree
// =============================================================================

/// @brief Arena-backed history tree.
class HistoryTree {
public:
    HistoryTree() = default;

    /// @brief Add a node, optionally as the last child of parent.
    /// @return Arena index of the new node.
    /// @throws CyclicHistoryError if the identifier is already present.
    /// @throws UsageError if parent is not a valid index.
    std::size_t addNode(HistoryNode node, std::optional<std::size_t> parent);

    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

    /// @brief The current state.
    /// @throws UsageError on an empty tree.
    [[nodiscard]] const HistoryNode& root() const;

    [[nodiscard]] const HistoryNode& node(std::size_t index) const { return nodes_.at(index); }

    [[nodiscard]] const std::vector<HistoryNode>& nodes() const noexcept { return nodes_; }

    /// @brief Arena index of a node identifier.
    [[nodiscard]] std::optional<std::size_t> indexOf(std::uint32_t id) const noexcept;

    /// @brief Node with the given identifier, or nullptr.
    [[nodiscard]] const HistoryNode* findById(std::uint32_t id) const noexcept;

    /// @brief Pre-order traversal: root, then children left to right.
    [[nodiscard]] std::vector<const HistoryNode*> walk() const;

    /// @brief Number of edges on the longest root-to-leaf path.
    [[nodiscard]] std::size_t height() const;

private:
    std::vector<HistoryNode> nodes_;
    std::unordered_map<std::uint32_t, std::size_t> idIndex_;
};

/// @brief Build a tree from the history markup.
/// @param markup <HistoryTree> wrapper or a single root <Node>.
/// @param maxDepth Deepest node level accepted (root is level 0).
/// @throws MarkupError on a malformed node or several roots.
/// @throws CyclicHistoryError if an identifier repeats.
/// @throws NestingTooDeepError beyond maxDepth.
[[nodiscard]] HistoryTree buildHistoryTree(const markup::MarkupNode& markup,
                                           std::uint32_t maxDepth);

}  // namespace sgff::model

#endif  // SGFF_MODEL_HISTORY_TREE_H
