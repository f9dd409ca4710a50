// =============================================================================
// sgff - Cloning History Tree Implementation
// =============================================================================

#include "sgff/model/history_tree.h"

#include <algorithm>
#include <array>
#include <limits>

#include <fmt/format.h>

#include "sgff/common/error.h"
#include "sgff/common/logger.h"

namespace sgff::model {

namespace {

constexpr std::string_view kNodeElement = "Node";
constexpr std::string_view kTreeElement = "HistoryTree";

struct OperationName {
    HistoryOperation op;
    std::string_view name;
};

constexpr std::array<OperationName, 21> kOperationNames{{
    {HistoryOperation::kInvalid, "invalid"},
    {HistoryOperation::kNewFile, "newFile"},
    {HistoryOperation::kImportFile, "importFile"},
    {HistoryOperation::kAmplifyFragment, "amplifyFragment"},
    {HistoryOperation::kInsertFragment, "insertFragment"},
    {HistoryOperation::kInsertFragments, "insertFragments"},
    {HistoryOperation::kReplace, "replace"},
    {HistoryOperation::kRestrictionCloning, "restrictionCloning"},
    {HistoryOperation::kLigateFragments, "ligateFragments"},
    {HistoryOperation::kGibsonAssembly, "gibsonAssembly"},
    {HistoryOperation::kInFusionCloning, "inFusionCloning"},
    {HistoryOperation::kGoldenGateAssembly, "goldenGateAssembly"},
    {HistoryOperation::kGatewayLRCloning, "gatewayLRCloning"},
    {HistoryOperation::kGatewayBPCloning, "gatewayBPCloning"},
    {HistoryOperation::kTaCloning, "taCloning"},
    {HistoryOperation::kTopoCloning, "topoCloning"},
    {HistoryOperation::kMutagenesis, "mutagenesis"},
    {HistoryOperation::kPrimerDirectedMutagenesis, "primerDirectedMutagenesis"},
    {HistoryOperation::kChangeMethylation, "changeMethylation"},
    {HistoryOperation::kChangeTopology, "changeTopology"},
    {HistoryOperation::kFlip, "flip"},
}};

SequenceKind kindFromString(std::string_view type) noexcept {
    if (type == "RNA") {
        return SequenceKind::kRNA;
    }
    if (type == "Protein") {
        return SequenceKind::kProtein;
    }
    return SequenceKind::kDNA;
}

/// @brief Convert one <Node> element; children are linked by the caller.
HistoryNode makeNode(const markup::MarkupNode& element) {
    auto id = markup::attributeAsUnsigned(element, "ID");
    if (!id || *id > std::numeric_limits<std::uint32_t>::max()) {
        throw MarkupError(fmt::format("history node '{}' has a missing or invalid ID",
                                      element.attributeOr("name", "")));
    }

    HistoryNode node;
    node.id = static_cast<std::uint32_t>(*id);
    node.name = element.attributeOr("name", "");
    node.kind = kindFromString(element.attributeOr("type", "DNA"));
    node.sequenceLength = markup::attributeAsUnsigned(element, "seqLen").value_or(0);
    node.topology = markup::attributeAsBool(element, "circular") ? Topology::kCircular
                                                                 : Topology::kLinear;
    node.strandedness = element.attributeOr("strandedness", "double") == "single"
                            ? Strandedness::kSingle
                            : Strandedness::kDouble;
    node.operationName = element.attributeOr("operation", "invalid");
    node.operation = historyOperationFromString(node.operationName);
    node.upstreamModification = element.attributeOr("upstreamModification", "");
    node.downstreamModification = element.attributeOr("downstreamModification", "");
    node.resurrectable = markup::attributeAsBool(element, "resurrectable");
    node.attributes = element.attributes;

    for (const auto& child : element.children) {
        if (child.name != kNodeElement) {
            node.subRecords.push_back(child);
        }
    }
    return node;
}

}  // namespace

// =============================================================================
// Operations
// =============================================================================

HistoryOperation historyOperationFromString(std::string_view name) noexcept {
    for (const auto& entry : kOperationNames) {
        if (entry.name == name) {
            return entry.op;
        }
    }
    return HistoryOperation::kOther;
}

std::string_view historyOperationToString(HistoryOperation op) noexcept {
    for (const auto& entry : kOperationNames) {
        if (entry.op == op) {
            return entry.name;
        }
    }
    return "other";
}

// =============================================================================
// HistoryNode
// =============================================================================

std::vector<const markup::MarkupNode*> HistoryNode::subRecordsNamed(
    std::string_view recordName) const {
    std::vector<const markup::MarkupNode*> out;
    for (const auto& record : subRecords) {
        if (record.name == recordName) {
            out.push_back(&record);
        }
    }
    return out;
}

// =============================================================================
// HistoryTree
// =============================================================================

std::size_t HistoryTree::addNode(HistoryNode node, std::optional<std::size_t> parent) {
    if (parent && *parent >= nodes_.size()) {
        throw UsageError(fmt::format("parent index {} is out of range for a {}-node tree",
                                     *parent, nodes_.size()));
    }
    if (idIndex_.contains(node.id)) {
        throw CyclicHistoryError(
            fmt::format("history node {} ('{}') appears more than once in the tree", node.id,
                        node.name));
    }

    const std::size_t index = nodes_.size();
    idIndex_.emplace(node.id, index);
    node.children.clear();
    nodes_.push_back(std::move(node));
    if (parent) {
        nodes_[*parent].children.push_back(index);
    }
    return index;
}

const HistoryNode& HistoryTree::root() const {
    if (nodes_.empty()) {
        throw UsageError("history tree is empty");
    }
    return nodes_.front();
}

std::optional<std::size_t> HistoryTree::indexOf(std::uint32_t id) const noexcept {
    auto it = idIndex_.find(id);
    if (it == idIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const HistoryNode* HistoryTree::findById(std::uint32_t id) const noexcept {
    auto index = indexOf(id);
    return index ? &nodes_[*index] : nullptr;
}

std::vector<const HistoryNode*> HistoryTree::walk() const {
    std::vector<const HistoryNode*> order;
    if (nodes_.empty()) {
        return order;
    }

    order.reserve(nodes_.size());
    std::vector<bool> visited(nodes_.size(), false);
    std::vector<std::size_t> stack{0};
    while (!stack.empty()) {
        const std::size_t index = stack.back();
        stack.pop_back();
        if (visited[index]) {
            continue;
        }
        visited[index] = true;
        order.push_back(&nodes_[index]);

        const auto& children = nodes_[index].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return order;
}

std::size_t HistoryTree::height() const {
    if (nodes_.empty()) {
        return 0;
    }

    std::size_t deepest = 0;
    std::vector<std::pair<std::size_t, std::size_t>> stack{{0, 0}};
    while (!stack.empty()) {
        auto [index, depth] = stack.back();
        stack.pop_back();
        deepest = std::max(deepest, depth);
        for (std::size_t child : nodes_[index].children) {
            stack.emplace_back(child, depth + 1);
        }
    }
    return deepest;
}

// =============================================================================
// Builder
// =============================================================================

HistoryTree buildHistoryTree(const markup::MarkupNode& markup, std::uint32_t maxDepth) {
    const markup::MarkupNode* rootElement = nullptr;
    if (markup.name == kNodeElement) {
        rootElement = &markup;
    } else if (markup.name == kTreeElement) {
        auto roots = markup.childrenNamed(kNodeElement);
        if (roots.size() > 1) {
            throw MarkupError(
                fmt::format("history tree declares {} root nodes, expected one", roots.size()));
        }
        if (roots.empty()) {
            return HistoryTree{};
        }
        rootElement = roots.front();
    } else {
        throw MarkupError(fmt::format("unexpected history root element <{}>", markup.name));
    }

    struct Pending {
        const markup::MarkupNode* element;
        std::optional<std::size_t> parent;
        std::uint32_t depth;
    };

    HistoryTree tree;
    std::vector<Pending> stack{{rootElement, std::nullopt, 0}};

    while (!stack.empty()) {
        Pending current = stack.back();
        stack.pop_back();

        if (current.depth > maxDepth) {
            throw NestingTooDeepError(fmt::format(
                "history tree is deeper than the limit of {} levels", maxDepth),
                ErrorContext{}.withDepth(current.depth));
        }

        // addNode rejects an identifier seen earlier in the walk.
        const std::size_t index = tree.addNode(makeNode(*current.element), current.parent);

        auto children = current.element->childrenNamed(kNodeElement);
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back({*it, index, current.depth + 1});
        }
    }

    SGFF_LOG_DEBUG("built history tree: {} nodes, height {}", tree.size(), tree.height());
    return tree;
}

}  // namespace sgff::model
