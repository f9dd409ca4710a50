// =============================================================================
// sgff - Alignable Sequences
// =============================================================================
// Typed view over the <AlignableSequences> markup of block type 17: the
// reference sequences a file has been aligned against.
// =============================================================================

#ifndef SGFF_MODEL_ALIGNMENT_H
#define SGFF_MODEL_ALIGNMENT_H

#include <string>
#include <utility>
#include <vector>

#include "sgff/markup/markup.h"

namespace sgff::model {

struct AlignableSequence {
    std::string name;
    std::string sequence;

    /// @brief Every attribute of the <Sequence> element, in document order.
    std::vector<std::pair<std::string, std::string>> attributes;

    [[nodiscard]] bool operator==(const AlignableSequence&) const = default;
};

/// @throws MarkupError unless the root is <AlignableSequences>.
[[nodiscard]] std::vector<AlignableSequence> parseAlignableSequences(
    const markup::MarkupNode& root);

}  // namespace sgff::model

#endif  // SGFF_MODEL_ALIGNMENT_H
