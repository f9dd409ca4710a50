// =============================================================================
// sgff - Alignable Sequences Implementation
// =============================================================================

#include "sgff/model/alignment.h"

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::model {

std::vector<AlignableSequence> parseAlignableSequences(const markup::MarkupNode& root) {
    if (root.name != "AlignableSequences") {
        throw MarkupError(fmt::format("expected <AlignableSequences>, found <{}>", root.name));
    }

    std::vector<AlignableSequence> sequences;
    for (const auto* element : root.childrenNamed("Sequence")) {
        AlignableSequence entry;
        entry.name = element->attributeOr("name", "");
        entry.sequence = element->attributeOr("sequence", "");
        entry.attributes = element->attributes;
        sequences.push_back(std::move(entry));
    }
    return sequences;
}

}  // namespace sgff::model
