// =============================================================================
// sgff - Primers Implementation
// =============================================================================

#include "sgff/model/primer.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::model {

namespace {

BindingSite parseBindingSite(const markup::MarkupNode& element, const std::string& primerName) {
    const std::string location = element.attributeOr("location", "");
    auto range = markup::parseRange(location);
    if (!range) {
        throw MarkupError(fmt::format("primer '{}' has a malformed binding site location '{}'",
                                      primerName, location));
    }

    // Locations are 0-based and inclusive in the markup.
    auto [low, high] = std::minmax(range->first, range->second);
    BindingSite site;
    site.start = low;
    site.end = high + 1;
    site.strand = element.attributeOr("boundStrand", "0") == "1" ? Strand::kReverse
                                                                 : Strand::kForward;
    return site;
}

}  // namespace

std::vector<Primer> parsePrimers(const markup::MarkupNode& root) {
    if (root.name != "Primers") {
        throw MarkupError(fmt::format("expected <Primers>, found <{}>", root.name));
    }

    std::vector<Primer> primers;
    for (const auto* element : root.childrenNamed("Primer")) {
        Primer primer;
        primer.name = element->attributeOr("name", "");
        primer.sequence = element->attributeOr("sequence", "");
        primer.description = element->attributeOr("description", "");
        for (const auto* site : element->childrenNamed("BindingSite")) {
            primer.bindingSites.push_back(parseBindingSite(*site, primer.name));
        }
        primers.push_back(std::move(primer));
    }
    return primers;
}

}  // namespace sgff::model
