// =============================================================================
// sgff - Primers
// =============================================================================
// Typed view over the <Primers> markup of block type 5.
//
// Binding-site locations are stored 0-based inclusive ("0-5") and exposed
// like feature segments: a 0-based start with a 1-based end ({0, 6}).
// =============================================================================

#ifndef SGFF_MODEL_PRIMER_H
#define SGFF_MODEL_PRIMER_H

#include <cstdint>
#include <string>
#include <vector>

#include "sgff/common/types.h"
#include "sgff/markup/markup.h"

namespace sgff::model {

struct BindingSite {
    std::uint64_t start = 0;  ///< 0-based
    std::uint64_t end = 0;    ///< 1-based, inclusive
    Strand strand = Strand::kForward;

    [[nodiscard]] bool operator==(const BindingSite&) const = default;
};

struct Primer {
    std::string name;
    std::string sequence;
    std::string description;
    std::vector<BindingSite> bindingSites;

    [[nodiscard]] bool operator==(const Primer&) const = default;
};

/// @throws MarkupError for a wrong root or a malformed binding site.
[[nodiscard]] std::vector<Primer> parsePrimers(const markup::MarkupNode& root);

}  // namespace sgff::model

#endif  // SGFF_MODEL_PRIMER_H
