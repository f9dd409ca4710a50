// =============================================================================
// sgff - Feature Annotations
// =============================================================================
// Typed view over the <Features> markup of block type 10.
//
// Segment ranges are stored 1-based inclusive in the markup ("11-20") and
// exposed as a 0-based start with a 1-based end ({10, 20}).
// =============================================================================

#ifndef SGFF_MODEL_FEATURE_H
#define SGFF_MODEL_FEATURE_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sgff/common/types.h"
#include "sgff/markup/markup.h"

namespace sgff::model {

/// @brief One location range of a feature.
struct FeatureSegment {
    std::uint64_t start = 0;  ///< 0-based
    std::uint64_t end = 0;    ///< 1-based, inclusive
    std::string color;
    std::string type;

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }
    [[nodiscard]] bool operator==(const FeatureSegment&) const = default;
};

/// @brief One annotation.
struct Feature {
    std::string name;
    std::string type;
    Strand strand = Strand::kNone;
    std::string color;
    std::vector<FeatureSegment> segments;

    /// @brief Qualifier name -> value; multiple values are joined with ','.
    std::vector<std::pair<std::string, std::string>> qualifiers;

    /// @brief Smallest segment start (0 without segments).
    [[nodiscard]] std::uint64_t start() const noexcept;

    /// @brief Largest segment end (0 without segments).
    [[nodiscard]] std::uint64_t end() const noexcept;

    [[nodiscard]] std::uint64_t length() const noexcept { return end() - start(); }

    /// @brief Qualifier value, or nullptr.
    [[nodiscard]] const std::string* qualifier(std::string_view key) const noexcept;

    [[nodiscard]] bool operator==(const Feature&) const = default;
};

/// @brief Extract the features from a <Features> document.
/// @throws MarkupError for a wrong root, a bad range or an unknown direction.
[[nodiscard]] std::vector<Feature> parseFeatures(const markup::MarkupNode& root);

}  // namespace sgff::model

#endif  // SGFF_MODEL_FEATURE_H
