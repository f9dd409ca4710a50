// =============================================================================
// sgff - Feature Annotations Implementation
// =============================================================================

#include "sgff/model/feature.h"

#include <algorithm>

#include <fmt/format.h>

#include "sgff/common/error.h"

namespace sgff::model {

namespace {

FeatureSegment parseSegment(const markup::MarkupNode& element, std::string_view featureName) {
    const std::string rangeText = element.attributeOr("range", "");
    auto range = markup::parseRange(rangeText);
    if (!range || (range->first == 0 && range->second == 0)) {
        throw MarkupError(
            fmt::format("feature '{}' has a malformed segment range '{}'", featureName, rangeText));
    }

    auto [low, high] = std::minmax(range->first, range->second);
    FeatureSegment segment;
    segment.start = low == 0 ? 0 : low - 1;
    segment.end = high;
    segment.color = element.attributeOr("color", "");
    segment.type = element.attributeOr("type", "");
    return segment;
}

/// @brief Value of one <V> element.
std::string qualifierValue(const markup::MarkupNode& value) {
    for (std::string_view key : {"text", "int", "predef"}) {
        if (const std::string* attr = value.attribute(key)) {
            return *attr;
        }
    }
    return value.text;
}

std::pair<std::string, std::string> parseQualifier(const markup::MarkupNode& element) {
    std::string joined;
    for (const auto* value : element.childrenNamed("V")) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += qualifierValue(*value);
    }
    return {element.attributeOr("name", ""), std::move(joined)};
}

Feature parseFeature(const markup::MarkupNode& element) {
    Feature feature;
    feature.name = element.attributeOr("name", "");
    feature.type = element.attributeOr("type", "");
    feature.color = element.attributeOr("color", "");

    if (element.attribute("directionality") != nullptr) {
        auto direction = markup::attributeAsUnsigned(element, "directionality");
        if (!direction || *direction > static_cast<std::uint64_t>(Strand::kBoth)) {
            throw MarkupError(fmt::format("feature '{}' has unknown directionality '{}'",
                                          feature.name,
                                          element.attributeOr("directionality", "")));
        }
        feature.strand = static_cast<Strand>(*direction);
    }

    for (const auto* segment : element.childrenNamed("Segment")) {
        feature.segments.push_back(parseSegment(*segment, feature.name));
    }
    for (const auto* qualifier : element.childrenNamed("Q")) {
        feature.qualifiers.push_back(parseQualifier(*qualifier));
    }
    return feature;
}

}  // namespace

std::uint64_t Feature::start() const noexcept {
    if (segments.empty()) {
        return 0;
    }
    return std::min_element(segments.begin(), segments.end(),
                            [](const auto& a, const auto& b) { return a.start < b.start; })
        ->start;
}

std::uint64_t Feature::end() const noexcept {
    if (segments.empty()) {
        return 0;
    }
    return std::max_element(segments.begin(), segments.end(),
                            [](const auto& a, const auto& b) { return a.end < b.end; })
        ->end;
}

const std::string* Feature::qualifier(std::string_view key) const noexcept {
    for (const auto& [name, value] : qualifiers) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

std::vector<Feature> parseFeatures(const markup::MarkupNode& root) {
    if (root.name != "Features") {
        throw MarkupError(fmt::format("expected <Features>, found <{}>", root.name));
    }

    std::vector<Feature> features;
    for (const auto* element : root.childrenNamed("Feature")) {
        features.push_back(parseFeature(*element));
    }
    return features;
}

}  // namespace sgff::model
