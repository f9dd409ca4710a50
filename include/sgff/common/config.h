// =============================================================================
// sgff - Codec Options
// =============================================================================
// Options accepted by SgffReader::parse and SgffWriter::serialize.
// =============================================================================

#ifndef SGFF_COMMON_CONFIG_H
#define SGFF_COMMON_CONFIG_H

#include <cstdint>
#include <string_view>

#include "sgff/common/error.h"

namespace sgff {

// =============================================================================
// Defaults
// =============================================================================

/// @brief Default nested-container recursion budget.
inline constexpr std::uint32_t kDefaultMaxNestingDepth = 8;

/// @brief Default depth bound for the history tree.
inline constexpr std::uint32_t kDefaultMaxHistoryDepth = 4096;

/// @brief Upper bound accepted for either depth option.
inline constexpr std::uint32_t kMaxDepthLimit = 1u << 16;

/// @brief Default LZMA preset used when a nested payload must be recompressed.
inline constexpr std::uint32_t kDefaultLzmaPreset = 6;

/// @brief Highest LZMA preset (xz -9).
inline constexpr std::uint32_t kMaxLzmaPreset = 9;

/// @brief Default zlib level for trace chunks written with zlib framing.
inline constexpr int kDefaultZlibLevel = 6;

// =============================================================================
// Trace Compression Enumeration
// =============================================================================

/// @brief Framing chosen for trace chunks that have to be re-encoded.
enum class TraceCompression : std::uint8_t {
    /// @brief Selector 0x00, literal body.
    kRaw = 0,

    /// @brief Selector 0x02, zlib-compressed body.
    kZlib = 1
};

[[nodiscard]] constexpr std::string_view traceCompressionToString(TraceCompression mode) noexcept {
    switch (mode) {
        case TraceCompression::kRaw:
            return "raw";
        case TraceCompression::kZlib:
            return "zlib";
    }
    return "unknown";
}

// =============================================================================
// ParseOptions
// =============================================================================

/// @brief Options controlling SgffReader::parse.
struct ParseOptions {
    /// @brief Maximum nesting depth of containers (types 11, 16, 30).
    std::uint32_t maxNestingDepth = kDefaultMaxNestingDepth;

    /// @brief Maximum depth of the history tree built from block 7.
    std::uint32_t maxHistoryDepth = kDefaultMaxHistoryDepth;

    /// @brief Decode top-level blocks on TBB worker threads.
    /// @note Output order and the reported error are identical to a sequential parse.
    bool parallelNestedDecode = false;

    /// @brief Validate the options.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool operator==(const ParseOptions& other) const noexcept = default;
};

// =============================================================================
// SerializeOptions
// =============================================================================

/// @brief Options controlling SgffWriter::serialize.
struct SerializeOptions {
    /// @brief LZMA preset (0-9) for nested payloads that are recompressed.
    std::uint32_t lzmaPreset = kDefaultLzmaPreset;

    /// @brief Framing for trace chunks without reusable original bytes.
    TraceCompression traceCompression = TraceCompression::kRaw;

    /// @brief zlib level used with TraceCompression::kZlib.
    int zlibLevel = kDefaultZlibLevel;

    /// @brief Emit the original compressed bytes when content is unchanged.
    bool reuseOriginalCompression = true;

    /// @brief Validate the options.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool operator==(const SerializeOptions& other) const noexcept = default;
};

}  // namespace sgff

#endif  // SGFF_COMMON_CONFIG_H
