// =============================================================================
// sgff - Codec Options Implementation
// =============================================================================

#include "sgff/common/config.h"

#include <fmt/format.h>

namespace sgff {

VoidResult ParseOptions::validate() const {
    if (maxNestingDepth == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             "maxNestingDepth must be at least 1");
    }

    if (maxNestingDepth > kMaxDepthLimit) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maxNestingDepth must not exceed {}, got {}",
                                         kMaxDepthLimit, maxNestingDepth));
    }

    if (maxHistoryDepth == 0 || maxHistoryDepth > kMaxDepthLimit) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("maxHistoryDepth must be between 1 and {}, got {}",
                                         kMaxDepthLimit, maxHistoryDepth));
    }

    return makeVoidSuccess();
}

VoidResult SerializeOptions::validate() const {
    if (lzmaPreset > kMaxLzmaPreset) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("lzmaPreset must be between 0 and {}, got {}",
                                         kMaxLzmaPreset, lzmaPreset));
    }

    if (zlibLevel < 0 || zlibLevel > 9) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("zlibLevel must be between 0 and 9, got {}", zlibLevel));
    }

    if (traceCompression != TraceCompression::kRaw &&
        traceCompression != TraceCompression::kZlib) {
        return makeVoidError(ErrorCode::kInvalidArgument, "unknown trace compression mode");
    }

    return makeVoidSuccess();
}

}  // namespace sgff
