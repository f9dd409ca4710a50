// =============================================================================
// sgff - Codec Options Tests
// =============================================================================

#include "sgff/common/config.h"

#include <gtest/gtest.h>

#include <fmt/format.h>

namespace sgff {
namespace {

TEST(ParseOptionsTest, Defaults) {
    ParseOptions options;
    EXPECT_EQ(options.maxNestingDepth, kDefaultMaxNestingDepth);
    EXPECT_EQ(options.maxNestingDepth, 8u);
    EXPECT_EQ(options.maxHistoryDepth, kDefaultMaxHistoryDepth);
    EXPECT_FALSE(options.parallelNestedDecode);
    EXPECT_TRUE(options.validate().has_value());
}

TEST(ParseOptionsTest, RejectsZeroAndExcessiveDepth) {
    ParseOptions options;
    options.maxNestingDepth = 0;
    auto zero = options.validate();
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code(), ErrorCode::kInvalidArgument);

    options.maxNestingDepth = kMaxDepthLimit + 1;
    EXPECT_FALSE(options.validate().has_value());

    options.maxNestingDepth = 4;
    options.maxHistoryDepth = 0;
    EXPECT_FALSE(options.validate().has_value());
}

TEST(SerializeOptionsTest, Defaults) {
    SerializeOptions options;
    EXPECT_EQ(options.lzmaPreset, kDefaultLzmaPreset);
    EXPECT_EQ(options.traceCompression, TraceCompression::kRaw);
    EXPECT_TRUE(options.reuseOriginalCompression);
    EXPECT_TRUE(options.validate().has_value());
}

TEST(SerializeOptionsTest, RejectsOutOfRangeLevels) {
    SerializeOptions options;
    options.lzmaPreset = 10;
    EXPECT_FALSE(options.validate().has_value());

    options.lzmaPreset = 0;
    options.zlibLevel = -1;
    EXPECT_FALSE(options.validate().has_value());

    options.zlibLevel = 9;
    EXPECT_TRUE(options.validate().has_value());
}

TEST(OptionsTest, MessagesNameTheRejectedValue) {
    SerializeOptions serialize;
    serialize.lzmaPreset = 12;
    auto preset = serialize.validate();
    ASSERT_FALSE(preset.has_value());
    EXPECT_EQ(preset.error().message(), "lzmaPreset must be between 0 and 9, got 12");

    ParseOptions parse;
    parse.maxHistoryDepth = 0;
    auto history = parse.validate();
    ASSERT_FALSE(history.has_value());
    EXPECT_EQ(history.error().message(),
              fmt::format("maxHistoryDepth must be between 1 and {}, got 0", kMaxDepthLimit));
}

}  // namespace
}  // namespace sgff
