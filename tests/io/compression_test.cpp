// =============================================================================
// sgff - Compression Primitive Tests
// =============================================================================

#include "sgff/io/compression.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

#include "sgff/common/error.h"
#include "sgff/io/byte_io.h"

namespace sgff::io {
namespace {

TEST(CompressionTest, LzmaRestoresInput) {
    const std::string text = "<HistoryTree><Node ID=\"0\" name=\"pUC19.dna\"/></HistoryTree>";
    const ByteBuffer packed = lzmaCompress(asBytes(text), 6);
    EXPECT_EQ(toString(lzmaDecompress(packed)), text);
}

TEST(CompressionTest, LzmaRejectsGarbage) {
    const ByteBuffer garbage{0x00, 0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW((void)lzmaDecompress(garbage), DecompressionError);
}

TEST(CompressionTest, ZlibRejectsTruncatedStream) {
    const std::string text(512, 'G');
    ByteBuffer packed = zlibDeflate(asBytes(text), 6);
    packed.resize(packed.size() / 2);
    EXPECT_THROW((void)zlibInflate(packed), DecompressionError);
}

TEST(CompressionTest, DigestDistinguishesContent) {
    EXPECT_EQ(digest(asBytes("ATGC")), digest(asBytes("ATGC")));
    EXPECT_NE(digest(asBytes("ATGC")), digest(asBytes("ATGG")));
}

RC_GTEST_PROP(CompressionProperty, ZlibRoundTrip, (const std::vector<std::uint8_t>& data)) {
    const auto level = *rc::gen::inRange(0, 10);
    RC_ASSERT(zlibInflate(zlibDeflate(data, level)) == data);
}

}  // namespace
}  // namespace sgff::io
