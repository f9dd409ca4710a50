// =============================================================================
// sgff - SnapGene File Reader
// =============================================================================
// Entry point for decoding: header, top-level TLV stream, history tree.
//
// Usage:
//   SgffReader reader;
//   auto container = reader.parse(bytes);
//   if (!container) {
//       SGFF_LOG_ERROR("{}", container.error().describe());
//   }
//
// All codec exceptions are converted to Result at this boundary; the Error
// names the failing block type and offset where one is known.
// =============================================================================

#ifndef SGFF_FORMAT_SGFF_READER_H
#define SGFF_FORMAT_SGFF_READER_H

#include <filesystem>

#include "sgff/common/config.h"
#include "sgff/common/error.h"
#include "sgff/common/types.h"
#include "sgff/format/container.h"

namespace sgff::format {

class SgffReader {
public:
    explicit SgffReader(ParseOptions options = {}) : options_(options) {}

    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

    /// @brief Decode a complete file held in memory.
    /// @return Container, or the first error (kInvalidArgument for bad options).
    [[nodiscard]] Result<Container> parse(ByteSpan data) const;

    /// @brief Read a file into memory and decode it.
    [[nodiscard]] Result<Container> readFile(const std::filesystem::path& path) const;

private:
    ParseOptions options_;
};

}  // namespace sgff::format

#endif  // SGFF_FORMAT_SGFF_READER_H
