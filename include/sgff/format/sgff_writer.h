// =============================================================================
// sgff - SnapGene File Writer
// =============================================================================
// Inverse of SgffReader: header, then every block in stored order. Nothing is
// written to disk unless the whole container encodes successfully.
// =============================================================================

#ifndef SGFF_FORMAT_SGFF_WRITER_H
#define SGFF_FORMAT_SGFF_WRITER_H

#include <filesystem>

#include "sgff/common/config.h"
#include "sgff/common/error.h"
#include "sgff/common/types.h"
#include "sgff/format/container.h"

namespace sgff::format {

class SgffWriter {
public:
    explicit SgffWriter(SerializeOptions options = {}) : options_(options) {}

    [[nodiscard]] const SerializeOptions& options() const noexcept { return options_; }

    /// @brief Encode a container into file bytes.
    [[nodiscard]] Result<ByteBuffer> serialize(const Container& container) const;

    /// @brief Encode and write to path (replaces an existing file).
    [[nodiscard]] VoidResult writeFile(const Container& container,
                                       const std::filesystem::path& path) const;

private:
    SerializeOptions options_;
};

}  // namespace sgff::format

#endif  // SGFF_FORMAT_SGFF_WRITER_H
