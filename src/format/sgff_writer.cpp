// =============================================================================
// sgff - SnapGene File Writer Implementation
// =============================================================================
// writeFile uses a temporary file + rename so a failed write never leaves a
// partial file at the destination.
// =============================================================================

#include "sgff/format/sgff_writer.h"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "sgff/common/logger.h"
#include "sgff/format/block_codec.h"

namespace sgff::format {

Result<ByteBuffer> SgffWriter::serialize(const Container& container) const {
    if (auto valid = options_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    return tryExecute([&]() -> ByteBuffer {
        io::ByteWriter writer;
        writeHeader(container.header(), writer);
        writeBlocks(container.blocks(), writer, EncodeContext{options_});
        SGFF_LOG_DEBUG("serialized {} top-level blocks into {} bytes",
                       container.blocks().size(), writer.size());
        return writer.release();
    });
}

VoidResult SgffWriter::writeFile(const Container& container,
                                 const std::filesystem::path& path) const {
    auto bytes = serialize(container);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    const std::filesystem::path tempPath = path.string() + ".tmp";
    {
        std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
        if (!stream) {
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("failed to create {}", tempPath.string()));
        }
        stream.write(reinterpret_cast<const char*>(bytes->data()),
                     static_cast<std::streamsize>(bytes->size()));
        stream.flush();
        if (!stream) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("failed to write {}", tempPath.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        return makeVoidError(ErrorCode::kIOError, fmt::format("failed to rename {} to {}: {}",
                                                              tempPath.string(), path.string(),
                                                              ec.message()));
    }

    SGFF_LOG_INFO("wrote {} bytes to {}", bytes->size(), path.string());
    return makeVoidSuccess();
}

}  // namespace sgff::format
