// =============================================================================
// sgff - SnapGene File Reader Implementation
// =============================================================================

#include "sgff/format/sgff_reader.h"

#include <fstream>
#include <iterator>

#include <fmt/format.h>

#include "sgff/common/logger.h"
#include "sgff/format/block_codec.h"

namespace sgff::format {

Result<Container> SgffReader::parse(ByteSpan data) const {
    if (auto valid = options_.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    return tryExecute([&]() -> Container {
        const Header header = parseHeader(data);
        SGFF_LOG_DEBUG("header: {} file, export version {}, import version {}",
                       sequenceKindToString(header.kind), header.exportVersion,
                       header.importVersion);

        const DecodeContext ctx{options_};
        Container container(header, parseBlocks(data.subspan(kHeaderSize), ctx, kHeaderSize));
        unwrapOrThrow(container.rebuildHistoryTree(options_.maxHistoryDepth));

        if (auto unknown = container.undecodedTypes(); !unknown.empty()) {
            SGFF_LOG_INFO("{} block type(s) kept as raw bytes", unknown.size());
        }
        SGFF_LOG_DEBUG("parsed {} top-level blocks from {} bytes", container.blocks().size(),
                       data.size());
        return container;
    });
}

Result<Container> SgffReader::readFile(const std::filesystem::path& path) const {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return makeError<Container>(ErrorCode::kIOError,
                                    fmt::format("failed to open {}", path.string()));
    }

    ByteBuffer data{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return makeError<Container>(ErrorCode::kIOError,
                                    fmt::format("failed to read {}", path.string()));
    }

    SGFF_LOG_DEBUG("read {} bytes from {}", data.size(), path.string());
    return parse(data);
}

}  // namespace sgff::format
