#include "vsync/vcs/snapshot_reader.hpp"

#include <spdlog/spdlog.h>

namespace vsync::vcs {

Result<std::string> SnapshotReader::read_at(const std::string& file, const std::string& revision) const {
    auto content = vcs_.file_at_revision(file, revision);
    if (content.is_error()) {
        const auto& error = content.error();
        if (error.is(ErrorKind::NotFound)) {
            spdlog::debug("{} absent at {}", file, revision);
        } else {
            spdlog::warn("Reading {} at {} failed: {}", file, revision, error.message);
        }
        return content;
    }

    spdlog::debug("Read {} bytes of {} at {}", content.value().size(), file, revision);
    return content;
}

} // namespace vsync::vcs
