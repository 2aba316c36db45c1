#pragma once

#include "vsync/core/result.hpp"
#include "vsync/vcs/repository.hpp"

#include <string>

namespace vsync::vcs {

/**
 * @brief Reads file text at a revision through a VersionControl
 *
 * NotFound is a normal outcome here (file added after the baseline);
 * callers decide whether it matters.
 */
class SnapshotReader {
public:
    explicit SnapshotReader(const VersionControl& vcs) : vcs_(vcs) {}

    [[nodiscard]] Result<std::string> read_at(const std::string& file, const std::string& revision) const;

    [[nodiscard]] const VersionControl& vcs() const noexcept { return vcs_; }

private:
    const VersionControl& vcs_;
};

} // namespace vsync::vcs
