#pragma once

#include "vsync/core/result.hpp"

#include <set>
#include <string>

namespace vsync::vcs {

/// Revision name that refers to the working tree instead of a commit
inline constexpr const char* kWorkingTree = "WORKTREE";

/**
 * @brief Read-only view of a version-control system
 *
 * The engine only reads snapshots through this interface. Writes to the
 * working tree (conflict resolution) go straight to the filesystem.
 */
class VersionControl {
public:
    virtual ~VersionControl() = default;

    /**
     * @brief Blob content of path as it existed at ref
     * @return NotFound when path did not exist at ref, IO on any other failure
     */
    virtual Result<std::string> file_at_revision(const std::string& path,
                                                 const std::string& ref) const = 0;

    /// Paths that differ between ref_a and ref_b
    virtual Result<std::set<std::string>> diff_name_only(const std::string& ref_a,
                                                         const std::string& ref_b) const = 0;

    /// Symbolic name (branch) or commit id of the checked-out revision
    virtual Result<std::string> current_ref() const = 0;

    virtual bool has_revision(const std::string& ref) const = 0;

    /// Paths with unresolved merge conflicts in the index
    virtual Result<std::set<std::string>> unmerged_paths() const = 0;
};

} // namespace vsync::vcs
