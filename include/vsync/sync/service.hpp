#pragma once

#include "vsync/config/options.hpp"
#include "vsync/config/types.hpp"
#include "vsync/core/result.hpp"
#include "vsync/events/event_bus.hpp"
#include "vsync/sync/conflict.hpp"
#include "vsync/sync/types.hpp"
#include "vsync/vcs/repository.hpp"
#include "vsync/version/parser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vsync::sync {

/**
 * @brief Outcome of resolving one conflicted, version-managed file
 */
struct MergeFileResult {
    std::string file;
    std::optional<ConflictResolution> resolution;  ///< Unset when error is set
    std::optional<Error> error;

    [[nodiscard]] bool ok() const { return !error && resolution && resolution->fully_resolved(); }
};

struct MergeReport {
    std::string strategy;
    std::vector<MergeFileResult> files;
    std::vector<std::string> untouched;  ///< Unmerged paths that are not version-managed

    [[nodiscard]] bool ok() const;
};

/**
 * @brief Runs the check and merge commands against one repository
 *
 * Owns nothing but the options; the repository and the bus are borrowed and
 * must outlive the service.
 */
class CheckService {
public:
    CheckService(const vcs::VersionControl& vcs,
                 config::CheckerOptions options,
                 events::EventBus* bus = nullptr);

    /**
     * @brief The explicit baseline, or the first existing fallback branch
     * @return IO error for an unknown explicit baseline, Config error when
     *         no fallback exists
     */
    Result<std::string> resolve_baseline() const;

    /**
     * @brief Entries to check, built from the config as it exists at revision
     *
     * An unreadable or invalid config is not fatal: the declared version is
     * then read from the version file and only the version file (plus any
     * --files) is checked.
     */
    Result<std::vector<config::ConfigEntry>> load_entries(const std::string& revision,
                                                          const version::VersionParser& parser) const;

    /// Drift report between the resolved baseline and options.head
    Result<DriftReport> check() const;

    /**
     * @brief Resolve version conflicts in unmerged, version-managed files
     * @param work_tree Directory the repo-relative paths are resolved against
     */
    Result<MergeReport> merge(const std::filesystem::path& work_tree) const;

    [[nodiscard]] const config::CheckerOptions& options() const noexcept { return options_; }

private:
    Result<version::VersionSpec> declared_version_from_file(const std::string& revision,
                                                            const version::VersionParser& parser) const;

    const vcs::VersionControl& vcs_;
    config::CheckerOptions options_;
    events::EventBus* bus_;
};

} // namespace vsync::sync
