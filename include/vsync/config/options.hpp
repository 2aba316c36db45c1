#pragma once

#include "vsync/config/types.hpp"
#include "vsync/core/result.hpp"
#include "vsync/version/parser.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vsync::config {

/// Tried in order when no baseline is given
inline const std::vector<std::string> kFallbackBaselines = {"origin/main", "origin/master"};

inline constexpr const char* kDefaultConfigFile = ".bumpversion.cfg";
inline constexpr const char* kDefaultHead = "HEAD";

/**
 * @brief Everything a check or merge run depends on
 *
 * Built by the CLI (arguments + environment) and passed explicitly into
 * the engine, so nothing below the CLI reads process state.
 */
struct CheckerOptions {
    std::optional<std::string> baseline;           ///< Unset → kFallbackBaselines
    std::string head = kDefaultHead;
    std::string repo_path = ".";
    std::string config_file = kDefaultConfigFile;  ///< Repo-relative
    std::string version_file;                      ///< Empty → config_file
    std::string version_regex = version::kDefaultVersionPattern;
    std::vector<std::string> files;                ///< Overrides config entries when non-empty
    std::vector<std::string> file_regexes;
    std::string merge_strategy = "higher";
    std::string log_level = "info";
    bool parallel = false;
    bool json_output = false;

    [[nodiscard]] const std::string& effective_version_file() const {
        return version_file.empty() ? config_file : version_file;
    }
};

/**
 * @brief Overlay VERSION_BASE, VERSION_CURRENT, VERSION_FILE, VERSION_REGEX,
 *        VERSION_CONFIG_FILE and REPO_PATH onto options
 *
 * @param getenv Lookup returning nullptr for unset variables
 */
void apply_environment(CheckerOptions& options,
                       const std::function<const char*(const char*)>& getenv);

/**
 * @brief Pad or truncate regexes so there is exactly one per file
 *
 * Missing regexes default to default_regex; extras are dropped.
 */
std::vector<std::string> reconcile_file_regexes(const std::vector<std::string>& files,
                                                std::vector<std::string> file_regexes,
                                                const std::string& default_regex);

/**
 * @brief Entry list for a run
 *
 * Entry 0 is the version file searched with the version regex. It is
 * followed by options.files (with options.file_regexes) when given,
 * otherwise by the config's declared entries.
 *
 * @param config May be null when no usable config exists; then the
 *               declared version is read from the version file at head
 *               by the caller
 */
std::vector<ConfigEntry> build_entries(const CheckerOptions& options,
                                       const VersionConfig* config,
                                       const version::VersionSpec& declared_version);

} // namespace vsync::config
