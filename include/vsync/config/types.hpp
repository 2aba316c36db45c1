#pragma once

#include "vsync/version/version.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vsync::config {

/**
 * @brief One declared target file
 *
 * search/replace are literal bumpversion templates that may contain
 * {current_version} and other {key} references to top-level values.
 */
struct ConfigEntry {
    std::string target_file;                         ///< Repo-relative POSIX path
    std::optional<std::string> search;               ///< Literal template (not a regex)
    std::optional<std::string> replace;
    std::optional<std::string> pattern;              ///< Regex override, used when search is absent
    version::VersionSpec current_version;            ///< Shared top-level current_version
    std::map<std::string, std::string> substitutions; ///< Other top-level {key} values
};

/**
 * @brief Parsed bumpversion configuration
 */
struct VersionConfig {
    std::string raw_current_version;
    version::VersionSpec current_version;
    std::map<std::string, std::string> globals;  ///< All keys of the [bumpversion] section
    std::vector<ConfigEntry> entries;            ///< In declaration order
};

} // namespace vsync::config
