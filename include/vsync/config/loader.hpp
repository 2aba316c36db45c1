#pragma once

#include "vsync/config/types.hpp"
#include "vsync/core/result.hpp"
#include "vsync/version/parser.hpp"

#include <string>

namespace vsync::config {

inline constexpr const char* kBumpversionSection = "bumpversion";

/**
 * @brief Parse .bumpversion.cfg text into a VersionConfig
 *
 * @param text       Config file contents
 * @param config_dir Repo-relative directory of the config file ("" for the
 *                   root); target paths are resolved against it
 * @param parser     Parser used for current_version; the default pattern is
 *                   tried when it does not accept the bare value
 *
 * @return Config error when the text is not INI, lacks [bumpversion] or
 *         current_version, or current_version does not parse
 */
Result<VersionConfig> load_bumpversion_config(const std::string& text,
                                              const std::string& config_dir,
                                              const version::VersionParser& parser);

/// Sample configuration printed by `version_sync --example-config`
const char* example_config();

} // namespace vsync::config
