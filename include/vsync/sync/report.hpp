#pragma once

#include "vsync/sync/service.hpp"
#include "vsync/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace vsync::sync {

/**
 * @brief Fixed-width table, one line per row plus error details and a summary
 */
std::string render_table(const DriftReport& report);

/// Per-file merge outcome lines
std::string render_merge_summary(const MergeReport& report);

nlohmann::json to_json(const Error& error);
nlohmann::json to_json(const DriftRow& row);
nlohmann::json to_json(const DriftReport& report);
nlohmann::json to_json(const ConflictResolution& resolution);
nlohmann::json to_json(const MergeReport& report);

} // namespace vsync::sync
