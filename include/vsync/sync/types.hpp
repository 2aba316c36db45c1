#pragma once

#include "vsync/core/error.hpp"
#include "vsync/version/version.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vsync::sync {

using VersionSpec = version::VersionSpec;

enum class DriftStatus {
    InSync,        ///< Version bumped, or nothing changed
    New,           ///< File absent at baseline, head version taken as new
    Drift,         ///< Content changed without a version increase
    Mismatch,      ///< Head version differs from the declared current_version
    Failed         ///< Entry could not be evaluated (see DriftRow::error)
};

const char* drift_status_name(DriftStatus status);

/**
 * @brief Outcome for one configured file
 */
struct DriftRow {
    std::string file;
    std::optional<VersionSpec> baseline_version;  ///< Unset when file is new
    std::optional<VersionSpec> head_version;
    std::string baseline_raw;
    std::string head_raw;
    bool in_sync = false;           ///< Version/content rule only
    bool content_changed = false;
    bool matches_declared = true;   ///< head_version == declared current_version
    std::optional<Error> error;

    [[nodiscard]] DriftStatus status() const;

    /// In sync, consistent with the declared version, and evaluated without error
    [[nodiscard]] bool ok() const { return !error && in_sync && matches_declared; }
};

/**
 * @brief Rows in entry order, one per configured file
 */
struct DriftReport {
    std::string baseline;
    std::string head;
    std::vector<DriftRow> rows;

    [[nodiscard]] bool ok() const;

    [[nodiscard]] std::vector<const DriftRow*> offending() const;

    [[nodiscard]] std::size_t count(DriftStatus status) const;
};

} // namespace vsync::sync
