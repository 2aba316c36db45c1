#pragma once

#include "vsync/config/types.hpp"
#include "vsync/events/event_bus.hpp"
#include "vsync/sync/types.hpp"
#include "vsync/vcs/snapshot_reader.hpp"
#include "vsync/version/pattern.hpp"

#include <string>
#include <vector>

namespace vsync::sync {

struct DetectOptions {
    bool parallel = false;  ///< One task per entry; rows still come back in entry order
};

/**
 * @brief Compares each configured file's version at baseline and head
 *
 * A row is in sync when the head version is greater than the baseline
 * version, or when both versions are equal and the file content did not
 * change. Every entry is evaluated even if earlier ones fail.
 */
class DriftDetector {
public:
    DriftDetector(const vcs::SnapshotReader& reader,
                  version::PatternResolver resolver,
                  events::EventBus* bus = nullptr);

    [[nodiscard]] DriftReport detect(const std::vector<config::ConfigEntry>& entries,
                                     const std::string& baseline,
                                     const std::string& head,
                                     const DetectOptions& options = {}) const;

    /// Evaluate a single entry; detect() is this applied to every entry
    [[nodiscard]] DriftRow check_entry(const config::ConfigEntry& entry,
                                       const std::string& baseline,
                                       const std::string& head) const;

private:
    const vcs::SnapshotReader& reader_;
    version::PatternResolver resolver_;
    events::EventBus* bus_;
};

} // namespace vsync::sync
