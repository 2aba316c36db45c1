/**
 * @file components.hpp
 * @brief Event-driven components for check and merge runs
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components automatically react to drift and conflict events
 */

#pragma once

#include "vsync/events/event_bus.hpp"
#include "vsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace vsync::events {

namespace detail {

inline std::string version_or_dash(const std::optional<sync::VersionSpec>& version) {
    return version ? version->to_string() : std::string("-");
}

} // namespace detail

/**
 * @brief Logger component - logs drift rows and conflict outcomes
 *
 * In-sync rows log at info, drift and failures at error, so a plain
 * `version_sync` run reads like a checklist.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<DriftCheckedEvent>([this](const DriftCheckedEvent& e) {
            on_drift_checked(e);
        });

        bus_.subscribe<EntryFailedEvent>([this](const EntryFailedEvent& e) {
            on_entry_failed(e);
        });

        bus_.subscribe<CheckCompletedEvent>([this](const CheckCompletedEvent& e) {
            on_check_completed(e);
        });

        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent& e) {
            on_conflict_resolved(e);
        });

        bus_.subscribe<ConflictManualEvent>([this](const ConflictManualEvent& e) {
            on_conflict_manual(e);
        });

        bus_.subscribe<MalformedConflictEvent>([this](const MalformedConflictEvent& e) {
            on_malformed_conflict(e);
        });
    }

private:
    void on_drift_checked(const DriftCheckedEvent& e) {
        const auto& row = e.row;
        const auto status = row.status();
        if (status == sync::DriftStatus::Failed) {
            return;  // reported by on_entry_failed
        }
        if (row.ok()) {
            spdlog::info("[{}] {} {} -> {}", sync::drift_status_name(status), row.file,
                         detail::version_or_dash(row.baseline_version),
                         detail::version_or_dash(row.head_version));
        } else {
            spdlog::error("[{}] {} {} -> {} (content {})", sync::drift_status_name(status), row.file,
                          detail::version_or_dash(row.baseline_version),
                          detail::version_or_dash(row.head_version),
                          row.content_changed ? "changed" : "unchanged");
        }
    }

    void on_entry_failed(const EntryFailedEvent& e) {
        spdlog::error("[error] {}: {}", e.file, e.error.describe());
    }

    void on_check_completed(const CheckCompletedEvent& e) {
        spdlog::info("Checked {} file(s) {}..{} in {}ms, {} offending",
                     e.entries, e.baseline, e.head, e.duration.count(), e.offending);
    }

    void on_conflict_resolved(const ConflictResolvedEvent& e) {
        spdlog::info("[ConflictResolved] {}:{} strategy={} kept={} version={}",
                     e.file, e.start_line, e.strategy, e.kept, e.version);
    }

    void on_conflict_manual(const ConflictManualEvent& e) {
        spdlog::warn("[ConflictManual] {}:{} has no version on either side, resolve by hand",
                     e.file, e.start_line);
    }

    void on_malformed_conflict(const MalformedConflictEvent& e) {
        spdlog::error("[MalformedConflict] {}:{} {}", e.file, e.line, e.reason);
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - tracks statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_checked{0};
        std::atomic<uint64_t> files_in_sync{0};
        std::atomic<uint64_t> files_drifted{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> conflicts_resolved{0};
        std::atomic<uint64_t> conflicts_manual{0};
        std::atomic<uint64_t> conflicts_malformed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<DriftCheckedEvent>([this](const DriftCheckedEvent& e) {
            on_drift_checked(e);
        });

        bus_.subscribe<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) {
            stats_.conflicts_resolved++;
        });

        bus_.subscribe<ConflictManualEvent>([this](const ConflictManualEvent&) {
            stats_.conflicts_manual++;
        });

        bus_.subscribe<MalformedConflictEvent>([this](const MalformedConflictEvent&) {
            stats_.conflicts_malformed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Run Statistics:");
        spdlog::info("  Files checked:   {}", stats_.files_checked.load());
        spdlog::info("  In sync:         {}", stats_.files_in_sync.load());
        spdlog::info("  Drifted:         {}", stats_.files_drifted.load());
        spdlog::info("  Failed:          {}", stats_.files_failed.load());
        spdlog::info("  Conflicts res.:  {}", stats_.conflicts_resolved.load());
        spdlog::info("  Conflicts man.:  {}", stats_.conflicts_manual.load());
        spdlog::info("  Malformed:       {}", stats_.conflicts_malformed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_drift_checked(const DriftCheckedEvent& e) {
        stats_.files_checked++;
        if (e.row.error) {
            stats_.files_failed++;
        } else if (e.row.ok()) {
            stats_.files_in_sync++;
        } else {
            stats_.files_drifted++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace vsync::events
