/**
 * @file events.hpp
 * @brief Event type definitions for version checks and conflict resolution
 *
 * WHY THIS FILE EXISTS:
 * The drift detector and conflict resolver report progress as events so that
 * logging and counting live outside the engine.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: DriftCheckedEvent, ConflictResolvedEvent
 */

#pragma once

#include "vsync/sync/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace vsync::events {

// ════════════════════════════════════════════════════════
// Drift Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per entry after its row is built
 *
 * WHO EMITS:
 * - DriftDetector::detect
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (one line per file)
 * - MetricsComponent (in-sync / drift counters)
 */
struct DriftCheckedEvent {
    sync::DriftRow row;
    std::string baseline;
    std::string head;
    std::chrono::system_clock::time_point timestamp;

    DriftCheckedEvent(sync::DriftRow r, std::string base, std::string hd)
        : row(std::move(r)),
          baseline(std::move(base)),
          head(std::move(hd)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when an entry could not be evaluated
 *
 * The row is still part of the report; this event exists so failures are
 * visible even when nobody renders the report.
 */
struct EntryFailedEvent {
    std::string file;
    Error error;
};

/**
 * @brief Emitted after all entries were checked
 */
struct CheckCompletedEvent {
    std::string baseline;
    std::string head;
    std::size_t entries = 0;
    std::size_t offending = 0;
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted for every conflict block that was resolved automatically
 */
struct ConflictResolvedEvent {
    std::string file;
    std::size_t start_line = 0;
    std::string strategy;
    std::string kept;      ///< "ours", "theirs", "both" or "neither"
    std::string version;   ///< Winning version text (may be empty)
};

/**
 * @brief Emitted for blocks that carry no version and need a human
 */
struct ConflictManualEvent {
    std::string file;
    std::size_t start_line = 0;
};

/**
 * @brief Emitted for unbalanced or missing conflict markers
 */
struct MalformedConflictEvent {
    std::string file;
    std::size_t line = 0;
    std::string reason;
};

} // namespace vsync::events
