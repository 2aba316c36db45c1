#include "vsync/sync/drift_detector.hpp"
#include "vsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>

namespace vsync::sync {

DriftDetector::DriftDetector(const vcs::SnapshotReader& reader,
                             version::PatternResolver resolver,
                             events::EventBus* bus)
    : reader_(reader), resolver_(std::move(resolver)), bus_(bus) {}

DriftRow DriftDetector::check_entry(const config::ConfigEntry& entry,
                                    const std::string& baseline,
                                    const std::string& head) const {
    DriftRow row;
    row.file = entry.target_file;

    auto spec = resolver_.build(entry, entry.current_version);
    if (spec.is_error()) {
        row.error = spec.error();
        return row;
    }

    auto head_text = reader_.read_at(entry.target_file, head);
    if (head_text.is_error()) {
        row.error = head_text.error();
        return row;
    }

    auto head_found = resolver_.locate(spec.value(), head_text.value(), entry.target_file, head);
    if (head_found.is_error()) {
        row.error = head_found.error();
        return row;
    }
    row.head_version = head_found.value().parsed;
    row.head_raw = head_found.value().raw_match;
    row.matches_declared = entry.current_version.empty() || *row.head_version == entry.current_version;

    auto base_text = reader_.read_at(entry.target_file, baseline);
    if (base_text.is_error()) {
        if (base_text.error().is(ErrorKind::NotFound)) {
            spdlog::warn("{} not found at {}, assuming a new file", entry.target_file, baseline);
            row.content_changed = true;
            row.in_sync = true;
            return row;
        }
        row.error = base_text.error();
        return row;
    }
    row.content_changed = base_text.value() != head_text.value();

    auto base_found = resolver_.locate(spec.value(), base_text.value(), entry.target_file, baseline);
    if (base_found.is_error()) {
        row.error = base_found.error();
        return row;
    }
    row.baseline_version = base_found.value().parsed;
    row.baseline_raw = base_found.value().raw_match;

    // Equal versions are only acceptable when nothing else changed either
    const int order = row.head_version->compare(*row.baseline_version);
    row.in_sync = order > 0 || (order == 0 && !row.content_changed);
    return row;
}

DriftReport DriftDetector::detect(const std::vector<config::ConfigEntry>& entries,
                                  const std::string& baseline,
                                  const std::string& head,
                                  const DetectOptions& options) const {
    const auto started = std::chrono::steady_clock::now();

    DriftReport report;
    report.baseline = baseline;
    report.head = head;
    report.rows.reserve(entries.size());

    if (options.parallel && entries.size() > 1) {
        std::vector<std::future<DriftRow>> pending;
        pending.reserve(entries.size());
        for (const auto& entry : entries) {
            pending.push_back(std::async(std::launch::async, [this, &entry, &baseline, &head]() {
                return check_entry(entry, baseline, head);
            }));
        }
        for (auto& future : pending) {
            report.rows.push_back(future.get());
        }
    } else {
        for (const auto& entry : entries) {
            report.rows.push_back(check_entry(entry, baseline, head));
        }
    }

    if (bus_ != nullptr) {
        for (const auto& row : report.rows) {
            if (row.error) {
                bus_->emit(events::EntryFailedEvent{row.file, *row.error});
            }
            bus_->emit(events::DriftCheckedEvent{row, baseline, head});
        }

        events::CheckCompletedEvent completed;
        completed.baseline = baseline;
        completed.head = head;
        completed.entries = report.rows.size();
        completed.offending = report.offending().size();
        completed.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        bus_->emit(completed);
    }

    return report;
}

} // namespace vsync::sync
