#include "vsync/sync/types.hpp"

#include <algorithm>

namespace vsync::sync {

const char* drift_status_name(DriftStatus status) {
    switch (status) {
        case DriftStatus::InSync: return "in-sync";
        case DriftStatus::New: return "new";
        case DriftStatus::Drift: return "drift";
        case DriftStatus::Mismatch: return "mismatch";
        case DriftStatus::Failed: return "error";
    }
    return "unknown";
}

DriftStatus DriftRow::status() const {
    if (error) {
        return DriftStatus::Failed;
    }
    if (!in_sync) {
        return DriftStatus::Drift;
    }
    if (!matches_declared) {
        return DriftStatus::Mismatch;
    }
    return baseline_version ? DriftStatus::InSync : DriftStatus::New;
}

bool DriftReport::ok() const {
    return std::all_of(rows.begin(), rows.end(), [](const DriftRow& row) { return row.ok(); });
}

std::vector<const DriftRow*> DriftReport::offending() const {
    std::vector<const DriftRow*> result;
    for (const auto& row : rows) {
        if (!row.ok()) {
            result.push_back(&row);
        }
    }
    return result;
}

std::size_t DriftReport::count(DriftStatus status) const {
    return static_cast<std::size_t>(std::count_if(rows.begin(), rows.end(),
        [status](const DriftRow& row) { return row.status() == status; }));
}

} // namespace vsync::sync
