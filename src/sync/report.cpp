#include "vsync/sync/report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace vsync::sync {
using json = nlohmann::json;
namespace {

std::string version_text(const std::optional<VersionSpec>& version) {
    return version ? version->to_string() : std::string("-");
}

json version_json(const std::optional<VersionSpec>& version) {
    return version ? json(version->to_string()) : json(nullptr);
}

} // namespace

std::string render_table(const DriftReport& report) {
    const std::vector<std::string> headers{"FILE", "BASELINE", "HEAD", "STATUS"};
    std::vector<std::vector<std::string>> cells;
    cells.reserve(report.rows.size());
    for (const auto& row : report.rows) {
        cells.push_back({row.file,
                         version_text(row.baseline_version),
                         version_text(row.head_version),
                         drift_status_name(row.status())});
    }

    std::vector<std::size_t> widths;
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& line : cells) {
        for (std::size_t i = 0; i < line.size(); ++i) {
            widths[i] = std::max(widths[i], line[i].size());
        }
    }

    std::ostringstream out;
    auto write_line = [&](const std::vector<std::string>& line) {
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (i + 1 == line.size()) {
                out << line[i];
            } else {
                out << std::left << std::setw(static_cast<int>(widths[i] + 2)) << line[i];
            }
        }
        out << '\n';
    };

    out << "Comparing " << report.baseline << " -> " << report.head << '\n';
    write_line(headers);
    for (const auto& line : cells) {
        write_line(line);
    }

    for (const auto& row : report.rows) {
        if (row.error) {
            out << "  " << row.file << ": " << row.error->describe() << '\n';
        } else if (!row.in_sync) {
            out << "  " << row.file << ": content changed but version was not increased\n";
        } else if (!row.matches_declared) {
            out << "  " << row.file << ": version does not match the declared current_version\n";
        }
    }

    const auto offending = report.offending().size();
    out << report.rows.size() << " file(s) checked, " << offending << " offending";
    out << (offending == 0 ? ", all versions in sync\n" : "\n");
    return out.str();
}

std::string render_merge_summary(const MergeReport& report) {
    std::ostringstream out;
    out << "Merge strategy: " << report.strategy << '\n';
    if (report.files.empty()) {
        out << "No version-managed files have conflicts\n";
    }
    for (const auto& file : report.files) {
        if (file.error) {
            out << file.file << ": " << file.error->describe() << '\n';
            continue;
        }
        const auto& resolution = *file.resolution;
        out << file.file << ": " << resolution.resolved_count() << " resolved, "
            << resolution.manual_count() << " need manual resolution\n";
        for (const auto& block : resolution.blocks) {
            if (block.outcome == BlockResolution::Outcome::Manual) {
                out << "  line " << block.block.start_line << ": no version on either side\n";
            }
        }
    }
    for (const auto& path : report.untouched) {
        out << path << ": not version-managed, left unmerged\n";
    }
    return out.str();
}

json to_json(const Error& error) {
    return json{{"kind", error_kind_name(error.kind)}, {"message", error.message}};
}

json to_json(const DriftRow& row) {
    json j;
    j["file"] = row.file;
    j["baseline_version"] = version_json(row.baseline_version);
    j["head_version"] = version_json(row.head_version);
    j["status"] = drift_status_name(row.status());
    j["in_sync"] = row.in_sync;
    j["content_changed"] = row.content_changed;
    j["matches_declared"] = row.matches_declared;
    j["error"] = row.error ? to_json(*row.error) : json(nullptr);
    return j;
}

json to_json(const DriftReport& report) {
    json j;
    j["baseline"] = report.baseline;
    j["head"] = report.head;
    j["ok"] = report.ok();
    j["rows"] = json::array();
    for (const auto& row : report.rows) {
        j["rows"].push_back(to_json(row));
    }
    return j;
}

json to_json(const ConflictResolution& resolution) {
    json j;
    j["fully_resolved"] = resolution.fully_resolved();
    j["blocks"] = json::array();
    for (const auto& block : resolution.blocks) {
        j["blocks"].push_back(json{
            {"start_line", block.block.start_line},
            {"end_line", block.block.end_line},
            {"outcome", outcome_name(block.outcome)},
            {"ours_version", version_json(block.ours_version)},
            {"theirs_version", version_json(block.theirs_version)},
        });
    }
    j["malformed"] = json::array();
    for (const auto& bad : resolution.malformed) {
        j["malformed"].push_back(json{{"line", bad.line}, {"reason", bad.reason}});
    }
    return j;
}

json to_json(const MergeReport& report) {
    json j;
    j["strategy"] = report.strategy;
    j["ok"] = report.ok();
    j["files"] = json::array();
    for (const auto& file : report.files) {
        json entry;
        entry["file"] = file.file;
        if (file.error) {
            entry["error"] = to_json(*file.error);
        } else {
            entry["resolution"] = to_json(*file.resolution);
        }
        j["files"].push_back(entry);
    }
    j["untouched"] = report.untouched;
    return j;
}

} // namespace vsync::sync
