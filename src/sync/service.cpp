#include "vsync/sync/service.hpp"
#include "vsync/config/loader.hpp"
#include "vsync/sync/drift_detector.hpp"
#include "vsync/vcs/snapshot_reader.hpp"
#include "vsync/version/pattern.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vsync::sync {

bool MergeReport::ok() const {
    return std::all_of(files.begin(), files.end(), [](const MergeFileResult& f) { return f.ok(); });
}

CheckService::CheckService(const vcs::VersionControl& vcs,
                           config::CheckerOptions options,
                           events::EventBus* bus)
    : vcs_(vcs), options_(std::move(options)), bus_(bus) {}

Result<std::string> CheckService::resolve_baseline() const {
    if (options_.baseline) {
        if (!vcs_.has_revision(*options_.baseline)) {
            return Err<std::string>(Error::io("Unknown baseline revision: " + *options_.baseline));
        }
        return Ok(*options_.baseline);
    }

    for (const auto& candidate : config::kFallbackBaselines) {
        if (vcs_.has_revision(candidate)) {
            spdlog::debug("No baseline given, using {}", candidate);
            return Ok(candidate);
        }
        spdlog::debug("Fallback baseline {} does not exist", candidate);
    }

    std::string tried;
    for (const auto& candidate : config::kFallbackBaselines) {
        tried += tried.empty() ? candidate : ", " + candidate;
    }
    return Err<std::string>(Error::config("No baseline given and none of [" + tried + "] exist"));
}

Result<version::VersionSpec> CheckService::declared_version_from_file(const std::string& revision,
                                                                     const version::VersionParser& parser) const {
    vcs::SnapshotReader reader(vcs_);
    const auto& file = options_.effective_version_file();

    auto text = reader.read_at(file, revision);
    if (text.is_error()) {
        return Err<version::VersionSpec>(text.error());
    }
    auto found = parser.find(text.value());
    if (found.is_error()) {
        return Err<version::VersionSpec>(Error::parse(file + " at " + revision + ": " + found.error().message));
    }
    return Ok(found.value().spec);
}

Result<std::vector<config::ConfigEntry>> CheckService::load_entries(const std::string& revision,
                                                                    const version::VersionParser& parser) const {
    vcs::SnapshotReader reader(vcs_);
    const auto config_dir = std::filesystem::path(options_.config_file).parent_path().generic_string();

    std::optional<config::VersionConfig> loaded;
    auto text = reader.read_at(options_.config_file, revision);
    if (text.is_ok()) {
        auto parsed = config::load_bumpversion_config(text.value(), config_dir, parser);
        if (parsed.is_ok()) {
            loaded = std::move(parsed.value());
        } else {
            spdlog::warn("Ignoring {}: {}", options_.config_file, parsed.error().message);
        }
    } else if (!text.error().is(ErrorKind::NotFound)) {
        return Err<std::vector<config::ConfigEntry>>(text.error());
    } else {
        spdlog::warn("{} not found at {}", options_.config_file, revision);
    }

    version::VersionSpec declared;
    if (loaded) {
        declared = loaded->current_version;
    } else {
        auto from_file = declared_version_from_file(revision, parser);
        if (from_file.is_error()) {
            spdlog::warn("No declared version available: {}", from_file.error().message);
        } else {
            declared = from_file.value();
        }
    }

    if (!declared.empty()) {
        spdlog::debug("Declared version {}", declared.to_string());
    }
    return Ok(config::build_entries(options_, loaded ? &*loaded : nullptr, declared));
}

Result<DriftReport> CheckService::check() const {
    auto parser = version::VersionParser::create(options_.version_regex);
    if (parser.is_error()) {
        return Err<DriftReport>(parser.error());
    }

    auto baseline = resolve_baseline();
    if (baseline.is_error()) {
        return Err<DriftReport>(baseline.error());
    }

    const auto& head = options_.head;
    if (!vcs_.has_revision(head)) {
        return Err<DriftReport>(Error::io("Unknown head revision: " + head));
    }

    auto entries = load_entries(head, parser.value());
    if (entries.is_error()) {
        return Err<DriftReport>(entries.error());
    }

    auto changed = vcs_.diff_name_only(baseline.value(), head);
    if (changed.is_error()) {
        spdlog::warn("Could not list changes between {} and {}: {}",
                     baseline.value(), head, changed.error().message);
    } else if (changed.value().empty()) {
        spdlog::info("No changes between {} and {}", baseline.value(), head);
    } else {
        spdlog::debug("{} path(s) changed between {} and {}", changed.value().size(), baseline.value(), head);
    }

    vcs::SnapshotReader reader(vcs_);
    DriftDetector detector(reader, version::PatternResolver(parser.value()), bus_);

    DetectOptions detect_options;
    detect_options.parallel = options_.parallel;
    return Ok(detector.detect(entries.value(), baseline.value(), head, detect_options));
}

Result<MergeReport> CheckService::merge(const std::filesystem::path& work_tree) const {
    auto strategy = parse_merge_strategy(options_.merge_strategy);
    if (strategy.is_error()) {
        return Err<MergeReport>(strategy.error());
    }

    auto parser = version::VersionParser::create(options_.version_regex);
    if (parser.is_error()) {
        return Err<MergeReport>(parser.error());
    }

    MergeReport report;
    report.strategy = merge_strategy_name(strategy.value());

    auto unmerged = vcs_.unmerged_paths();
    if (unmerged.is_error()) {
        return Err<MergeReport>(unmerged.error());
    }
    if (unmerged.value().empty()) {
        spdlog::info("No unmerged paths");
        return Ok(report);
    }

    auto entries = load_entries(options_.head, parser.value());
    if (entries.is_error()) {
        return Err<MergeReport>(entries.error());
    }

    const version::PatternResolver patterns(parser.value());
    auto remaining = unmerged.value();

    for (const auto& entry : entries.value()) {
        auto it = remaining.find(entry.target_file);
        if (it == remaining.end()) {
            continue;
        }
        remaining.erase(it);

        MergeFileResult result;
        result.file = entry.target_file;

        // Each file is read with its own pattern, the same one the check uses
        auto search = patterns.build(entry, entry.current_version);
        if (search.is_error()) {
            result.error = search.error();
            report.files.push_back(std::move(result));
            continue;
        }

        ConflictResolver resolver(search.value().parser, strategy.value(), bus_);
        auto resolved = resolver.resolve_file(work_tree / entry.target_file, entry.target_file);
        if (resolved.is_error()) {
            result.error = resolved.error();
        } else {
            result.resolution = std::move(resolved.value());
        }
        report.files.push_back(std::move(result));
    }

    for (const auto& path : remaining) {
        spdlog::warn("{} is unmerged but not version-managed, leaving it alone", path);
        report.untouched.push_back(path);
    }

    return Ok(report);
}

} // namespace vsync::sync
