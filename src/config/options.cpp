#include "vsync/config/options.hpp"

#include <spdlog/spdlog.h>

namespace vsync::config {

void apply_environment(CheckerOptions& options,
                       const std::function<const char*(const char*)>& getenv) {
    auto read = [&getenv](const char* name) -> std::optional<std::string> {
        const char* value = getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };

    if (auto base = read("VERSION_BASE")) {
        options.baseline = *base;
    }
    if (auto current = read("VERSION_CURRENT")) {
        options.head = *current;
    }
    if (auto config_file = read("VERSION_CONFIG_FILE")) {
        options.config_file = *config_file;
    }
    if (auto version_file = read("VERSION_FILE")) {
        options.version_file = *version_file;
    }
    if (auto regex = read("VERSION_REGEX")) {
        options.version_regex = *regex;
    }
    if (auto repo = read("REPO_PATH")) {
        options.repo_path = *repo;
    }
}

std::vector<std::string> reconcile_file_regexes(const std::vector<std::string>& files,
                                                std::vector<std::string> file_regexes,
                                                const std::string& default_regex) {
    if (file_regexes.size() < files.size()) {
        if (!file_regexes.empty()) {
            spdlog::warn("Fewer file regexes than files, defaulting to {} for the remaining {}",
                         default_regex, files.size() - file_regexes.size());
        }
        file_regexes.resize(files.size(), default_regex);
    } else if (file_regexes.size() > files.size()) {
        spdlog::warn("More file regexes than files, ignoring the extra {}",
                     file_regexes.size() - files.size());
        file_regexes.resize(files.size());
    }
    return file_regexes;
}

std::vector<ConfigEntry> build_entries(const CheckerOptions& options,
                                       const VersionConfig* config,
                                       const version::VersionSpec& declared_version) {
    std::vector<ConfigEntry> entries;

    ConfigEntry primary;
    primary.target_file = options.effective_version_file();
    primary.pattern = options.version_regex;
    primary.current_version = declared_version;
    entries.push_back(std::move(primary));

    if (!options.files.empty()) {
        const auto regexes = reconcile_file_regexes(options.files, options.file_regexes, options.version_regex);
        for (std::size_t i = 0; i < options.files.size(); ++i) {
            ConfigEntry entry;
            entry.target_file = options.files[i];
            entry.pattern = regexes[i];
            entry.current_version = declared_version;
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    if (config == nullptr) {
        spdlog::warn("No extra files configured, only checking {}", entries.front().target_file);
        return entries;
    }

    for (const auto& declared : config->entries) {
        // The version file may also be declared in the config; keep one row for it
        if (declared.target_file == entries.front().target_file) {
            continue;
        }
        entries.push_back(declared);
    }
    return entries;
}

} // namespace vsync::config
