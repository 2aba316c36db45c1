#include "vsync/config/loader.hpp"
#include "vsync/config/parser.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>

namespace vsync::config {
namespace {

std::string join_repo_path(const std::string& dir, const std::string& file) {
    if (dir.empty() || dir == ".") {
        return std::filesystem::path(file).lexically_normal().generic_string();
    }
    return (std::filesystem::path(dir) / file).lexically_normal().generic_string();
}

// Target path of "bumpversion:file:<path>" or "bumpversion:file(<label>):<path>".
// Everything after the marker belongs to the path, colons included.
std::optional<std::string> file_section_path(const std::string& name) {
    const std::string head = std::string(kBumpversionSection) + ":file";
    if (name.compare(0, head.size(), head) != 0) {
        return std::nullopt;
    }

    std::size_t rest = head.size();
    if (rest < name.size() && name[rest] == '(') {
        const auto close = name.find(')', rest);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        rest = close + 1;
    }
    if (rest >= name.size() || name[rest] != ':' || rest + 1 == name.size()) {
        return std::nullopt;
    }
    return name.substr(rest + 1);
}

} // namespace

Result<VersionConfig> load_bumpversion_config(const std::string& text,
                                              const std::string& config_dir,
                                              const version::VersionParser& parser) {
    Parser ini(text);
    auto document = ini.parse_document();
    if (document.is_error()) {
        return Err<VersionConfig>(document.error());
    }

    const auto* top = document.value().find(kBumpversionSection);
    if (top == nullptr) {
        return Err<VersionConfig>(Error::config("missing [bumpversion] section"));
    }

    const auto* raw_version = top->find("current_version");
    if (raw_version == nullptr) {
        return Err<VersionConfig>(Error::config("missing current_version in [bumpversion]"));
    }

    auto current = parser.parse(*raw_version);
    if (current.is_error()) {
        // Patterns carrying file context ("version: [0-9.]+") never match a bare value
        auto bare = version::VersionParser().parse(*raw_version);
        if (bare.is_error()) {
            return Err<VersionConfig>(Error::config("current_version: " + current.error().message));
        }
        spdlog::debug("current_version '{}' read with the default pattern", *raw_version);
        current = std::move(bare);
    }

    VersionConfig config;
    config.raw_current_version = *raw_version;
    config.current_version = current.value();
    for (const auto& [key, value] : top->values) {
        config.globals[key] = value;
    }

    std::map<std::string, std::string> substitutions = config.globals;
    substitutions.erase("current_version");

    for (const auto& section : document.value().sections) {
        if (section.name.find(":file") == std::string::npos) {
            continue;
        }
        const auto path = file_section_path(section.name);
        if (!path) {
            spdlog::warn("Ignoring config section [{}]: expected bumpversion:file:<path>", section.name);
            continue;
        }

        ConfigEntry entry;
        entry.target_file = join_repo_path(config_dir, *path);
        entry.current_version = config.current_version;
        entry.substitutions = substitutions;
        if (const auto* search = section.find("search")) {
            entry.search = *search;
        }
        if (const auto* replace = section.find("replace")) {
            entry.replace = *replace;
        }

        spdlog::debug("Config entry {} search={}", entry.target_file,
                      entry.search.value_or("<default pattern>"));
        config.entries.push_back(std::move(entry));
    }

    return Ok(config);
}

const char* example_config() {
    return R"([bumpversion]
current_version = 0.1.0
commit = False
tag = False

[bumpversion:file:VERSION]

[bumpversion:file:setup.py]
search = version='{current_version}'
replace = version='{new_version}'

[bumpversion:file:openapi-spec.json]
search = "version": "{current_version}"
replace = "version": "{new_version}"
)";
}

} // namespace vsync::config
