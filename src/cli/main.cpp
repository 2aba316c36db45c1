#include "vsync/config/loader.hpp"
#include "vsync/config/options.hpp"
#include "vsync/events/components.hpp"
#include "vsync/events/event_bus.hpp"
#include "vsync/sync/report.hpp"
#include "vsync/sync/service.hpp"
#include "vsync/vcs/git_repository.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [check|merge] [OPTIONS]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check                 Compare versions between baseline and head (default)\n";
    std::cout << "  merge                 Resolve version conflicts in unmerged files\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --base REF            Baseline revision (default: origin/main, then origin/master)\n";
    std::cout << "  --head REF            Head revision, or WORKTREE for the working tree (default: HEAD)\n";
    std::cout << "  --repo PATH           Repository path (default: .)\n";
    std::cout << "  --config FILE         bumpversion config (default: .bumpversion.cfg)\n";
    std::cout << "  --version-file FILE   File holding the canonical version (default: the config)\n";
    std::cout << "  --version-regex RE    Regex for version strings\n";
    std::cout << "  --files F...          Files to check instead of the config entries\n";
    std::cout << "  --file-regexes RE...  One regex per --files entry\n";
    std::cout << "  --strategy NAME       higher, lower, ours|current, theirs|incoming, both, neither\n";
    std::cout << "  --log-level LEVEL     debug, info, warning, error (default: info)\n";
    std::cout << "  --json                Print the report as JSON\n";
    std::cout << "  --parallel            Check files concurrently\n";
    std::cout << "  --example-config      Print a sample .bumpversion.cfg and exit\n";
    std::cout << "  --help                Show this help message\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  VERSION_BASE, VERSION_CURRENT, VERSION_FILE, VERSION_REGEX,\n";
    std::cout << "  VERSION_CONFIG_FILE, REPO_PATH (overridden by the options above)\n";
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warning" || name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return std::nullopt;
}

// Consume values up to the next option
std::vector<std::string> take_values(int& i, int argc, char* argv[]) {
    std::vector<std::string> values;
    while (i + 1 < argc && argv[i + 1][0] != '-') {
        values.emplace_back(argv[++i]);
    }
    return values;
}

int run_check(const vsync::sync::CheckService& service, bool json_output) {
    auto report = service.check();
    if (report.is_error()) {
        spdlog::error("{}", report.error().describe());
        return 1;
    }

    if (json_output) {
        std::cout << vsync::sync::to_json(report.value()).dump(2) << std::endl;
    } else {
        std::cout << vsync::sync::render_table(report.value());
    }
    return report.value().ok() ? 0 : 1;
}

int run_merge(const vsync::sync::CheckService& service,
              const vsync::vcs::GitRepository& repository,
              bool json_output) {
    auto report = service.merge(repository.root());
    if (report.is_error()) {
        spdlog::error("{}", report.error().describe());
        return 1;
    }

    if (json_output) {
        std::cout << vsync::sync::to_json(report.value()).dump(2) << std::endl;
    } else {
        std::cout << vsync::sync::render_merge_summary(report.value());
    }
    return report.value().ok() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout carries only the report
    spdlog::set_default_logger(spdlog::stderr_color_mt("version_sync"));
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    vsync::config::CheckerOptions options;
    vsync::config::apply_environment(options, [](const char* name) { return std::getenv(name); });

    std::string command = "check";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](std::string& target) {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", arg);
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--example-config") {
            std::cout << vsync::config::example_config();
            return 0;
        } else if (i == 1 && (arg == "check" || arg == "merge")) {
            command = arg;
        } else if (arg == "--base") {
            std::string base;
            if (!require_value(base)) return 1;
            options.baseline = base;
        } else if (arg == "--head") {
            if (!require_value(options.head)) return 1;
        } else if (arg == "--repo") {
            if (!require_value(options.repo_path)) return 1;
        } else if (arg == "--config") {
            if (!require_value(options.config_file)) return 1;
        } else if (arg == "--version-file") {
            if (!require_value(options.version_file)) return 1;
        } else if (arg == "--version-regex") {
            if (!require_value(options.version_regex)) return 1;
        } else if (arg == "--files") {
            options.files = take_values(i, argc, argv);
        } else if (arg == "--file-regexes") {
            options.file_regexes = take_values(i, argc, argv);
        } else if (arg == "--strategy") {
            if (!require_value(options.merge_strategy)) return 1;
        } else if (arg == "--log-level") {
            if (!require_value(options.log_level)) return 1;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--parallel") {
            options.parallel = true;
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    auto level = parse_log_level(options.log_level);
    if (!level) {
        spdlog::error("Invalid log level: {}", options.log_level);
        return 1;
    }
    spdlog::set_level(*level);

    auto repository = vsync::vcs::GitRepository::open(options.repo_path);
    if (repository.is_error()) {
        spdlog::error("{}", repository.error().describe());
        return 1;
    }

    vsync::events::EventBus bus;
    vsync::events::LoggerComponent logger(bus);
    vsync::events::MetricsComponent metrics(bus);

    const bool json_output = options.json_output;
    vsync::sync::CheckService service(repository.value(), std::move(options), &bus);

    const int exit_code = command == "merge"
        ? run_merge(service, repository.value(), json_output)
        : run_check(service, json_output);

    if (spdlog::get_level() <= spdlog::level::debug) {
        metrics.print_stats();
    }
    return exit_code;
}
