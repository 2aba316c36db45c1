#include "vsync/vcs/git_repository.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

namespace vsync::vcs {
namespace fs = std::filesystem;
namespace {

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

struct RawOutput {
    int exit_code = -1;
    std::string output;
};

RawOutput run_command(const std::string& command) {
    RawOutput result;
    FILE* pipe = ::popen(command.c_str(), "r");
    if (pipe == nullptr) {
        return result;
    }

    char buffer[4096];
    std::size_t count = 0;
    while ((count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, count);
    }

    const int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::string build_git_command(const fs::path& root, const std::vector<std::string>& args) {
    std::ostringstream cmd;
    cmd << "git -C " << shell_quote(root.string());
    for (const auto& arg : args) {
        cmd << ' ' << shell_quote(arg);
    }
    cmd << " 2>/dev/null";
    return cmd.str();
}

std::string strip_newline(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

GitRepository::GitRepository(fs::path root) : root_(std::move(root)) {}

Result<GitRepository> GitRepository::open(const fs::path& path) {
    const auto out = run_command(build_git_command(path, {"rev-parse", "--show-toplevel"}));
    if (out.exit_code != 0) {
        return Err<GitRepository>(Error::io("Not a git repository: " + path.string()));
    }
    fs::path root = strip_newline(out.output);
    spdlog::debug("Opened git repository at {}", root.string());
    return Ok(GitRepository(std::move(root)));
}

GitRepository::CommandOutput GitRepository::run_git(const std::vector<std::string>& args) const {
    const auto command = build_git_command(root_, args);
    spdlog::debug("Running: {}", command);
    auto raw = run_command(command);
    return CommandOutput{raw.exit_code, std::move(raw.output)};
}

Result<std::string> GitRepository::file_at_revision(const std::string& path,
                                                    const std::string& ref) const {
    if (ref == kWorkingTree) {
        const auto absolute = root_ / path;
        if (!fs::is_regular_file(absolute)) {
            return Err<std::string>(Error::not_found(path + " does not exist in the working tree"));
        }
        std::ifstream input(absolute, std::ios::binary);
        if (!input) {
            return Err<std::string>(Error::io("Cannot open " + absolute.string()));
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return Ok(buffer.str());
    }

    if (!has_revision(ref)) {
        return Err<std::string>(Error::io("Unknown revision: " + ref));
    }

    const std::string object = ref + ":" + path;
    if (run_git({"cat-file", "-e", object}).exit_code != 0) {
        return Err<std::string>(Error::not_found(path + " not found at " + ref));
    }

    auto blob = run_git({"cat-file", "blob", object});
    if (blob.exit_code != 0) {
        return Err<std::string>(Error::io("git cat-file failed for " + object));
    }
    return Ok(std::move(blob.output));
}

Result<std::set<std::string>> GitRepository::split_lines(const CommandOutput& out, const std::string& what) {
    if (out.exit_code != 0) {
        return Err<std::set<std::string>>(Error::io(what + " failed (exit " + std::to_string(out.exit_code) + ")"));
    }
    std::set<std::string> lines;
    std::istringstream stream(out.output);
    std::string line;
    while (std::getline(stream, line)) {
        line = strip_newline(line);
        if (!line.empty()) {
            lines.insert(line);
        }
    }
    return Ok(lines);
}

Result<std::set<std::string>> GitRepository::diff_name_only(const std::string& ref_a,
                                                            const std::string& ref_b) const {
    std::vector<std::string> args{"diff", "--name-only", ref_a};
    if (ref_b != kWorkingTree) {
        args.push_back(ref_b);
    }
    return split_lines(run_git(args), "git diff " + ref_a + " " + ref_b);
}

Result<std::string> GitRepository::current_ref() const {
    auto branch = run_git({"rev-parse", "--abbrev-ref", "HEAD"});
    if (branch.exit_code != 0) {
        return Err<std::string>(Error::io("Cannot determine current revision"));
    }
    auto name = strip_newline(branch.output);
    if (name != "HEAD") {
        return Ok(name);
    }

    // Detached HEAD: report the commit id
    auto commit = run_git({"rev-parse", "HEAD"});
    if (commit.exit_code != 0) {
        return Err<std::string>(Error::io("Cannot determine current commit"));
    }
    return Ok(strip_newline(commit.output));
}

bool GitRepository::has_revision(const std::string& ref) const {
    if (ref == kWorkingTree) {
        return true;
    }
    return run_git({"rev-parse", "--verify", "--quiet", ref + "^{commit}"}).exit_code == 0;
}

Result<std::set<std::string>> GitRepository::unmerged_paths() const {
    return split_lines(run_git({"diff", "--name-only", "--diff-filter=U"}), "git diff --diff-filter=U");
}

} // namespace vsync::vcs
