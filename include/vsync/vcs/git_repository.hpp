#pragma once

#include "vsync/vcs/repository.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace vsync::vcs {

/**
 * @brief VersionControl backed by the `git` executable
 *
 * Every call runs `git -C <root> ...` and blocks until it exits. No retries;
 * a non-zero exit is reported as an IO error (or NotFound for missing blobs).
 */
class GitRepository : public VersionControl {
public:
    /**
     * @brief Locate the repository containing path
     * @return IO error when path is not inside a git work tree
     */
    static Result<GitRepository> open(const std::filesystem::path& path);

    Result<std::string> file_at_revision(const std::string& path,
                                         const std::string& ref) const override;

    Result<std::set<std::string>> diff_name_only(const std::string& ref_a,
                                                 const std::string& ref_b) const override;

    Result<std::string> current_ref() const override;

    bool has_revision(const std::string& ref) const override;

    Result<std::set<std::string>> unmerged_paths() const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    struct CommandOutput {
        int exit_code = -1;
        std::string output;
    };

    explicit GitRepository(std::filesystem::path root);

    CommandOutput run_git(const std::vector<std::string>& args) const;

    static Result<std::set<std::string>> split_lines(const CommandOutput& out, const std::string& what);

    std::filesystem::path root_;
};

} // namespace vsync::vcs
