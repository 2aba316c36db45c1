#include "vsync/events/event_bus.hpp"
#include "vsync/sync/service.hpp"

#include "support/memory_repository.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using vsync::ErrorKind;
using vsync::config::CheckerOptions;
using vsync::sync::CheckService;
using vsync::sync::DriftStatus;
using vsync::test_support::MemoryRepository;

namespace {

std::string bumpversion_cfg(const std::string& version) {
    return "[bumpversion]\n"
           "current_version = " + version + "\n"
           "commit = False\n"
           "\n"
           "[bumpversion:file:setup.py]\n"
           "search = version='{current_version}'\n"
           "replace = version='{new_version}'\n"
           "\n"
           "[bumpversion:file:VERSION]\n";
}

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("vsync_service_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

} // namespace

class CheckServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_.set_snapshot("origin/main", {
            {".bumpversion.cfg", bumpversion_cfg("1.4.0")},
            {"setup.py", "setup(name='pkg', version='1.4.0')\n"},
            {"VERSION", "1.4.0\n"},
        });
        repo_.set_snapshot("HEAD", {
            {".bumpversion.cfg", bumpversion_cfg("1.5.0")},
            {"setup.py", "setup(name='pkg', version='1.5.0')\n"},
            {"VERSION", "1.5.0\n"},
        });
    }

    MemoryRepository repo_;
};

TEST_F(CheckServiceTest, ExplicitBaselineMustExist) {
    CheckerOptions options;
    options.baseline = "release/0.9";
    CheckService service(repo_, options);

    auto baseline = service.resolve_baseline();
    ASSERT_TRUE(baseline.is_error());
    EXPECT_TRUE(baseline.error().is(ErrorKind::IO));
}

TEST_F(CheckServiceTest, BaselineFallsBackToMaster) {
    MemoryRepository repo;
    repo.set_snapshot("origin/master", {});
    repo.set_snapshot("HEAD", {});
    CheckService service(repo, CheckerOptions{});

    auto baseline = service.resolve_baseline();
    ASSERT_TRUE(baseline.is_ok());
    EXPECT_EQ(baseline.value(), "origin/master");
}

TEST_F(CheckServiceTest, PrefersMainOverMaster) {
    repo_.set_snapshot("origin/master", {});
    CheckService service(repo_, CheckerOptions{});

    auto baseline = service.resolve_baseline();
    ASSERT_TRUE(baseline.is_ok());
    EXPECT_EQ(baseline.value(), "origin/main");
}

TEST_F(CheckServiceTest, NoBaselineAvailableIsConfigError) {
    MemoryRepository repo;
    repo.set_snapshot("HEAD", {});
    CheckService service(repo, CheckerOptions{});

    auto baseline = service.resolve_baseline();
    ASSERT_TRUE(baseline.is_error());
    EXPECT_TRUE(baseline.error().is(ErrorKind::Config));
}

TEST_F(CheckServiceTest, BumpedRepositoryIsInSync) {
    CheckService service(repo_, CheckerOptions{});

    auto report = service.check();
    ASSERT_TRUE(report.is_ok()) << report.error().describe();

    const auto& rows = report.value().rows;
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].file, ".bumpversion.cfg");
    EXPECT_EQ(rows[1].file, "setup.py");
    EXPECT_EQ(rows[2].file, "VERSION");
    for (const auto& row : rows) {
        EXPECT_TRUE(row.ok()) << row.file;
    }
    EXPECT_TRUE(report.value().ok());
    EXPECT_EQ(report.value().baseline, "origin/main");
}

TEST_F(CheckServiceTest, ForgottenFileIsReported) {
    repo_.set_file("HEAD", "VERSION", "1.4.0\n");

    CheckService service(repo_, CheckerOptions{});
    auto report = service.check();
    ASSERT_TRUE(report.is_ok());

    EXPECT_FALSE(report.value().ok());
    const auto offending = report.value().offending();
    ASSERT_EQ(offending.size(), 1u);
    EXPECT_EQ(offending[0]->file, "VERSION");
    EXPECT_EQ(offending[0]->status(), DriftStatus::Mismatch);
}

TEST_F(CheckServiceTest, FileEditedWithoutBumpIsDrift) {
    repo_.set_file("origin/main", "setup.py", "setup(name='pkg', version='1.5.0')\n");
    repo_.set_file("HEAD", "setup.py", "setup(name='pkg', version='1.5.0', zip_safe=False)\n");

    CheckService service(repo_, CheckerOptions{});
    auto report = service.check();
    ASSERT_TRUE(report.is_ok());

    const auto offending = report.value().offending();
    ASSERT_EQ(offending.size(), 1u);
    EXPECT_EQ(offending[0]->file, "setup.py");
    EXPECT_EQ(offending[0]->status(), DriftStatus::Drift);
}

TEST_F(CheckServiceTest, MissingConfigFallsBackToVersionFile) {
    repo_.remove_file("HEAD", ".bumpversion.cfg");

    CheckerOptions options;
    options.version_file = "VERSION";
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().rows.size(), 1u);
    EXPECT_EQ(report.value().rows[0].file, "VERSION");
    EXPECT_TRUE(report.value().ok());
}

TEST_F(CheckServiceTest, ExplicitFilesOverrideConfigEntries) {
    repo_.set_file("origin/main", "chart.yaml", "appVersion: 1.4\n");
    repo_.set_file("HEAD", "chart.yaml", "appVersion: 1.5\n");

    CheckerOptions options;
    options.version_file = "VERSION";
    options.files = {"chart.yaml"};
    options.file_regexes = {R"([0-9]+\.[0-9]+)"};
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().rows.size(), 2u);
    EXPECT_EQ(report.value().rows[1].file, "chart.yaml");
    EXPECT_TRUE(report.value().rows[1].in_sync);
    // 1.5 == 1.5.0, the declared version
    EXPECT_TRUE(report.value().rows[1].matches_declared);
}

TEST_F(CheckServiceTest, FileRegexMayIncludeSurroundingText) {
    repo_.set_file("origin/main", "openapi.yaml", "info:\n  title: api\n  version: 1.4.0\n");
    repo_.set_file("HEAD", "openapi.yaml", "info:\n  title: api\n  version: 1.5.0\n");

    CheckerOptions options;
    options.version_file = "VERSION";
    options.files = {"openapi.yaml"};
    options.file_regexes = {R"(version.: \d\.\d\.\d)"};
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    ASSERT_EQ(report.value().rows.size(), 2u);
    const auto& row = report.value().rows[1];
    EXPECT_EQ(row.file, "openapi.yaml");
    EXPECT_FALSE(row.error.has_value());
    EXPECT_TRUE(row.in_sync);
    EXPECT_TRUE(row.matches_declared);
    EXPECT_TRUE(report.value().ok());
}

TEST_F(CheckServiceTest, InvalidVersionRegexIsConfigError) {
    CheckerOptions options;
    options.version_regex = "([0-9";
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_error());
    EXPECT_TRUE(report.error().is(ErrorKind::Config));
}

TEST_F(CheckServiceTest, UnknownHeadIsIOError) {
    CheckerOptions options;
    options.head = "feature/missing";
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_error());
    EXPECT_TRUE(report.error().is(ErrorKind::IO));
}

TEST_F(CheckServiceTest, ParallelCheckMatchesSequential) {
    CheckerOptions options;
    options.parallel = true;
    CheckService service(repo_, options);

    auto report = service.check();
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().rows.size(), 3u);
    EXPECT_EQ(report.value().rows[1].file, "setup.py");
    EXPECT_TRUE(report.value().ok());
}

class MergeServiceTest : public CheckServiceTest {
protected:
    void SetUp() override {
        CheckServiceTest::SetUp();
        work_tree_ = create_temp_dir();
    }

    void TearDown() override {
        if (!work_tree_.empty()) {
            fs::remove_all(work_tree_);
        }
    }

    void write_work_file(const std::string& name, const std::string& content) {
        std::ofstream output(work_tree_ / name, std::ios::binary | std::ios::trunc);
        output << content;
    }

    std::string read_work_file(const std::string& name) {
        std::ifstream input(work_tree_ / name, std::ios::binary);
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return buffer.str();
    }

    fs::path work_tree_;
};

TEST_F(MergeServiceTest, NothingUnmergedIsOk) {
    CheckService service(repo_, CheckerOptions{});
    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().files.empty());
    EXPECT_TRUE(report.value().ok());
}

TEST_F(MergeServiceTest, ResolvesVersionManagedFilesOnly) {
    repo_.set_unmerged({"VERSION", "README.md"});
    write_work_file("VERSION", "<<<<<<< HEAD\n1.5.0\n=======\n1.4.1\n>>>>>>> hotfix\n");
    const std::string readme = "<<<<<<< HEAD\nours\n=======\ntheirs\n>>>>>>> hotfix\n";
    write_work_file("README.md", readme);

    CheckService service(repo_, CheckerOptions{});
    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_ok());

    ASSERT_EQ(report.value().files.size(), 1u);
    EXPECT_EQ(report.value().files[0].file, "VERSION");
    EXPECT_TRUE(report.value().files[0].ok());
    ASSERT_EQ(report.value().untouched.size(), 1u);
    EXPECT_EQ(report.value().untouched[0], "README.md");
    EXPECT_TRUE(report.value().ok());

    EXPECT_EQ(read_work_file("VERSION"), "1.5.0\n");
    EXPECT_EQ(read_work_file("README.md"), readme);
}

TEST_F(MergeServiceTest, StrategyComesFromOptions) {
    repo_.set_unmerged({"VERSION"});
    write_work_file("VERSION", "<<<<<<< HEAD\n1.5.0\n=======\n1.4.1\n>>>>>>> hotfix\n");

    CheckerOptions options;
    options.merge_strategy = "incoming";
    CheckService service(repo_, options);
    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_ok());
    EXPECT_EQ(report.value().strategy, "theirs");
    EXPECT_EQ(read_work_file("VERSION"), "1.4.1\n");
}

TEST_F(MergeServiceTest, FileRegexAppliesToItsConflicts) {
    repo_.set_unmerged({"chart.yaml"});
    write_work_file("chart.yaml", "<<<<<<< HEAD\nappVersion: 1.5\n=======\nappVersion: 1.4\n>>>>>>> hotfix\n");

    CheckerOptions options;
    options.version_file = "VERSION";
    options.files = {"chart.yaml"};
    options.file_regexes = {R"([0-9]+\.[0-9]+)"};
    CheckService service(repo_, options);

    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().files.size(), 1u);
    ASSERT_TRUE(report.value().files[0].resolution.has_value());
    EXPECT_TRUE(report.value().files[0].ok());
    EXPECT_TRUE(report.value().ok());
    EXPECT_EQ(read_work_file("chart.yaml"), "appVersion: 1.5\n");
}

TEST_F(MergeServiceTest, MalformedFileFailsTheMerge) {
    repo_.set_unmerged({"setup.py"});
    const std::string broken = "<<<<<<< HEAD\nversion='1.5.0'\n";
    write_work_file("setup.py", broken);

    CheckService service(repo_, CheckerOptions{});
    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_ok());
    ASSERT_EQ(report.value().files.size(), 1u);
    ASSERT_TRUE(report.value().files[0].error.has_value());
    EXPECT_TRUE(report.value().files[0].error->is(ErrorKind::MalformedConflict));
    EXPECT_FALSE(report.value().ok());
    EXPECT_EQ(read_work_file("setup.py"), broken);
}

TEST_F(MergeServiceTest, UnknownStrategyIsConfigError) {
    CheckerOptions options;
    options.merge_strategy = "newest";
    CheckService service(repo_, options);

    auto report = service.merge(work_tree_);
    ASSERT_TRUE(report.is_error());
    EXPECT_TRUE(report.error().is(ErrorKind::Config));
}
