#include "vsync/vcs/snapshot_reader.hpp"

#include "support/memory_repository.hpp"

#include <gtest/gtest.h>

using vsync::ErrorKind;
using vsync::test_support::MemoryRepository;
using vsync::vcs::SnapshotReader;

class SnapshotReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_.set_snapshot("origin/main", {{"VERSION", "1.0.0\n"}});
        repo_.set_snapshot("HEAD", {{"VERSION", "1.1.0\n"}, {"CHANGELOG.md", "# 1.1.0\n"}});
    }

    MemoryRepository repo_;
};

TEST_F(SnapshotReaderTest, ReadsContentAtEachRevision) {
    SnapshotReader reader(repo_);

    auto base = reader.read_at("VERSION", "origin/main");
    ASSERT_TRUE(base.is_ok());
    EXPECT_EQ(base.value(), "1.0.0\n");

    auto head = reader.read_at("VERSION", "HEAD");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value(), "1.1.0\n");
}

TEST_F(SnapshotReaderTest, MissingFileIsNotFound) {
    SnapshotReader reader(repo_);

    auto result = reader.read_at("CHANGELOG.md", "origin/main");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::NotFound));
}

TEST_F(SnapshotReaderTest, CollaboratorFailureIsIO) {
    repo_.break_revision("HEAD");
    SnapshotReader reader(repo_);

    auto result = reader.read_at("VERSION", "HEAD");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::IO));
}

TEST_F(SnapshotReaderTest, UnknownRevisionIsIO) {
    SnapshotReader reader(repo_);

    auto result = reader.read_at("VERSION", "does-not-exist");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::IO));
}
