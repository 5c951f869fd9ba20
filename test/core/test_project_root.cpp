#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/ProjectRoot.hpp"

namespace fs = std::filesystem;

using namespace githooker;
using namespace githooker::test::utils;

class ProjectRootTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
};

TEST_F(ProjectRootTest, DiscoverFromRoot) {
    initTestRepo(tempDir);
    auto res = ProjectRoot::discover(tempDir);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value(), tempDir);
}

TEST_F(ProjectRootTest, DiscoverFromNestedDirectory) {
    initTestRepo(tempDir);
    fs::create_directories(tempDir / "src" / "deep" / "deeper");
    auto res = ProjectRoot::discover(tempDir / "src" / "deep" / "deeper");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value(), tempDir);
}

TEST_F(ProjectRootTest, DiscoverPicksNearestRepository) {
    initTestRepo(tempDir);
    initTestRepo(tempDir / "vendor" / "lib");
    auto res = ProjectRoot::discover(tempDir / "vendor" / "lib");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), tempDir / "vendor" / "lib");
}

// A .git file (worktree link) is not a .git directory
TEST_F(ProjectRootTest, GitFileIsNotARepository) {
    createFile(tempDir, ".git", "gitdir: /elsewhere\n");
    auto res = ProjectRoot::resolve(tempDir);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
}

TEST_F(ProjectRootTest, ResolveExplicitRoot) {
    initTestRepo(tempDir);
    auto res = ProjectRoot::resolve(tempDir);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), tempDir);
}

TEST_F(ProjectRootTest, ResolveExplicitRootWithoutGit) {
    auto res = ProjectRoot::resolve(tempDir);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
}

TEST_F(ProjectRootTest, ResolveFromCurrentDirectory) {
    initTestRepo(tempDir);
    fs::create_directories(tempDir / "sub");
    setCwd(tempDir / "sub");
    auto res = ProjectRoot::resolve(fs::path());
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(res.value(), tempDir);
}

TEST_F(ProjectRootTest, HooksDirLayout) {
    EXPECT_EQ(ProjectRoot::gitDir(tempDir), tempDir / ".git");
    EXPECT_EQ(ProjectRoot::hooksDir(tempDir), tempDir / ".git" / "hooks");
}
