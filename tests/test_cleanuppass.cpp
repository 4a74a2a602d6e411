/**
 * @file test_cleanuppass.cpp
 * @brief Unit tests for pruning empty directories after execution
 *
 * @see CleanupPass
 */

#include "cleanuppass.hpp"
#include "test_helpers.hpp"

#include <algorithm>

namespace fs = std::filesystem;

class CleanupPassTest : public TempDirTest {
protected:
    LocalFileSystem local_fs;
    fs::path x;
    fs::path y;

    void SetUp() override {
        TempDirTest::SetUp();
        x = createDir("X");
        y = createDir("Y");
    }
};

/**
 * @test RemovesEmptySourceTree
 * @brief An empty source root is removed with all its empty subdirectories,
 *        deepest first
 */
TEST_F(CleanupPassTest, RemovesEmptySourceTree) {
    createDir("Y/a/b/c");
    createDir("Y/d");

    CleanupPass pass(local_fs, x);
    auto report = pass.prune({x, y});

    EXPECT_FALSE(fs::exists(y));
    EXPECT_TRUE(fs::exists(x));
    EXPECT_TRUE(report.warnings.empty());
    ASSERT_EQ(report.removed.size(), 5u);
    EXPECT_EQ(report.removed.back(), y);

    auto posC = std::find(report.removed.begin(), report.removed.end(), y / "a" / "b" / "c");
    auto posA = std::find(report.removed.begin(), report.removed.end(), y / "a");
    EXPECT_LT(posC, posA);
}

/**
 * @test KeepsDirectoriesWithContent
 * @brief Files and symlinks keep their directory and every ancestor
 */
TEST_F(CleanupPassTest, KeepsDirectoriesWithContent) {
    createFile("Y/keep/deep/file.txt", "still here");
    createDir("Y/keep/empty");
    createDir("Y/links");
    fs::create_symlink(test_dir / "nowhere", y / "links" / "dangling");

    CleanupPass pass(local_fs, x);
    auto report = pass.prune({x, y});

    EXPECT_TRUE(fs::exists(y / "keep" / "deep" / "file.txt"));
    EXPECT_TRUE(fs::exists(y / "links"));
    EXPECT_FALSE(fs::exists(y / "keep" / "empty"));
    ASSERT_EQ(report.removed.size(), 1u);
}

TEST_F(CleanupPassTest, NeverRemovesCanonicalRoot) {
    createDir("X/empty_sub");

    CleanupPass pass(local_fs, x);
    auto report = pass.prune({x});

    EXPECT_TRUE(fs::exists(x));
    EXPECT_FALSE(fs::exists(x / "empty_sub"));
    EXPECT_EQ(report.removed.size(), 1u);
}

/**
 * @test ProtectsAncestorsOfCanonical
 * @brief A source root that contains the canonical root is never removed
 */
TEST_F(CleanupPassTest, ProtectsAncestorsOfCanonical) {
    auto canonical = createDir("Y/inner/X2");

    CleanupPass pass(local_fs, canonical);

    EXPECT_TRUE(pass.isProtected(canonical));
    EXPECT_TRUE(pass.isProtected(y));
    EXPECT_TRUE(pass.isProtected(y / "inner"));
    EXPECT_FALSE(pass.isProtected(y / "inner" / "X2" / "sub"));
    EXPECT_FALSE(pass.isProtected(x));

    pass.prune({canonical, y});
    EXPECT_TRUE(fs::exists(canonical));
}

TEST_F(CleanupPassTest, FailureBecomesWarning) {
    createDir("Y/stuck");

    FaultyFileSystem faulty;
    faulty.failRemoveDir.insert(y / "stuck");
    CleanupPass pass(faulty, x);
    auto report = pass.prune({x, y});

    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_TRUE(fs::exists(y / "stuck"));
    EXPECT_TRUE(report.removed.empty());
}

TEST_F(CleanupPassTest, SkipsRootsThatAreGone) {
    CleanupPass pass(local_fs, x);
    auto report = pass.prune({x, test_dir / "never_existed"});

    EXPECT_TRUE(report.warnings.empty());
    EXPECT_TRUE(report.removed.empty());
}
