/**
 * @file test_pathallocator.cpp
 * @brief Unit tests for collision-free destination allocation
 *
 * @see PathAllocator
 */

#include "pathallocator.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class PathAllocatorTest : public TempDirTest {
protected:
    LocalFileSystem local_fs;
};

TEST_F(PathAllocatorTest, CandidateNames) {
    EXPECT_EQ(PathAllocator::candidateName("a.txt", 0), "a.txt");
    EXPECT_EQ(PathAllocator::candidateName("a.txt", 2), "a_2.txt");
    EXPECT_EQ(PathAllocator::candidateName("archive.tar.gz", 1), "archive.tar_1.gz");
    EXPECT_EQ(PathAllocator::candidateName("Makefile", 1), "Makefile_1");
    EXPECT_EQ(PathAllocator::candidateName(".bashrc", 3), ".bashrc_3");
}

/**
 * @test SkipsExistingAndReservedPaths
 * @brief Files on disk and earlier allocations are never handed out again
 */
TEST_F(PathAllocatorTest, SkipsExistingAndReservedPaths) {
    createFile("report.txt", "on disk");
    PathAllocator allocator(local_fs, {});

    EXPECT_EQ(allocator.allocate(test_dir, "report.txt"), test_dir / "report_1.txt");
    EXPECT_EQ(allocator.allocate(test_dir, "report.txt"), test_dir / "report_2.txt");
    EXPECT_EQ(allocator.allocate(test_dir, "fresh.txt"), test_dir / "fresh.txt");
    EXPECT_TRUE(allocator.isOccupied(test_dir / "fresh.txt"));
}

/**
 * @test PendingRemovalCountsAsFree
 * @brief A path whose file is proposed for deletion can be reused
 */
TEST_F(PathAllocatorTest, PendingRemovalCountsAsFree) {
    auto doomed = createFile("a.txt", "old");
    createFile("a_1.txt", "kept");
    PathAllocator allocator(local_fs, {doomed});

    EXPECT_FALSE(allocator.isOccupied(doomed));
    EXPECT_EQ(allocator.allocate(test_dir, "a.txt"), doomed);
    EXPECT_EQ(allocator.allocate(test_dir, "a.txt"), test_dir / "a_2.txt");
}

TEST_F(PathAllocatorTest, DirectoryCountsAsOccupied) {
    createDir("photos");
    PathAllocator allocator(local_fs, {});

    EXPECT_EQ(allocator.allocate(test_dir, "photos"), test_dir / "photos_1");
}

/**
 * @test UninspectableDirectoryGivesNoPath
 * @brief When nothing in a directory can be stat'ed, allocation gives up
 *        instead of trying candidates forever
 */
TEST_F(PathAllocatorTest, UninspectableDirectoryGivesNoPath) {
    auto locked = createDir("locked");
    FaultyFileSystem faulty;
    faulty.failStatIn.insert(locked);
    PathAllocator allocator(faulty, {});

    EXPECT_FALSE(allocator.allocate(locked, "a.txt").has_value());
    EXPECT_THROW(allocator.isOccupied(locked / "a.txt"), ScanError);

    // other directories are unaffected
    EXPECT_EQ(allocator.allocate(test_dir, "a.txt"), test_dir / "a.txt");
}
