/**
 * @file test_helpers.hpp
 * @brief Shared fixture and filesystem fakes for the unit tests
 *
 * - TempDirTest: fixture with a fresh directory per test
 * - FaultyFileSystem: LocalFileSystem decorator that fails on chosen paths
 *
 * @see LocalFileSystem
 */

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include "errors.hpp"
#include "filerecord.hpp"
#include "localfilesystem.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <string>

/**
 * @class TempDirTest
 * @brief Fixture providing an isolated directory below temp_directory_path()
 *
 * The directory is named after the running test, removed before and after
 * the test. Files are created with explicit permissions (0644 unless told
 * otherwise) so results do not depend on the umask.
 */
class TempDirTest : public ::testing::Test {
protected:
    /** @brief Path to the test directory */
    std::filesystem::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("cleanfiles_") + info->test_suite_name() + "_" +
                    info->name());

        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    /**
     * @brief Creates a file (and its parent directories) below test_dir
     *
     * @param relative Path relative to test_dir
     * @param content File content
     * @param perms rwx bits to set
     * @return Absolute path of the file
     */
    std::filesystem::path createFile(const std::filesystem::path& relative,
                                     const std::string& content = "",
                                     unsigned perms = 0644) {
        auto path = test_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
        std::filesystem::permissions(path, static_cast<std::filesystem::perms>(perms),
                                     std::filesystem::perm_options::replace);
        return path;
    }

    std::filesystem::path createDir(const std::filesystem::path& relative) {
        auto path = test_dir / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    /** @brief Sets the modification time to @p hours in the past */
    static void setAge(const std::filesystem::path& path, int hours) {
        std::filesystem::last_write_time(
            path, std::filesystem::file_time_type::clock::now() -
                      std::chrono::hours(hours));
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

    static unsigned permsOf(const std::filesystem::path& path) {
        return static_cast<unsigned>(std::filesystem::status(path).permissions() &
                                     std::filesystem::perms::all);
    }
};

/**
 * @class FaultyFileSystem
 * @brief Real filesystem that fails on selected paths
 *
 * Every set holds paths for which the matching operation throws the error
 * the interface documents. All calls to mutating operations are counted.
 */
class FaultyFileSystem : public LocalFileSystem {
public:
    std::set<std::filesystem::path> failList;
    /** @brief Directories whose entries cannot be stat'ed (no search permission) */
    std::set<std::filesystem::path> failStatIn;
    std::set<std::filesystem::path> failRead;
    std::set<std::filesystem::path> failRemove;
    std::set<std::filesystem::path> failRename;
    std::set<std::filesystem::path> failChmod;
    std::set<std::filesystem::path> failMove;
    std::set<std::filesystem::path> failRemoveDir;

    int mutations = 0;

    std::vector<DirEntry> listEntries(const std::filesystem::path& dir) const override {
        if (failList.count(dir)) {
            throw ScanError("Cannot read directory: " + dir.string());
        }
        return LocalFileSystem::listEntries(dir);
    }

    std::optional<FileStat> stat(const std::filesystem::path& path) const override {
        if (failStatIn.count(path.parent_path())) {
            throw ScanError("Cannot stat " + path.string() + ": Permission denied");
        }
        return LocalFileSystem::stat(path);
    }

    void readBytes(const std::filesystem::path& path, const ChunkSink& sink) const override {
        if (failRead.count(path)) {
            throw HashError("Cannot read file: " + path.string());
        }
        LocalFileSystem::readBytes(path, sink);
    }

    void remove(const std::filesystem::path& path) override {
        ++mutations;
        if (failRemove.count(path)) {
            throw ActionError("Permission denied: " + path.string());
        }
        LocalFileSystem::remove(path);
    }

    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override {
        ++mutations;
        if (failRename.count(from)) {
            throw ActionError("Permission denied: " + from.string());
        }
        LocalFileSystem::rename(from, to);
    }

    void setPermissions(const std::filesystem::path& path, unsigned bits) override {
        ++mutations;
        if (failChmod.count(path)) {
            throw ActionError("Permission denied: " + path.string());
        }
        LocalFileSystem::setPermissions(path, bits);
    }

    void move(const std::filesystem::path& from, const std::filesystem::path& to) override {
        ++mutations;
        if (failMove.count(from)) {
            throw ActionError("Permission denied: " + from.string());
        }
        LocalFileSystem::move(from, to);
    }

    void removeEmptyDir(const std::filesystem::path& dir) override {
        ++mutations;
        if (failRemoveDir.count(dir)) {
            throw ActionError("Permission denied: " + dir.string());
        }
        LocalFileSystem::removeEmptyDir(dir);
    }
};

#endif // TEST_HELPERS_HPP
