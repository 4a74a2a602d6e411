/**
 * @file test_commandline.cpp
 * @brief Unit tests for argument parsing, root selection and config loading
 *
 * @see CommandLine
 * @see selectRoots
 * @see loadRunConfig
 */

#include "cleanrun.hpp"
#include "commandline.hpp"
#include "sha256hasher.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

namespace fs = std::filesystem;

class CommandLineTest : public TempDirTest {
protected:
    static CommandLine parseArgs(std::vector<std::string> args) {
        args.insert(args.begin(), "cleanfiles");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return CommandLine::parse(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(CommandLineTest, ParsesOptionsAndRoots) {
    auto cmd = parseArgs({"-y", "--config", "my.ini", "X", "--dry-run", "Y", "Z"});

    EXPECT_TRUE(cmd.assumeYes);
    EXPECT_TRUE(cmd.dryRun);
    EXPECT_FALSE(cmd.showHelp);
    EXPECT_EQ(cmd.configPath, fs::path("my.ini"));
    ASSERT_EQ(cmd.roots.size(), 3u);
    EXPECT_EQ(cmd.roots[0], fs::path("X"));
    EXPECT_EQ(cmd.roots[2], fs::path("Z"));
}

/**
 * @test RejectsBadArguments
 * @brief Unknown options, a dangling -c and a lone directory are usage errors
 */
TEST_F(CommandLineTest, RejectsBadArguments) {
    EXPECT_THROW(parseArgs({"--frobnicate", "X", "Y"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"X", "Y", "-c"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"X"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({}), std::invalid_argument);
}

TEST_F(CommandLineTest, HelpNeedsNoDirectories) {
    auto cmd = parseArgs({"--help"});

    EXPECT_TRUE(cmd.showHelp);
    EXPECT_NE(CommandLine::usage("cleanfiles").find("<canonical-dir>"), std::string::npos);
}

TEST_F(CommandLineTest, SelectsExistingRoots) {
    auto x = createDir("X");
    auto y = createDir("Y");

    auto selection = selectRoots({x, y / "sub" / ".."});

    ASSERT_TRUE(selection.ok());
    ASSERT_EQ(selection.roots.size(), 2u);
    EXPECT_EQ(selection.roots[0], x);
    EXPECT_EQ(selection.roots[1], y);
    EXPECT_TRUE(selection.errors.empty());
}

/**
 * @test MissingSourceIsSkipped
 * @brief One missing source is a warning as long as another source remains
 */
TEST_F(CommandLineTest, MissingSourceIsSkipped) {
    auto x = createDir("X");
    auto y = createDir("Y");

    auto selection = selectRoots({x, test_dir / "nope", y});

    ASSERT_TRUE(selection.ok());
    EXPECT_EQ(selection.roots.size(), 2u);
    ASSERT_EQ(selection.warnings.size(), 1u);
    EXPECT_NE(selection.warnings[0].find("Skipping source"), std::string::npos);
}

TEST_F(CommandLineTest, NoUsableSourceIsError) {
    auto x = createDir("X");
    createFile("plain.txt", "not a dir");

    auto selection = selectRoots({x, test_dir / "plain.txt"});

    EXPECT_FALSE(selection.ok());
    ASSERT_FALSE(selection.errors.empty());
    EXPECT_EQ(selection.errors.back(), "No usable source directory");
}

TEST_F(CommandLineTest, MissingCanonicalIsError) {
    auto y = createDir("Y");

    auto selection = selectRoots({test_dir / "missing", y});

    EXPECT_FALSE(selection.ok());
    EXPECT_TRUE(selection.roots.empty());
    ASSERT_FALSE(selection.errors.empty());
    EXPECT_NE(selection.errors[0].find("Canonical directory"), std::string::npos);
}

/**
 * @test SystemDirectoryIsRefused
 * @brief A blocked root fails the whole selection
 */
TEST_F(CommandLineTest, SystemDirectoryIsRefused) {
    auto x = createDir("X");

    auto selection = selectRoots({x, "/etc"});

    EXPECT_FALSE(selection.ok());
    EXPECT_TRUE(selection.roots.empty());
    ASSERT_EQ(selection.errors.size(), 1u);
    EXPECT_NE(selection.errors[0].find("/etc"), std::string::npos);
}

/**
 * @test SymlinkedRootsAreResolved
 * @brief A root given as a symlink is scanned as the directory it points to
 *
 * Y links to real_y holding a temp file, C links to the canonical X. The
 * temp file is found, and the copy in real_y is recognized as a duplicate
 * of the file in X instead of being moved next to it.
 */
TEST_F(CommandLineTest, SymlinkedRootsAreResolved) {
    auto real_x = createDir("X");
    auto real_y = createDir("real_y");
    createFile("X/a.txt", "same");
    createFile("real_y/a.txt", "same");
    createFile("real_y/b.tmp", "scratch");
    fs::create_directory_symlink(real_x, test_dir / "C");
    fs::create_directory_symlink(real_y, test_dir / "Y");

    auto selection = selectRoots({test_dir / "C", test_dir / "Y"});

    ASSERT_TRUE(selection.ok());
    ASSERT_EQ(selection.roots.size(), 2u);
    EXPECT_EQ(selection.roots[0], fs::canonical(real_x));
    EXPECT_EQ(selection.roots[1], fs::canonical(real_y));

    LocalFileSystem local_fs;
    Sha256Hasher hasher(local_fs);
    CleanRun run(local_fs, hasher, Config(), selection.roots);
    const auto& proposals = run.analyze();

    EXPECT_TRUE(run.warnings().empty());
    EXPECT_EQ(run.scan().records.size(), 3u);
    ASSERT_EQ(proposals.size(), 2u);
    EXPECT_EQ(proposals[0].getKind(), ActionKind::TempFile);
    EXPECT_EQ(proposals[1].getKind(), ActionKind::Duplicate);
    EXPECT_EQ(proposals[1].payload<DuplicatePayload>().survivor,
              fs::canonical(real_x) / "a.txt");
}

/**
 * @test MissingConfigWritesDefaults
 * @brief A missing settings file yields defaults and is created for editing
 */
TEST_F(CommandLineTest, MissingConfigWritesDefaults) {
    auto path = test_dir / "clean_files.ini";
    std::vector<std::string> warnings;

    Config config = loadRunConfig(path, warnings);

    EXPECT_EQ(config.suggestedPermissions, 0644u);
    EXPECT_EQ(warnings.size(), 2u);
    ASSERT_TRUE(fs::exists(path));
    EXPECT_NE(readFile(path).find("[Settings]"), std::string::npos);

    // second run reads the written file silently
    warnings.clear();
    Config again = loadRunConfig(path, warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(again.troublesomeChars, config.troublesomeChars);
}

TEST_F(CommandLineTest, UnwritableDefaultIsOnlyAWarning) {
    auto path = test_dir / "no_such_dir" / "clean_files.ini";
    std::vector<std::string> warnings;

    Config config = loadRunConfig(path, warnings);

    EXPECT_EQ(config.substitute, '_');
    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(CommandLineTest, MalformedConfigThrows) {
    auto path = createFile("bad.ini", "[Settings]\nchar_substitute = ab\n");
    std::vector<std::string> warnings;

    EXPECT_THROW(loadRunConfig(path, warnings), ConfigError);
}
