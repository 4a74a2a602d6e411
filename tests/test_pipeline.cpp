/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests of a CleanRun on a real directory tree
 *
 * @see CleanRun
 */

#include "cleanrun.hpp"
#include "sha256hasher.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class RejectAllPrompter : public IDecisionPrompter {
public:
    int prompts = 0;

    Answer ask(const ProposedAction&, std::size_t, std::size_t) override {
        ++prompts;
        return Answer::NoToAll;
    }
};

/**
 * @class PipelineTest
 * @brief Canonical root X and source root Y with one case of every rule
 */
class PipelineTest : public TempDirTest {
protected:
    fs::path x;
    fs::path y;

    void SetUp() override {
        TempDirTest::SetUp();
        x = createDir("X");
        y = createDir("Y");

        createFile("X/a.txt", "shared", 0644);
        createFile("Y/a.txt", "shared", 0600);
        createFile("Y/b.tmp", "scratch");
        createFile("Y/notes?.txt", "meeting notes");
        createFile("Y/sub/e", "");
        auto old_log = createFile("X/log.txt", "old log");
        auto new_log = createFile("Y/deep/log.txt", "new log, longer");
        setAge(old_log, 24);
        setAge(new_log, 1);
    }
};

/**
 * @test ApproveAllLeavesCleanCanonical
 * @brief After approving everything only X remains, holding every kept file
 */
TEST_F(PipelineTest, ApproveAllLeavesCleanCanonical) {
    LocalFileSystem local_fs;
    Sha256Hasher hasher(local_fs);
    CleanRun run(local_fs, hasher, Config(), {x, y});

    const auto& proposals = run.analyze();
    EXPECT_FALSE(proposals.empty());
    EXPECT_EQ(run.canonicalRoot(), x);
    EXPECT_TRUE(run.warnings().empty());

    RejectAllPrompter prompter;
    DecisionState state = DecisionState::approveAll();
    auto decision = run.decide(prompter, state);
    EXPECT_EQ(prompter.prompts, 0);
    EXPECT_EQ(decision.approved.size(), proposals.size());

    auto report = run.execute(decision.approved);
    EXPECT_TRUE(report.failures().empty());

    auto cleanup = run.cleanup();
    EXPECT_TRUE(cleanup.warnings.empty());

    EXPECT_FALSE(fs::exists(y));
    EXPECT_EQ(readFile(x / "a.txt"), "shared");
    EXPECT_EQ(readFile(x / "notes_.txt"), "meeting notes");
    EXPECT_EQ(readFile(x / "log.txt"), "new log, longer");
    EXPECT_EQ(permsOf(x / "notes_.txt"), 0644u);
}

/**
 * @test SecondRunFindsNothing
 * @brief Running again on the result proposes no action
 */
TEST_F(PipelineTest, SecondRunFindsNothing) {
    LocalFileSystem local_fs;
    Sha256Hasher hasher(local_fs);
    {
        CleanRun first(local_fs, hasher, Config(), {x, y});
        first.analyze();
        RejectAllPrompter prompter;
        DecisionState state = DecisionState::approveAll();
        first.execute(first.decide(prompter, state).approved);
        first.cleanup();
    }

    createDir("Y");
    CleanRun second(local_fs, hasher, Config(), {x, y});
    EXPECT_TRUE(second.analyze().empty());
}

/**
 * @test RejectingEverythingChangesNothing
 * @brief "s" on the first prompt of every kind leaves the tree untouched
 */
TEST_F(PipelineTest, RejectingEverythingChangesNothing) {
    FaultyFileSystem counting_fs;
    Sha256Hasher hasher(counting_fs);
    CleanRun run(counting_fs, hasher, Config(), {x, y});
    run.analyze();

    RejectAllPrompter prompter;
    DecisionState state;
    auto decision = run.decide(prompter, state);
    auto report = run.execute(decision.approved);

    EXPECT_TRUE(decision.approved.empty());
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_EQ(counting_fs.mutations, 0);
    EXPECT_GT(prompter.prompts, 0);
    EXPECT_TRUE(fs::exists(y / "b.tmp"));
    EXPECT_TRUE(fs::exists(y / "notes?.txt"));
}

TEST_F(PipelineTest, ReportsUnreadableFiles) {
    FaultyFileSystem faulty;
    faulty.failRead.insert(y / "a.txt");
    Sha256Hasher hasher(faulty);
    CleanRun run(faulty, hasher, Config(), {x, y});

    const auto& proposals = run.analyze();

    ASSERT_EQ(run.warnings().size(), 1u);
    for (const auto& action : proposals) {
        if (action.getTarget().getPath() == y / "a.txt") {
            EXPECT_NE(action.getKind(), ActionKind::Duplicate);
        }
    }
}
