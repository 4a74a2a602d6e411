/**
 * @file test_proposedaction.cpp
 * @brief Unit tests for ProposedAction and the kind ordering tables
 *
 * @see ProposedAction
 */

#include "proposedaction.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace fs = std::filesystem;

class ProposedActionTest : public ::testing::Test {
protected:
    FileRecord makeRecord(const fs::path& path, unsigned perms = 0644) const {
        return FileRecord(path, "/data/Y", RootKind::Source, 10,
                          fs::file_time_type::clock::now(), perms);
    }
};

/**
 * @test RejectsMismatchedPayload
 * @brief The payload alternative must match the kind
 */
TEST_F(ProposedActionTest, RejectsMismatchedPayload) {
    auto record = makeRecord("/data/Y/a.txt");

    EXPECT_THROW(ProposedAction(ActionKind::EmptyFile, record, TempFilePayload{".tmp"}),
                 std::invalid_argument);
    EXPECT_THROW(ProposedAction(ActionKind::Rename, record, EmptyFilePayload{}),
                 std::invalid_argument);
    EXPECT_NO_THROW(ProposedAction(ActionKind::EmptyFile, record, EmptyFilePayload{}));
}

TEST_F(ProposedActionTest, RejectsIncompletePayload) {
    auto record = makeRecord("/data/Y/a.txt");

    // survivor equal to the target
    EXPECT_THROW(ProposedAction(ActionKind::Duplicate, record,
                                DuplicatePayload{"/data/Y/a.txt"}),
                 std::invalid_argument);
    EXPECT_THROW(ProposedAction(ActionKind::VersionConflict, record,
                                VersionConflictPayload{}),
                 std::invalid_argument);
    // rename must stay in the same directory
    EXPECT_THROW(ProposedAction(ActionKind::Rename, record,
                                RenamePayload{"/data/X/b.txt"}),
                 std::invalid_argument);
    EXPECT_THROW(ProposedAction(ActionKind::Permissions, record,
                                PermissionsPayload{0644, 01777}),
                 std::invalid_argument);
    EXPECT_THROW(ProposedAction(ActionKind::MoveOriginal, record,
                                MoveOriginalPayload{}),
                 std::invalid_argument);
}

TEST_F(ProposedActionTest, DescribesEveryKind) {
    auto record = makeRecord("/data/Y/a?.txt", 0600);

    EXPECT_EQ(ProposedAction(ActionKind::EmptyFile, record, EmptyFilePayload{}).describe(),
              "empty file (size = 0)");
    EXPECT_EQ(ProposedAction(ActionKind::TempFile, record, TempFilePayload{".tmp"}).describe(),
              "temporary file (.tmp)");
    EXPECT_EQ(ProposedAction(ActionKind::Duplicate, record,
                             DuplicatePayload{"/data/X/a.txt"}).describe(),
              "identical content, original: /data/X/a.txt");
    EXPECT_EQ(ProposedAction(ActionKind::VersionConflict, record,
                             VersionConflictPayload{"/data/X/a?.txt"}).describe(),
              "older version, newest: /data/X/a?.txt");
    EXPECT_EQ(ProposedAction(ActionKind::Rename, record,
                             RenamePayload{"/data/Y/a_.txt"}).describe(),
              "troublesome characters, new name: a_.txt");
    EXPECT_EQ(ProposedAction(ActionKind::Permissions, record,
                             PermissionsPayload{0600, 0644}).describe(),
              "permissions rw------- -> rw-r--r--");
    EXPECT_EQ(ProposedAction(ActionKind::MoveOriginal, record,
                             MoveOriginalPayload{"/data/X/a?.txt", std::nullopt}).describe(),
              "original outside canonical directory, move to: /data/X/a?.txt");
}

/**
 * @test OrderingTables
 * @brief Removals come first in both orders; moves run last
 */
TEST_F(ProposedActionTest, OrderingTables) {
    EXPECT_EQ(decisionRank(ActionKind::EmptyFile), 0u);
    EXPECT_EQ(decisionRank(ActionKind::MoveOriginal), 4u);
    EXPECT_EQ(decisionRank(ActionKind::Permissions), 6u);

    EXPECT_EQ(executionRank(ActionKind::Rename), 4u);
    EXPECT_EQ(executionRank(ActionKind::Permissions), 5u);
    EXPECT_EQ(executionRank(ActionKind::MoveOriginal), 6u);

    EXPECT_TRUE(isRemoval(ActionKind::Duplicate));
    EXPECT_TRUE(isRemoval(ActionKind::VersionConflict));
    EXPECT_FALSE(isRemoval(ActionKind::Rename));
    EXPECT_FALSE(isRemoval(ActionKind::MoveOriginal));

    EXPECT_EQ(actionKindName(ActionKind::VersionConflict), "VERSION_CONFLICT");
    EXPECT_EQ(actionKindName(ActionKind::MoveOriginal), "MOVE_ORIGINAL");
}
