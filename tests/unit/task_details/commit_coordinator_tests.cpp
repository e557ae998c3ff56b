#include <gtest/gtest.h>

#include "taskpad/details/commit_coordinator.hpp"

#include <string>
#include <vector>

namespace
{

class CommitCoordinatorTest : public ::testing::Test
{
protected:
    taskpad::details::EditSession session{"Hello"};
    std::vector<std::string> commits;
    taskpad::details::CommitCoordinator coordinator{session, [this](const std::string &value) {
                                                        commits.push_back(value);
                                                    }};
};

} // namespace

TEST_F(CommitCoordinatorTest, EqualValueIsNotPersisted)
{
    EXPECT_FALSE(coordinator.attemptCommit("Hello"));
    EXPECT_TRUE(commits.empty());
}

TEST_F(CommitCoordinatorTest, LineEndingDifferencesAreNotChanges)
{
    session.setCommittedValue("one\ntwo");
    EXPECT_FALSE(coordinator.differsFromCommitted("one\r\ntwo"));
    EXPECT_FALSE(coordinator.attemptCommit("one\r\ntwo"));
    EXPECT_TRUE(commits.empty());
}

TEST_F(CommitCoordinatorTest, ChangedValueIsPersistedOnceAndMirrored)
{
    EXPECT_TRUE(coordinator.attemptCommit("Hello World"));
    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("Hello World", commits.front());
    EXPECT_EQ("Hello World", session.committedValue());

    EXPECT_FALSE(coordinator.attemptCommit("Hello World"));
    EXPECT_EQ(1u, commits.size());
}

TEST_F(CommitCoordinatorTest, HookReceivesNormalizedValue)
{
    EXPECT_TRUE(coordinator.attemptCommit("a\r\nb"));
    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("a\nb", commits.front());
    EXPECT_EQ("a\nb", session.committedValue());
}

TEST(CommitCoordinator, ThrowingHookLeavesMirrorAdvanced)
{
    taskpad::details::EditSession session("before");
    taskpad::details::CommitCoordinator coordinator(session, [](const std::string &) {
        throw std::runtime_error("disk full");
    });

    EXPECT_THROW(coordinator.attemptCommit("after"), std::runtime_error);
    EXPECT_EQ("after", session.committedValue());
}

TEST(CommitCoordinator, MissingHookStillStages)
{
    taskpad::details::EditSession session("a");
    taskpad::details::CommitCoordinator coordinator(session, {});
    EXPECT_TRUE(coordinator.attemptCommit("b"));
    EXPECT_EQ("b", session.committedValue());
}
