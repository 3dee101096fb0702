#include <gtest/gtest.h>
#include <stdexcept>
#include "../../src/engine/crawler/chapter_task.hpp"

using namespace Binder::Engine;

TEST(ChapterTaskTest, SuccessfulLifecycle) {
    ChapterTask task(0, "https://b.test/0");
    EXPECT_EQ(task.state(), TaskState::Pending);

    task.advance(TaskState::TokenAcquired);
    task.advance(TaskState::Claimed);
    task.advance(TaskState::Fetching);
    task.advance(TaskState::Succeeded);
    task.advance(TaskState::Terminated);

    EXPECT_EQ(task.state(), TaskState::Terminated);
    EXPECT_EQ(task.outcome(), TaskState::Succeeded);
}

TEST(ChapterTaskTest, RejectedDuplicate) {
    ChapterTask task(4, "https://b.test/0");
    task.advance(TaskState::TokenAcquired);
    task.advance(TaskState::Rejected);
    task.advance(TaskState::Terminated);
    EXPECT_EQ(task.outcome(), TaskState::Rejected);
}

TEST(ChapterTaskTest, CancelledWhileWaiting) {
    ChapterTask task(1, "https://b.test/1");
    task.advance(TaskState::Cancelled);
    task.advance(TaskState::Terminated);
    EXPECT_EQ(task.outcome(), TaskState::Cancelled);
}

TEST(ChapterTaskTest, InvalidTransitionsThrow) {
    ChapterTask task(0, "https://b.test/0");
    EXPECT_THROW(task.advance(TaskState::Fetching), std::logic_error);
    EXPECT_THROW(task.advance(TaskState::Succeeded), std::logic_error);

    task.advance(TaskState::TokenAcquired);
    task.advance(TaskState::Rejected);
    EXPECT_THROW(task.advance(TaskState::Fetching), std::logic_error);

    task.advance(TaskState::Terminated);
    EXPECT_THROW(task.advance(TaskState::Pending), std::logic_error);
}

TEST(ChapterTaskTest, TransitionTable) {
    EXPECT_TRUE(can_transition(TaskState::Fetching, TaskState::Failed));
    EXPECT_TRUE(can_transition(TaskState::Fetching, TaskState::Cancelled));
    EXPECT_FALSE(can_transition(TaskState::Claimed, TaskState::Succeeded));
    EXPECT_FALSE(can_transition(TaskState::Succeeded, TaskState::Failed));
    EXPECT_TRUE(is_outcome(TaskState::Rejected));
    EXPECT_FALSE(is_outcome(TaskState::Fetching));
    EXPECT_STREQ(to_string(TaskState::TokenAcquired), "TokenAcquired");
}

TEST(ChapterTaskTest, NextChapterIndex) {
    ChapterTask task(2, "https://b.test/2");
    auto        next = task.next("https://b.test/3");
    EXPECT_EQ(next.index(), 3u);
    EXPECT_EQ(next.url(), "https://b.test/3");
    EXPECT_EQ(next.state(), TaskState::Pending);
}
