#include "rup/client/upload_task.hpp"

#include <gtest/gtest.h>

using rup::client::TaskStatus;
using rup::client::UploadTask;
using rup::client::can_transition;

TEST(UploadTaskTest, HappyPathTransitions) {
    UploadTask task;
    EXPECT_EQ(task.status, TaskStatus::Queued);

    ASSERT_TRUE(task.transition_to(TaskStatus::Uploading).is_ok());
    ASSERT_TRUE(task.transition_to(TaskStatus::Completed).is_ok());
    EXPECT_TRUE(task.is_terminal());
}

TEST(UploadTaskTest, PauseResumeAndRetry) {
    EXPECT_TRUE(can_transition(TaskStatus::Uploading, TaskStatus::Paused));
    EXPECT_TRUE(can_transition(TaskStatus::Paused, TaskStatus::Queued));
    EXPECT_TRUE(can_transition(TaskStatus::Uploading, TaskStatus::Failed));
    EXPECT_TRUE(can_transition(TaskStatus::Failed, TaskStatus::Queued));
    EXPECT_TRUE(can_transition(TaskStatus::Uploading, TaskStatus::Queued));
}

TEST(UploadTaskTest, AnyLiveStateMayBeCancelled) {
    for (auto from : {TaskStatus::Queued, TaskStatus::Uploading, TaskStatus::Paused, TaskStatus::Failed}) {
        EXPECT_TRUE(can_transition(from, TaskStatus::Cancelled)) << rup::client::to_string(from);
    }
}

TEST(UploadTaskTest, TerminalStatesAreFinal) {
    for (auto to : {TaskStatus::Queued, TaskStatus::Uploading, TaskStatus::Paused,
                    TaskStatus::Failed, TaskStatus::Cancelled}) {
        EXPECT_FALSE(can_transition(TaskStatus::Completed, to));
    }
    for (auto to : {TaskStatus::Queued, TaskStatus::Uploading, TaskStatus::Completed}) {
        EXPECT_FALSE(can_transition(TaskStatus::Cancelled, to));
    }
}

TEST(UploadTaskTest, IllegalTransitionIsReportedAndIgnored) {
    UploadTask task;
    task.status = TaskStatus::Failed;

    auto moved = task.transition_to(TaskStatus::Completed);
    ASSERT_TRUE(moved.is_error());
    EXPECT_NE(moved.error().find("failed -> completed"), std::string::npos);
    EXPECT_EQ(task.status, TaskStatus::Failed);

    EXPECT_FALSE(can_transition(TaskStatus::Queued, TaskStatus::Completed));
}

TEST(UploadTaskTest, SameStatusIsNoOp) {
    UploadTask task;
    task.status = TaskStatus::Completed;
    EXPECT_TRUE(task.transition_to(TaskStatus::Completed).is_ok());
}

TEST(UploadTaskTest, StatusNamesRoundTrip) {
    for (auto status : {TaskStatus::Queued, TaskStatus::Uploading, TaskStatus::Paused,
                        TaskStatus::Completed, TaskStatus::Failed, TaskStatus::Cancelled}) {
        auto parsed = rup::client::parse_task_status(rup::client::to_string(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(rup::client::parse_task_status("done").has_value());
}

TEST(UploadTaskTest, SessionIdAndProgress) {
    UploadTask task;
    task.session_url = "https://uploads.example.com/files/abc123";
    task.declared_size = 400;
    task.bytes_transferred = 100;

    EXPECT_EQ(task.session_id(), "abc123");
    EXPECT_TRUE(task.has_session());
    EXPECT_DOUBLE_EQ(task.progress(), 25.0);

    UploadTask empty;
    EXPECT_DOUBLE_EQ(empty.progress(), 0.0);
    empty.status = TaskStatus::Completed;
    EXPECT_DOUBLE_EQ(empty.progress(), 100.0);
}
