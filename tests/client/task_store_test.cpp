#include "rup/client/task_store.hpp"

#include "support/test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using rup::client::QueueState;
using rup::client::TaskStatus;
using rup::client::TaskStore;
using rup::client::UploadTask;

namespace fs = std::filesystem;

class TaskStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = rup::test::create_temp_dir("rup_task_store");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(TaskStoreTest, MissingFileIsEmptyQueue) {
    TaskStore store(dir_ / "tasks.json");
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().tasks.empty());
    EXPECT_TRUE(loaded.value().pending_terminations.empty());
}

TEST_F(TaskStoreTest, SavedStateIsLoadedBack) {
    const auto created = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

    UploadTask done;
    done.id = "t-1";
    done.session_url = "/files/aaa";
    done.file_reference = "/videos/clip one.mp4";
    done.declared_size = 10485760;
    done.bytes_transferred = 10485760;
    done.status = TaskStatus::Completed;
    done.metadata = {{"filename", "clip one.mp4"}, {"target_ref", "post-3"}};
    done.created_at = created;
    done.completed_at = created + std::chrono::seconds(90);

    UploadTask failed;
    failed.id = "t-2";
    failed.file_reference = "/videos/other.mp4";
    failed.declared_size = 42;
    failed.status = TaskStatus::Failed;
    failed.last_error = "NetworkFailure: connection refused";
    failed.created_at = created;

    QueueState state;
    state.tasks = {done, failed};
    state.pending_terminations = {"/files/zzz"};

    TaskStore store(dir_ / "nested" / "tasks.json");
    ASSERT_TRUE(store.save(state).is_ok());

    auto loaded = TaskStore(dir_ / "nested" / "tasks.json").load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    const auto& tasks = loaded.value().tasks;
    ASSERT_EQ(tasks.size(), 2u);

    EXPECT_EQ(tasks[0].id, "t-1");
    EXPECT_EQ(tasks[0].session_url, "/files/aaa");
    EXPECT_EQ(tasks[0].file_reference, fs::path("/videos/clip one.mp4"));
    EXPECT_EQ(tasks[0].bytes_transferred, 10485760u);
    EXPECT_EQ(tasks[0].status, TaskStatus::Completed);
    EXPECT_EQ(tasks[0].metadata.at("target_ref"), "post-3");
    EXPECT_EQ(tasks[0].created_at, created);
    ASSERT_TRUE(tasks[0].completed_at.has_value());
    EXPECT_EQ(*tasks[0].completed_at, created + std::chrono::seconds(90));

    EXPECT_EQ(tasks[1].status, TaskStatus::Failed);
    EXPECT_EQ(tasks[1].last_error, "NetworkFailure: connection refused");
    EXPECT_FALSE(tasks[1].has_session());
    EXPECT_FALSE(tasks[1].completed_at.has_value());

    ASSERT_EQ(loaded.value().pending_terminations.size(), 1u);
    EXPECT_EQ(loaded.value().pending_terminations[0], "/files/zzz");
}

TEST_F(TaskStoreTest, NonUtf8PathsAndMetadataRoundTrip) {
    UploadTask task;
    task.id = "t-raw";
    task.file_reference = fs::path("/videos/clip\xff.mp4");
    task.declared_size = 7;
    task.metadata = {{"filename", "clip\xff.mp4"}, {"target_ref", "post-9"}};
    task.last_error = "server said \xfe";

    QueueState state;
    state.tasks = {task};

    TaskStore store(dir_ / "tasks.json");
    auto saved = store.save(state);
    ASSERT_TRUE(saved.is_ok()) << saved.error();

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    ASSERT_EQ(loaded.value().tasks.size(), 1u);
    EXPECT_EQ(loaded.value().tasks[0].file_reference, task.file_reference);
    EXPECT_EQ(loaded.value().tasks[0].metadata, task.metadata);
    EXPECT_FALSE(loaded.value().tasks[0].last_error.empty());
}

TEST_F(TaskStoreTest, SaveReplacesPreviousState) {
    TaskStore store(dir_ / "tasks.json");

    QueueState first;
    first.tasks.resize(3);
    for (std::size_t i = 0; i < first.tasks.size(); ++i) {
        first.tasks[i].id = "t" + std::to_string(i);
        first.tasks[i].file_reference = "/f";
    }
    ASSERT_TRUE(store.save(first).is_ok());
    ASSERT_TRUE(store.save(QueueState{}).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().tasks.empty());
    EXPECT_FALSE(fs::exists(dir_ / "tasks.json.tmp"));
}

TEST_F(TaskStoreTest, CorruptFileIsAnError) {
    std::ofstream(dir_ / "tasks.json") << "{\"tasks\": [ {\"id\": 5 ";
    TaskStore store(dir_ / "tasks.json");
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("Corrupt"), std::string::npos);
}
