#include "rup/client/upload_queue.hpp"

#include "support/upload_fixture.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using rup::client::QueueOptions;
using rup::client::QueueState;
using rup::client::TaskStatus;
using rup::client::TaskStore;
using rup::client::TransferEngine;
using rup::client::TusClient;
using rup::client::UploadQueue;
using rup::client::UploadTask;
using rup::network::HttpMethod;
using rup::network::HttpRequest;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

class UploadQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = rup::test::create_temp_dir("rup_queue");
        store_ = std::make_unique<TaskStore>(dir_ / "tasks.json");

        options_.max_concurrent = 2;
        options_.engine.chunk_size = 1024;
        options_.engine.checksum_algorithm = std::nullopt;
        options_.engine.max_retries = 3;
    }

    void TearDown() override {
        queue_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    UploadQueue& make_queue() {
        queue_ = std::make_unique<UploadQueue>(*store_, client_, options_,
                                               [](std::chrono::milliseconds, const TransferEngine::StopPredicate&) {
                                                   return true;
                                               });
        return *queue_;
    }

    /// Queue that really sleeps between retries.
    UploadQueue& make_sleeping_queue() {
        queue_ = std::make_unique<UploadQueue>(*store_, client_, options_);
        return *queue_;
    }

    /// Blocks until the transport has seen `count` requests.
    bool wait_for_sent(int count, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (transport_.sent.load() < count) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    fs::path make_file(const std::string& name, std::size_t size, uint8_t seed = 7) {
        const auto path = dir_ / name;
        rup::test::write_file(path, rup::test::make_bytes(size, seed));
        return path;
    }

    /// Server session holding the first `sent` bytes of the file.
    std::string server_session(const fs::path& file, std::uint64_t sent) {
        const auto bytes = rup::test::read_file(file);
        auto created = client_.create(bytes.size(), {});
        EXPECT_TRUE(created.is_ok());
        if (sent > 0) {
            std::vector<uint8_t> head(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(sent));
            EXPECT_TRUE(client_.patch(created.value(), 0, head).is_ok());
        }
        return created.value();
    }

    UploadTask stored_task(const std::string& id, const fs::path& file, TaskStatus status,
                           const std::string& session_url) {
        UploadTask task;
        task.id = id;
        task.file_reference = file;
        task.declared_size = fs::file_size(file);
        task.status = status;
        task.session_url = session_url;
        return task;
    }

    std::vector<uint8_t> object_for(const UploadTask& task) {
        auto object = server_.objects.object("mem://" + task.session_id());
        return object ? *object : std::vector<uint8_t>{};
    }

    rup::test::UploadServerFixture server_;
    rup::test::LoopbackTransport transport_{server_.router};
    TusClient client_{transport_, "/files", "token-alice"};

    fs::path dir_;
    std::unique_ptr<TaskStore> store_;
    QueueOptions options_;
    std::unique_ptr<UploadQueue> queue_;
};

} // namespace

TEST_F(UploadQueueTest, UploadsEveryQueuedFile) {
    auto& queue = make_queue();
    const auto a = make_file("a.bin", 5000, 1);
    const auto b = make_file("b.bin", 3000, 2);
    const auto c = make_file("c.bin", 0, 3);

    auto id_a = queue.enqueue(a, {{"target_ref", "post-1"}});
    auto id_b = queue.enqueue(b);
    auto id_c = queue.enqueue(c);
    ASSERT_TRUE(id_a.is_ok() && id_b.is_ok() && id_c.is_ok());

    queue.start();
    ASSERT_TRUE(queue.wait_idle(10s));
    queue.stop();

    for (const auto& [id, file] : {std::make_pair(id_a.value(), a), std::make_pair(id_b.value(), b),
                                   std::make_pair(id_c.value(), c)}) {
        auto task = queue.get(id);
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task->status, TaskStatus::Completed);
        EXPECT_TRUE(task->completed_at.has_value());
        EXPECT_EQ(object_for(*task), rup::test::read_file(file));
    }

    auto first = queue.get(id_a.value());
    EXPECT_EQ(first->metadata.at("filename"), "a.bin");
    auto session = server_.manager.get_session(first->session_id(), "alice");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().target_ref, "post-1");

    auto persisted = store_->load();
    ASSERT_TRUE(persisted.is_ok());
    ASSERT_EQ(persisted.value().tasks.size(), 3u);
    for (const auto& task : persisted.value().tasks) {
        EXPECT_EQ(task.status, TaskStatus::Completed);
    }
}

TEST_F(UploadQueueTest, EnqueueRejectsMissingFileAndDirectories) {
    auto& queue = make_queue();
    EXPECT_TRUE(queue.enqueue(dir_ / "nope.bin").is_error());
    EXPECT_TRUE(queue.enqueue(dir_).is_error());
    EXPECT_TRUE(queue.snapshot().empty());
}

TEST_F(UploadQueueTest, PausedTaskWaitsForResume) {
    auto& queue = make_queue();
    auto id = queue.enqueue(make_file("a.bin", 2048));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(queue.pause(id.value()).is_ok());

    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));
    EXPECT_EQ(queue.get(id.value())->status, TaskStatus::Paused);
    EXPECT_EQ(transport_.sent.load(), 0);

    ASSERT_TRUE(queue.resume(id.value()).is_ok());
    ASSERT_TRUE(queue.wait_idle(5s));
    EXPECT_EQ(queue.get(id.value())->status, TaskStatus::Completed);
}

TEST_F(UploadQueueTest, PauseDuringTransferStopsAtChunkBoundary) {
    auto& queue = make_queue();
    const auto file = make_file("a.bin", 4096);
    auto id = queue.enqueue(file);
    ASSERT_TRUE(id.is_ok());

    std::atomic<bool> paused{false};
    const std::string task_id = id.value();
    transport_.set_mutator([&](HttpRequest& request) {
        if (request.method == HttpMethod::PATCH && !paused.exchange(true)) {
            EXPECT_TRUE(queue.pause(task_id).is_ok());
        }
    });

    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));

    auto task = queue.get(task_id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::Paused);
    EXPECT_EQ(task->bytes_transferred, 1024u);
    ASSERT_TRUE(task->has_session());

    ASSERT_TRUE(queue.resume(task_id).is_ok());
    ASSERT_TRUE(queue.wait_idle(5s));
    task = queue.get(task_id);
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_EQ(object_for(*task), rup::test::read_file(file));
}

TEST_F(UploadQueueTest, PauseDuringBackoffTakesEffectImmediately) {
    options_.engine.initial_backoff = 30s;
    auto& queue = make_sleeping_queue();
    auto id = queue.enqueue(make_file("a.bin", 100));
    ASSERT_TRUE(id.is_ok());

    transport_.fail_next = 100;
    queue.start();
    ASSERT_TRUE(wait_for_sent(1, 5s));
    std::this_thread::sleep_for(100ms);

    const auto requested = std::chrono::steady_clock::now();
    ASSERT_TRUE(queue.pause(id.value()).is_ok());
    ASSERT_TRUE(queue.wait_idle(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - requested, 2s);
    EXPECT_EQ(queue.get(id.value())->status, TaskStatus::Paused);
    EXPECT_EQ(transport_.sent.load(), 1);
    queue.stop();
}

TEST_F(UploadQueueTest, StopDuringBackoffReturnsPromptly) {
    options_.engine.initial_backoff = 30s;
    auto& queue = make_sleeping_queue();
    auto id = queue.enqueue(make_file("a.bin", 100));
    ASSERT_TRUE(id.is_ok());

    transport_.fail_next = 100;
    queue.start();
    ASSERT_TRUE(wait_for_sent(1, 5s));
    std::this_thread::sleep_for(100ms);

    const auto requested = std::chrono::steady_clock::now();
    queue.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - requested, 2s);
    EXPECT_FALSE(queue.is_running());
    EXPECT_NE(queue.get(id.value())->status, TaskStatus::Failed);
}

TEST_F(UploadQueueTest, FailedTaskCanBeRetried) {
    options_.engine.max_retries = 1;
    auto& queue = make_queue();
    auto id = queue.enqueue(make_file("a.bin", 100));
    ASSERT_TRUE(id.is_ok());

    transport_.fail_next = 2;
    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));

    auto task = queue.get(id.value());
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->last_error.rfind("NetworkFailure", 0), 0u);
    EXPECT_TRUE(queue.resume(id.value()).is_error());

    ASSERT_TRUE(queue.retry(id.value()).is_ok());
    ASSERT_TRUE(queue.wait_idle(5s));
    task = queue.get(id.value());
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_TRUE(task->last_error.empty());
}

TEST_F(UploadQueueTest, RejectsIllegalControlRequests) {
    auto& queue = make_queue();
    auto id = queue.enqueue(make_file("a.bin", 10));
    ASSERT_TRUE(id.is_ok());

    EXPECT_TRUE(queue.resume(id.value()).is_error());
    EXPECT_TRUE(queue.retry(id.value()).is_error());
    EXPECT_TRUE(queue.pause("missing").is_error());
    EXPECT_TRUE(queue.cancel("missing").is_error());

    ASSERT_TRUE(queue.cancel(id.value()).is_ok());
    EXPECT_TRUE(queue.pause(id.value()).is_error());
    EXPECT_TRUE(queue.cancel(id.value()).is_ok());
}

TEST_F(UploadQueueTest, RestoreRequeuesInterruptedUploadAndResumesFromServerOffset) {
    const auto file = make_file("a.bin", 5000);
    const auto url = server_session(file, 3072);

    QueueState state;
    state.tasks.push_back(stored_task("t-1", file, TaskStatus::Uploading, url));
    ASSERT_TRUE(store_->save(state).is_ok());

    std::vector<std::string> offsets;
    transport_.set_mutator([&offsets](HttpRequest& request) {
        if (request.method == HttpMethod::PATCH) {
            offsets.push_back(request.get_header("Upload-Offset"));
        }
    });

    auto& queue = make_queue();
    ASSERT_TRUE(queue.restore().is_ok());
    EXPECT_EQ(queue.get("t-1")->status, TaskStatus::Queued);

    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));

    auto task = queue.get("t-1");
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_EQ(task->session_url, url);
    ASSERT_FALSE(offsets.empty());
    EXPECT_EQ(offsets.front(), "3072");
    EXPECT_EQ(object_for(*task), rup::test::read_file(file));
}

TEST_F(UploadQueueTest, CancelledSessionTerminationSurvivesOutage) {
    const auto file = make_file("a.bin", 4000);
    const auto url = server_session(file, 1024);

    QueueState state;
    state.tasks.push_back(stored_task("t-1", file, TaskStatus::Paused, url));
    ASSERT_TRUE(store_->save(state).is_ok());

    auto& queue = make_queue();
    ASSERT_TRUE(queue.restore().is_ok());

    transport_.fail_next = 1;
    ASSERT_TRUE(queue.cancel("t-1").is_ok());
    EXPECT_EQ(queue.get("t-1")->status, TaskStatus::Cancelled);

    ASSERT_EQ(queue.pending_terminations().size(), 1u);
    EXPECT_EQ(server_.sessions.size(), 1u);

    auto persisted = store_->load();
    ASSERT_TRUE(persisted.is_ok());
    ASSERT_EQ(persisted.value().pending_terminations.size(), 1u);
    EXPECT_EQ(persisted.value().pending_terminations[0], url);

    // A later process picks the termination up on restore
    queue_.reset();
    auto& restarted = make_queue();
    ASSERT_TRUE(restarted.restore().is_ok());
    EXPECT_TRUE(restarted.pending_terminations().empty());
    EXPECT_EQ(server_.sessions.size(), 0u);
    EXPECT_EQ(server_.objects.open_transfers(), 0u);
}

TEST_F(UploadQueueTest, ForegroundRefreshesOffsetsFromServer) {
    const auto file = make_file("a.bin", 4000);
    const auto url = server_session(file, 2048);

    QueueState state;
    state.tasks.push_back(stored_task("t-1", file, TaskStatus::Paused, url));
    ASSERT_TRUE(store_->save(state).is_ok());

    auto& queue = make_queue();
    ASSERT_TRUE(queue.restore().is_ok());
    EXPECT_EQ(queue.get("t-1")->bytes_transferred, 0u);

    queue.on_foreground();
    EXPECT_EQ(queue.get("t-1")->bytes_transferred, 2048u);
    EXPECT_EQ(queue.get("t-1")->status, TaskStatus::Paused);
}

TEST_F(UploadQueueTest, ForegroundDropsSessionTheServerForgot) {
    const auto file = make_file("a.bin", 4000);
    const auto url = server_session(file, 2048);

    auto task = stored_task("t-1", file, TaskStatus::Failed, url);
    task.bytes_transferred = 2048;
    QueueState state;
    state.tasks.push_back(task);
    ASSERT_TRUE(store_->save(state).is_ok());

    ASSERT_TRUE(server_.manager.terminate(task.session_id(), "alice").is_ok());

    auto& queue = make_queue();
    ASSERT_TRUE(queue.restore().is_ok());
    queue.on_foreground();

    auto refreshed = queue.get("t-1");
    EXPECT_FALSE(refreshed->has_session());
    EXPECT_EQ(refreshed->bytes_transferred, 0u);

    ASSERT_TRUE(queue.retry("t-1").is_ok());
    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));
    refreshed = queue.get("t-1");
    EXPECT_EQ(refreshed->status, TaskStatus::Completed);
    EXPECT_EQ(object_for(*refreshed), rup::test::read_file(file));
}

TEST_F(UploadQueueTest, ProgressCallbackSeesPersistedState) {
    auto& queue = make_queue();
    auto id = queue.enqueue(make_file("a.bin", 3000));
    ASSERT_TRUE(id.is_ok());

    std::mutex mutex;
    std::vector<std::uint64_t> seen;
    bool persisted_before_notify = true;
    queue.set_progress_callback([&](const UploadTask& task) {
        auto on_disk = store_->load();
        std::lock_guard lock(mutex);
        seen.push_back(task.bytes_transferred);
        if (on_disk.is_error() || on_disk.value().tasks.empty() ||
            on_disk.value().tasks[0].bytes_transferred != task.bytes_transferred) {
            persisted_before_notify = false;
        }
    });

    queue.start();
    ASSERT_TRUE(queue.wait_idle(5s));
    queue.stop();

    std::lock_guard lock(mutex);
    EXPECT_TRUE(persisted_before_notify);
    EXPECT_NE(std::find(seen.begin(), seen.end(), 1024u), seen.end());
    EXPECT_EQ(seen.back(), 3000u);
}
