#pragma once

#include "rup/client/task_store.hpp"
#include "rup/client/transfer_engine.hpp"
#include "rup/client/tus_client.hpp"
#include "rup/client/upload_task.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rup::client {

struct QueueOptions {
    std::size_t max_concurrent = 2;
    EngineOptions engine;
};

/**
 * @brief Persistent multi-file upload queue
 *
 * Tasks run in FIFO order on max_concurrent worker threads, each one
 * driven by the TransferEngine. Every state change and every acknowledged
 * chunk is written to the TaskStore before observers are notified, so a
 * restart finds each task where the server left it.
 *
 * Cancelling a task that owns a server session records the session URL as
 * a pending termination; the DELETE is retried on restore and on every
 * foreground transition until the server acknowledges it.
 */
class UploadQueue {
public:
    using ProgressCallback = std::function<void(const UploadTask&)>;

    UploadQueue(TaskStore& store,
                TusClient& client,
                QueueOptions options,
                TransferEngine::Sleeper sleeper = {});
    ~UploadQueue();

    UploadQueue(const UploadQueue&) = delete;
    UploadQueue& operator=(const UploadQueue&) = delete;

    /**
     * @brief Load persisted tasks; interrupted uploads go back to Queued
     *
     * Pending terminations are flushed right away.
     */
    Result<void> restore();

    void start();
    void stop();
    bool is_running() const;

    /// Wait until no task is queued or uploading.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// @return Task id
    Result<std::string> enqueue(const std::filesystem::path& file,
                                std::map<std::string, std::string> metadata = {});

    Result<void> pause(const std::string& task_id);
    Result<void> resume(const std::string& task_id);
    Result<void> cancel(const std::string& task_id);
    Result<void> retry(const std::string& task_id);

    std::vector<UploadTask> snapshot() const;
    std::optional<UploadTask> get(const std::string& task_id) const;
    std::vector<std::string> pending_terminations() const;

    void set_progress_callback(ProgressCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Application lifecycle hooks
    // ═══════════════════════════════════════════════════════════

    /// Flush state to disk; running transfers keep going.
    void on_background();

    /**
     * @brief Reconcile idle tasks with the server before admitting new work
     *
     * Tasks holding a session get their offset refreshed by HEAD; sessions
     * the server no longer knows are dropped and restart from zero.
     */
    void on_foreground();

private:
    enum class Control { None, Pause, Cancel, Shutdown };

    struct Entry {
        UploadTask task;
        bool running = false;
        std::shared_ptr<std::atomic<Control>> control = std::make_shared<std::atomic<Control>>(Control::None);
    };

    void worker_loop();
    void run_task(const std::string& task_id);
    std::optional<std::string> claim_next_locked();
    bool has_work_locked() const;
    bool is_idle_locked() const;

    void persist_locked();
    void notify(const UploadTask& task);
    void terminate_session(const std::string& session_url);
    void flush_terminations();

    Entry* find_locked(const std::string& task_id);

    TaskStore& store_;
    TusClient& client_;
    QueueOptions options_;
    TransferEngine engine_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::string> order_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> pending_terminations_;

    std::vector<std::thread> workers_;
    bool running_ = false;
    bool admission_suspended_ = false;

    std::mutex callback_mutex_;
    ProgressCallback on_progress_;
};

} // namespace rup::client
