#include "rup/client/upload_queue.hpp"

#include "rup/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace rup::client {
namespace fs = std::filesystem;

UploadQueue::UploadQueue(TaskStore& store,
                         TusClient& client,
                         QueueOptions options,
                         TransferEngine::Sleeper sleeper)
    : store_(store),
      client_(client),
      options_(options),
      engine_(client, options.engine, std::move(sleeper)) {
    if (options_.max_concurrent == 0) {
        options_.max_concurrent = 1;
    }
}

UploadQueue::~UploadQueue() {
    stop();
}

Result<void> UploadQueue::restore() {
    auto loaded = store_.load();
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }

    {
        std::lock_guard lock(mutex_);
        order_.clear();
        entries_.clear();

        for (auto& task : loaded.value().tasks) {
            if (task.status == TaskStatus::Uploading) {
                // Interrupted mid-transfer; the server offset is re-read before resuming
                auto moved = task.transition_to(TaskStatus::Queued);
                if (moved.is_error()) {
                    spdlog::warn("Task {}: {}", task.id, moved.error());
                }
            }
            const std::string id = task.id;
            order_.push_back(id);
            entries_[id].task = std::move(task);
        }
        pending_terminations_ = std::move(loaded.value().pending_terminations);
        persist_locked();
        spdlog::info("Restored {} upload tasks, {} pending terminations",
                     order_.size(), pending_terminations_.size());
    }

    flush_terminations();
    work_cv_.notify_all();
    return Ok();
}

void UploadQueue::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    for (std::size_t i = 0; i < options_.max_concurrent; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    spdlog::info("Upload queue started with {} workers", options_.max_concurrent);
}

void UploadQueue::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (auto& [id, entry] : entries_) {
            if (entry.running) {
                entry.control->store(Control::Shutdown);
            }
        }
        workers.swap(workers_);
    }
    work_cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::lock_guard lock(mutex_);
    persist_locked();
    idle_cv_.notify_all();
    spdlog::info("Upload queue stopped");
}

bool UploadQueue::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

bool UploadQueue::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return is_idle_locked(); });
}

Result<std::string> UploadQueue::enqueue(const fs::path& file, std::map<std::string, std::string> metadata) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Err<std::string>("Not a regular file: " + file.string());
    }
    const auto size = fs::file_size(file, ec);
    if (ec) {
        return Err<std::string>("Cannot stat " + file.string() + ": " + ec.message());
    }

    UploadTask task;
    task.id = generate_id();
    task.file_reference = fs::absolute(file, ec);
    if (ec) {
        task.file_reference = file;
    }
    task.declared_size = size;
    task.created_at = std::chrono::system_clock::now();
    if (metadata.find("filename") == metadata.end()) {
        metadata["filename"] = file.filename().string();
    }
    task.metadata = std::move(metadata);

    const std::string id = task.id;
    {
        std::lock_guard lock(mutex_);
        order_.push_back(id);
        entries_[id].task = std::move(task);
        persist_locked();
    }

    spdlog::info("Queued {} ({} bytes) as {}", file.string(), size, id);
    work_cv_.notify_one();
    return Ok(id);
}

Result<void> UploadQueue::pause(const std::string& task_id) {
    UploadTask changed;
    {
        std::lock_guard lock(mutex_);
        Entry* entry = find_locked(task_id);
        if (!entry) {
            return Err<void>("Unknown task " + task_id);
        }
        auto moved = entry->task.transition_to(TaskStatus::Paused);
        if (moved.is_error()) {
            return moved;
        }
        if (entry->running) {
            entry->control->store(Control::Pause);
        }
        persist_locked();
        changed = entry->task;
    }
    notify(changed);
    return Ok();
}

Result<void> UploadQueue::resume(const std::string& task_id) {
    UploadTask changed;
    {
        std::lock_guard lock(mutex_);
        Entry* entry = find_locked(task_id);
        if (!entry) {
            return Err<void>("Unknown task " + task_id);
        }
        if (entry->task.status != TaskStatus::Paused) {
            return Err<void>("Task " + task_id + " is not paused");
        }
        auto moved = entry->task.transition_to(TaskStatus::Queued);
        if (moved.is_error()) {
            return moved;
        }
        persist_locked();
        changed = entry->task;
    }
    notify(changed);
    work_cv_.notify_one();
    return Ok();
}

Result<void> UploadQueue::cancel(const std::string& task_id) {
    UploadTask changed;
    std::string session_url;
    {
        std::lock_guard lock(mutex_);
        Entry* entry = find_locked(task_id);
        if (!entry) {
            return Err<void>("Unknown task " + task_id);
        }
        auto moved = entry->task.transition_to(TaskStatus::Cancelled);
        if (moved.is_error()) {
            return moved;
        }
        if (entry->running) {
            // The worker terminates the session once the engine stops
            entry->control->store(Control::Cancel);
        } else if (entry->task.has_session()) {
            session_url = entry->task.session_url;
            pending_terminations_.push_back(session_url);
        }
        persist_locked();
        changed = entry->task;
        idle_cv_.notify_all();
    }

    notify(changed);
    if (!session_url.empty()) {
        terminate_session(session_url);
    }
    return Ok();
}

Result<void> UploadQueue::retry(const std::string& task_id) {
    UploadTask changed;
    {
        std::lock_guard lock(mutex_);
        Entry* entry = find_locked(task_id);
        if (!entry) {
            return Err<void>("Unknown task " + task_id);
        }
        if (entry->task.status != TaskStatus::Failed) {
            return Err<void>("Task " + task_id + " has not failed");
        }
        auto moved = entry->task.transition_to(TaskStatus::Queued);
        if (moved.is_error()) {
            return moved;
        }
        entry->task.last_error.clear();
        persist_locked();
        changed = entry->task;
    }
    notify(changed);
    work_cv_.notify_one();
    return Ok();
}

std::vector<UploadTask> UploadQueue::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<UploadTask> tasks;
    tasks.reserve(order_.size());
    for (const auto& id : order_) {
        tasks.push_back(entries_.at(id).task);
    }
    return tasks;
}

std::optional<UploadTask> UploadQueue::get(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(task_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

std::vector<std::string> UploadQueue::pending_terminations() const {
    std::lock_guard lock(mutex_);
    return pending_terminations_;
}

void UploadQueue::set_progress_callback(ProgressCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_progress_ = std::move(callback);
}

// ────────────────────────────────────────────────────────────
// Lifecycle hooks
// ────────────────────────────────────────────────────────────

void UploadQueue::on_background() {
    std::lock_guard lock(mutex_);
    persist_locked();
}

void UploadQueue::on_foreground() {
    std::vector<UploadTask> to_check;
    {
        std::lock_guard lock(mutex_);
        admission_suspended_ = true;
        for (const auto& id : order_) {
            const Entry& entry = entries_.at(id);
            if (!entry.running && !entry.task.is_terminal() && entry.task.has_session()) {
                to_check.push_back(entry.task);
            }
        }
    }

    for (const auto& task : to_check) {
        auto remote = client_.status(task.session_url);

        std::lock_guard lock(mutex_);
        Entry* entry = find_locked(task.id);
        if (!entry || entry->running || entry->task.session_url != task.session_url) {
            continue;
        }
        if (remote.is_ok()) {
            entry->task.bytes_transferred = remote.value().offset;
        } else if (remote.error().code == ErrorCode::NotFound ||
                   remote.error().code == ErrorCode::Expired) {
            spdlog::info("Session for task {} is gone, restarting from zero", task.id);
            entry->task.session_url.clear();
            entry->task.bytes_transferred = 0;
        } else {
            spdlog::warn("Could not refresh task {}: {}", task.id, remote.error().message);
        }
    }

    flush_terminations();

    {
        std::lock_guard lock(mutex_);
        admission_suspended_ = false;
        persist_locked();
    }
    work_cv_.notify_all();
}

// ────────────────────────────────────────────────────────────
// Workers
// ────────────────────────────────────────────────────────────

void UploadQueue::worker_loop() {
    std::unique_lock lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return !running_ || has_work_locked(); });
        if (!running_) {
            break;
        }

        auto task_id = claim_next_locked();
        if (!task_id) {
            continue;
        }

        lock.unlock();
        run_task(*task_id);
        lock.lock();

        idle_cv_.notify_all();
    }
}

void UploadQueue::run_task(const std::string& task_id) {
    UploadTask working;
    std::shared_ptr<std::atomic<Control>> control;
    {
        std::lock_guard lock(mutex_);
        Entry& entry = entries_.at(task_id);
        working = entry.task;
        control = entry.control;
    }
    notify(working);

    auto should_stop = [&control] { return control->load() != Control::None; };
    auto on_progress = [this, &task_id](const UploadTask& progressed) {
        UploadTask copy;
        {
            std::lock_guard lock(mutex_);
            Entry& entry = entries_.at(task_id);
            entry.task.session_url = progressed.session_url;
            entry.task.bytes_transferred = progressed.bytes_transferred;
            persist_locked();
            copy = entry.task;
        }
        notify(copy);
    };

    const TransferOutcome outcome = engine_.run(working, should_stop, on_progress);

    UploadTask finished;
    std::string terminate_url;
    {
        std::lock_guard lock(mutex_);
        Entry& entry = entries_.at(task_id);
        entry.running = false;
        entry.task.session_url = working.session_url;
        entry.task.bytes_transferred = working.bytes_transferred;
        entry.task.last_error = working.last_error;

        const Control requested = control->exchange(Control::None);
        const TaskStatus current = entry.task.status;

        switch (outcome) {
            case TransferOutcome::Completed:
                if (current != TaskStatus::Cancelled) {
                    // The server finalized the upload; that outranks a pending pause
                    entry.task.status = TaskStatus::Completed;
                    entry.task.bytes_transferred = entry.task.declared_size;
                    entry.task.completed_at = std::chrono::system_clock::now();
                    spdlog::info("Upload {} completed ({} bytes)", task_id, entry.task.declared_size);
                }
                break;
            case TransferOutcome::Stopped:
                if (requested == Control::Shutdown && current == TaskStatus::Uploading) {
                    auto moved = entry.task.transition_to(TaskStatus::Queued);
                    if (moved.is_error()) {
                        spdlog::warn("Task {}: {}", task_id, moved.error());
                    }
                }
                break;
            case TransferOutcome::Failed:
                if (current == TaskStatus::Uploading) {
                    auto moved = entry.task.transition_to(TaskStatus::Failed);
                    if (moved.is_error()) {
                        spdlog::warn("Task {}: {}", task_id, moved.error());
                    }
                }
                break;
        }

        if (entry.task.status == TaskStatus::Cancelled && entry.task.has_session()) {
            terminate_url = entry.task.session_url;
            pending_terminations_.push_back(terminate_url);
        }

        persist_locked();
        finished = entry.task;
    }

    notify(finished);
    if (!terminate_url.empty()) {
        terminate_session(terminate_url);
    }
}

std::optional<std::string> UploadQueue::claim_next_locked() {
    if (admission_suspended_) {
        return std::nullopt;
    }
    for (const auto& id : order_) {
        Entry& entry = entries_.at(id);
        if (entry.running || entry.task.status != TaskStatus::Queued) {
            continue;
        }
        auto moved = entry.task.transition_to(TaskStatus::Uploading);
        if (moved.is_error()) {
            spdlog::warn("Task {}: {}", id, moved.error());
            continue;
        }
        entry.running = true;
        entry.control->store(Control::None);
        persist_locked();
        return id;
    }
    return std::nullopt;
}

bool UploadQueue::has_work_locked() const {
    if (admission_suspended_) {
        return false;
    }
    return std::any_of(order_.begin(), order_.end(), [this](const std::string& id) {
        const Entry& entry = entries_.at(id);
        return !entry.running && entry.task.status == TaskStatus::Queued;
    });
}

bool UploadQueue::is_idle_locked() const {
    return std::none_of(order_.begin(), order_.end(), [this](const std::string& id) {
        const Entry& entry = entries_.at(id);
        return entry.running || entry.task.status == TaskStatus::Queued;
    });
}

// ────────────────────────────────────────────────────────────
// Persistence and terminations
// ────────────────────────────────────────────────────────────

void UploadQueue::persist_locked() {
    QueueState state;
    state.tasks.reserve(order_.size());
    for (const auto& id : order_) {
        state.tasks.push_back(entries_.at(id).task);
    }
    state.pending_terminations = pending_terminations_;

    auto saved = store_.save(state);
    if (saved.is_error()) {
        spdlog::error("Failed to persist upload queue: {}", saved.error());
    }
}

void UploadQueue::notify(const UploadTask& task) {
    ProgressCallback callback;
    {
        std::lock_guard lock(callback_mutex_);
        callback = on_progress_;
    }
    if (callback) {
        callback(task);
    }
}

void UploadQueue::terminate_session(const std::string& session_url) {
    auto terminated = client_.terminate(session_url);
    if (terminated.is_error()) {
        spdlog::warn("Termination of {} deferred: {}", session_url, terminated.error().message);
        return;
    }

    std::lock_guard lock(mutex_);
    pending_terminations_.erase(
        std::remove(pending_terminations_.begin(), pending_terminations_.end(), session_url),
        pending_terminations_.end());
    persist_locked();
}

void UploadQueue::flush_terminations() {
    std::vector<std::string> pending;
    {
        std::lock_guard lock(mutex_);
        pending = pending_terminations_;
    }
    for (const auto& url : pending) {
        terminate_session(url);
    }
}

UploadQueue::Entry* UploadQueue::find_locked(const std::string& task_id) {
    auto it = entries_.find(task_id);
    return it == entries_.end() ? nullptr : &it->second;
}

} // namespace rup::client
