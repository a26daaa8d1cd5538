#include "rup/session/expiry_sweeper.hpp"

#include "rup/events/events.hpp"

#include <spdlog/spdlog.h>

namespace rup::session {

ExpirySweeper::ExpirySweeper(SessionManager& manager, events::EventBus& bus, std::chrono::milliseconds interval)
    : manager_(manager), event_bus_(bus), interval_(interval) {
}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

SweepReport ExpirySweeper::run_once() {
    SweepReport report;

    auto expired = manager_.find_expired();
    if (expired.is_error()) {
        spdlog::error("Expiry sweep could not list sessions: {}", expired.error().message);
        report.failed = 1;
        event_bus_.emit(events::SweepFinishedEvent{report.examined, report.reaped, report.failed});
        return report;
    }

    for (const auto& session_id : expired.value()) {
        ++report.examined;
        auto result = manager_.expire(session_id);
        if (result.is_error()) {
            ++report.failed;
            spdlog::warn("Could not reap expired upload {}: {} (retrying next cycle)",
                         session_id, result.error().message);
            continue;
        }
        if (result.value()) {
            ++report.reaped;
        }
    }

    event_bus_.emit(events::SweepFinishedEvent{report.examined, report.reaped, report.failed});
    return report;
}

void ExpirySweeper::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this] { loop(); });
    spdlog::info("Expiry sweeper running every {}s",
                 std::chrono::duration_cast<std::chrono::seconds>(interval_).count());
}

void ExpirySweeper::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ExpirySweeper::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void ExpirySweeper::loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        run_once();
        lock.lock();
    }
}

} // namespace rup::session
