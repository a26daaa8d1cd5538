#pragma once

#include "rup/events/event_bus.hpp"
#include "rup/session/session_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace rup::session {

struct SweepReport {
    std::size_t examined = 0;
    std::size_t reaped = 0;
    std::size_t failed = 0;
};

/**
 * @brief Periodically terminates abandoned upload sessions
 *
 * Each cycle asks the manager for expired sessions and terminates them one
 * by one through SessionManager::expire, the same path a client DELETE
 * takes. A session that fails to terminate is logged and picked up again
 * on the next cycle; it never stops the rest of the batch.
 *
 * run_once() is usable without the background thread, which is how tests
 * drive it together with a ManualClock.
 */
class ExpirySweeper {
public:
    ExpirySweeper(SessionManager& manager, events::EventBus& bus, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    SweepReport run_once();

    void start();
    void stop();

    bool is_running() const;

private:
    void loop();

    SessionManager& manager_;
    events::EventBus& event_bus_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::thread worker_;
};

} // namespace rup::session
