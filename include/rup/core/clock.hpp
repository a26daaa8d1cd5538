#pragma once

#include <chrono>
#include <mutex>

namespace rup {

/**
 * @brief Wall-clock source used for expiry computation
 *
 * Injected wherever deadlines are computed so that sweeps and sliding
 * expiry can be driven deterministically in tests.
 */
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(time_point start = std::chrono::system_clock::now()) : now_(start) {}

    time_point now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(std::chrono::system_clock::duration delta) {
        std::lock_guard lock(mutex_);
        now_ += delta;
    }

    void set(time_point value) {
        std::lock_guard lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    time_point now_;
};

} // namespace rup
