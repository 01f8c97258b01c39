// ============================================================================
// MONOTONIC CLOCK SOURCES

#pragma once

#include <chrono>
#include <cstdint>

namespace TickGovernor {

/**
 * @class Clock
 * @brief Monotonic time source shared by every subsystem of one governor.
 *
 * Injected by reference so hosts can drive the core from their own frame
 * clock and tests can step time deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;

    // Current monotonic time in nanoseconds
    virtual uint64_t nowNs() const = 0;

    // Milliseconds elapsed since an earlier nowNs() reading (0 if in the future)
    double elapsedMs(uint64_t since_ns) const {
        uint64_t now = nowNs();
        if (now <= since_ns) return 0.0;
        return static_cast<double>(now - since_ns) / 1e6;
    }

    static uint64_t msToNs(double ms) {
        if (ms <= 0.0) return 0;
        return static_cast<uint64_t>(ms * 1e6);
    }
};

class SteadyClock : public Clock {
public:
    uint64_t nowNs() const override {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to (tests, replay, fixed-step hosts)
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_ns = 0) : now_ns_(start_ns) {}

    uint64_t nowNs() const override { return now_ns_; }

    void setNowNs(uint64_t ns) { now_ns_ = ns; }
    void advanceNs(uint64_t ns) { now_ns_ += ns; }
    void advanceMs(double ms) { now_ns_ += msToNs(ms); }

private:
    uint64_t now_ns_;
};

} // namespace TickGovernor
