#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/uptime.h — Process uptime: start instant, elapsed, formatting
// ═══════════════════════════════════════════════════════════════════

#include <chrono>
#include <string>

namespace pilot {

class UptimeTracker {
public:
    using Clock   = std::chrono::steady_clock;
    using Seconds = std::chrono::duration<double>;

    // Captures the start instant
    UptimeTracker();
    explicit UptimeTracker(Clock::time_point start);

    // Time since the start instant; never negative, never decreasing
    Seconds elapsed() const;

    Clock::time_point startedAt() const { return start_; }

    // "1d 1h 1m 1s", "1h 1m 1s", "1m 1s" or "5s": the leading unit is the
    // largest nonzero one, every smaller unit is always shown.
    static std::string format(Seconds duration);

private:
    const Clock::time_point start_;
};

} // namespace pilot
