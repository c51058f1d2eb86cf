// ═══════════════════════════════════════════════════════════════════
//  src/uptime.cpp — UptimeTracker
// ═══════════════════════════════════════════════════════════════════

#include "pilot/uptime.h"

#include <algorithm>

namespace pilot {

UptimeTracker::UptimeTracker()
    : start_(Clock::now())
{}

UptimeTracker::UptimeTracker(Clock::time_point start)
    : start_(start)
{}

UptimeTracker::Seconds UptimeTracker::elapsed() const {
    auto now = Clock::now();
    if (now < start_) return Seconds::zero();
    return std::chrono::duration_cast<Seconds>(now - start_);
}

std::string UptimeTracker::format(Seconds duration) {
    // Fractional seconds are truncated, negatives render as 0s
    auto total = std::max<long long>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count(), 0);

    auto days    = total / 86400;
    auto hours   = (total % 86400) / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    auto s = std::to_string(seconds) + "s";
    if (days > 0) {
        return std::to_string(days) + "d " + std::to_string(hours) + "h " +
               std::to_string(minutes) + "m " + s;
    }
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + s;
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + s;
    }
    return s;
}

} // namespace pilot
