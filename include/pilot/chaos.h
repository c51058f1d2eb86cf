#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pilot/chaos.h — Process-wide chaos toggle {enabled, probability}
// ═══════════════════════════════════════════════════════════════════
//
//  ChaosState chaos;
//  chaos.enableDegraded(0.25);   // health checks fail ~25% of the time
//  if (chaos.shouldFail()) { ... }
//  chaos.reset();
//
// ═══════════════════════════════════════════════════════════════════

#include <functional>
#include <mutex>

namespace pilot {

class ChaosState {
public:
    // Yields a fresh uniform sample in [0, 1) on every call
    using UniformSource = std::function<double()>;

    struct Snapshot {
        bool enabled = false;
        double probability = 0.0;
    };

    // Seeded from std::random_device
    ChaosState();
    explicit ChaosState(UniformSource source);

    ChaosState(const ChaosState&) = delete;
    ChaosState& operator=(const ChaosState&) = delete;

    // enabled = true, probability = clamp(p, 0, 1); NaN clamps to 0.
    // Returns the stored probability.
    double enableDegraded(double probability);

    // enabled = false, probability = 0
    void reset();

    // One independent draw per call while enabled; always false otherwise
    bool shouldFail();

    Snapshot snapshot() const;
    bool enabled() const { return snapshot().enabled; }
    double probability() const { return snapshot().probability; }

    static double clampProbability(double probability);

private:
    mutable std::mutex mutex_;
    bool enabled_ = false;
    double probability_ = 0.0;
    UniformSource source_;
};

} // namespace pilot
