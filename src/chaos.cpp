// ═══════════════════════════════════════════════════════════════════
//  src/chaos.cpp — ChaosState
// ═══════════════════════════════════════════════════════════════════

#include "pilot/chaos.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <random>

namespace pilot {

namespace {

ChaosState::UniformSource defaultSource() {
    // Not cryptographic; it only has to differ across processes
    std::random_device rd;
    auto engine = std::make_shared<std::mt19937_64>(rd());
    return [engine]() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(*engine);
    };
}

} // namespace

ChaosState::ChaosState()
    : source_(defaultSource())
{}

ChaosState::ChaosState(UniformSource source)
    : source_(std::move(source))
{}

double ChaosState::clampProbability(double probability) {
    if (std::isnan(probability)) return 0.0;
    return std::clamp(probability, 0.0, 1.0);
}

double ChaosState::enableDegraded(double probability) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = true;
    probability_ = clampProbability(probability);
    return probability_;
}

void ChaosState::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = false;
    probability_ = 0.0;
}

bool ChaosState::shouldFail() {
    // The source is only touched under the lock
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) return false;
    return source_() < probability_;
}

ChaosState::Snapshot ChaosState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{enabled_, probability_};
}

} // namespace pilot
