#include "kernel/Pressures.h"

#include <algorithm>
#include <cmath>

double PressureController::clampPressure(double value) {
    if (std::isnan(value)) {
        return kMinPressure;
    }
    return std::clamp(value, kMinPressure, kMaxPressure);
}

double PressureController::get(const std::string& id) const {
    auto it = values_.find(id);
    return it != values_.end() ? it->second : 0.0;
}

void PressureController::set(const std::string& id, double value) {
    values_[id] = clampPressure(value);
}

void PressureController::applyDelta(const std::string& id, double delta) {
    set(id, get(id) + delta);
}

void PressureController::queueDelta(const std::string& id, double delta) {
    pending_[id] += delta;
}

double PressureController::pendingDelta(const std::string& id) const {
    auto it = pending_.find(id);
    return it != pending_.end() ? it->second : 0.0;
}

void PressureController::applyPending() {
    for (const auto& [id, delta] : pending_) {
        applyDelta(id, delta);
    }
    pending_.clear();
}

void PressureController::clear() {
    values_.clear();
    pending_.clear();
}
