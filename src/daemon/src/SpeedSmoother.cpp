/*
 * CurveFan — per-fan rate limiting (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/SpeedSmoother.hpp"

#include <algorithm>
#include <cmath>

namespace curvefan {

double SpeedSmoother::smooth(const std::string& fanId, double target, double step) {
    auto it = last_.find(fanId);
    if (it == last_.end()) {
        last_.emplace(fanId, target);
        return target;
    }
    const double s = std::fabs(step);
    const double applied = std::clamp(target, it->second - s, it->second + s);
    it->second = applied;
    return applied;
}

std::optional<double> SpeedSmoother::last(const std::string& fanId) const {
    auto it = last_.find(fanId);
    if (it == last_.end()) return std::nullopt;
    return it->second;
}

} // namespace curvefan
