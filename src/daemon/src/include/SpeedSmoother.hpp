/*
 * CurveFan — per-fan rate limiting
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace curvefan {

inline constexpr double kDefaultSmoothingStep = 10.0;

/*
 * Bounds the change of the requested speed per cycle.
 * The first request for a fan passes through unchanged; afterwards the
 * result stays within `step` of the previous result. The stored value is
 * the result, not the target, so alternating targets approach the target
 * at a bounded rate.
 */
class SpeedSmoother {
public:
    double smooth(const std::string& fanId, double target, double step);

    std::optional<double> last(const std::string& fanId) const;

    void reset() { last_.clear(); }

private:
    std::unordered_map<std::string, double> last_;
};

} // namespace curvefan
