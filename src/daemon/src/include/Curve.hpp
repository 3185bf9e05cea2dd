/*
 * CurveFan — temperature → duty curves
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <string>
#include <vector>

namespace curvefan {

struct CurvePoint {
    double tempC{0.0};
    double percent{0.0};
};

struct FanCurve {
    std::string sensor;               // identity of the driving sensor
    std::vector<CurvePoint> points;   // at least one; any order
};

/*
 * Piecewise-linear interpolation over `points`, sorted by temperature first.
 * Clamps to the first/last point's speed outside the covered range; a single
 * point gives a constant. Throws std::invalid_argument on an empty set
 * (configuration loading rejects those curves).
 */
double evaluateCurve(double tempC, std::vector<CurvePoint> points);

inline double evaluateCurve(double tempC, const FanCurve& curve) {
    return evaluateCurve(tempC, curve.points);
}

} // namespace curvefan
