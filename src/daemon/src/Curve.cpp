/*
 * CurveFan — temperature → duty curves (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/Curve.hpp"

#include <algorithm>
#include <stdexcept>

namespace curvefan {

double evaluateCurve(double tempC, std::vector<CurvePoint> pts) {
    if (pts.empty()) {
        throw std::invalid_argument("curve has no points");
    }
    std::stable_sort(pts.begin(), pts.end(),
                     [](const CurvePoint& a, const CurvePoint& b) { return a.tempC < b.tempC; });

    if (tempC <= pts.front().tempC) return pts.front().percent;
    if (tempC >= pts.back().tempC)  return pts.back().percent;

    for (size_t i = 1; i < pts.size(); ++i) {
        const CurvePoint& a = pts[i - 1];
        const CurvePoint& b = pts[i];
        if (tempC > b.tempC) continue;
        if (tempC == b.tempC) return b.percent;
        // a.tempC < tempC < b.tempC here, so the span is non-zero
        const double u = (tempC - a.tempC) / (b.tempC - a.tempC);
        return a.percent + u * (b.percent - a.percent);
    }
    return pts.back().percent;
}

} // namespace curvefan
