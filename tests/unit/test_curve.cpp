#include <catch2/catch.hpp>

#include "include/Curve.hpp"

#include <stdexcept>
#include <vector>

using curvefan::CurvePoint;
using curvefan::evaluateCurve;

namespace {
const std::vector<CurvePoint> kRamp{{20, 0}, {40, 50}, {60, 100}};
}

TEST_CASE("curve returns exact speed at every control point", "[curve]") {
    CHECK(evaluateCurve(20, kRamp) == 0.0);
    CHECK(evaluateCurve(40, kRamp) == 50.0);
    CHECK(evaluateCurve(60, kRamp) == 100.0);
}

TEST_CASE("curve interpolates linearly between points", "[curve]") {
    CHECK(evaluateCurve(30, kRamp) == Approx(25.0));
    CHECK(evaluateCurve(50, kRamp) == Approx(75.0));
    CHECK(evaluateCurve(45, kRamp) == Approx(62.5));
}

TEST_CASE("curve clamps outside the configured range", "[curve]") {
    CHECK(evaluateCurve(10, kRamp) == 0.0);
    CHECK(evaluateCurve(-40, kRamp) == 0.0);
    CHECK(evaluateCurve(70, kRamp) == 100.0);
    CHECK(evaluateCurve(1000, kRamp) == 100.0);
}

TEST_CASE("curve sorts unsorted points before evaluating", "[curve]") {
    const std::vector<CurvePoint> shuffled{{60, 100}, {20, 0}, {40, 50}};
    CHECK(evaluateCurve(30, shuffled) == Approx(25.0));
    CHECK(evaluateCurve(10, shuffled) == 0.0);
    CHECK(evaluateCurve(70, shuffled) == 100.0);
}

TEST_CASE("single point curve is constant", "[curve]") {
    const std::vector<CurvePoint> flat{{50, 35}};
    CHECK(evaluateCurve(0, flat) == 35.0);
    CHECK(evaluateCurve(50, flat) == 35.0);
    CHECK(evaluateCurve(90, flat) == 35.0);
}

TEST_CASE("non-monotonic speeds are followed as given", "[curve]") {
    const std::vector<CurvePoint> dip{{20, 40}, {40, 20}, {60, 80}};
    CHECK(evaluateCurve(30, dip) == Approx(30.0));
    CHECK(evaluateCurve(50, dip) == Approx(50.0));
}

TEST_CASE("curve is continuous across segment boundaries", "[curve]") {
    const double eps = 1e-6;
    CHECK(evaluateCurve(40 - eps, kRamp) == Approx(50.0).margin(1e-4));
    CHECK(evaluateCurve(40 + eps, kRamp) == Approx(50.0).margin(1e-4));
}

TEST_CASE("empty curve is rejected", "[curve]") {
    CHECK_THROWS_AS(evaluateCurve(30, std::vector<CurvePoint>{}), std::invalid_argument);
}
