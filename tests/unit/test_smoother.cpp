#include <catch2/catch.hpp>

#include "include/SpeedSmoother.hpp"

#include <cmath>
#include <vector>

using curvefan::SpeedSmoother;

TEST_CASE("first request per fan passes through unsmoothed", "[smoother]") {
    SpeedSmoother s;
    CHECK_FALSE(s.last("fan").has_value());
    CHECK(s.smooth("fan", 90.0, 10.0) == 90.0);
    CHECK(s.last("fan") == 90.0);
}

TEST_CASE("smoothing step 10 over 50, 80, 50", "[smoother]") {
    SpeedSmoother s;
    CHECK(s.smooth("fan", 50.0, 10.0) == 50.0);
    CHECK(s.smooth("fan", 80.0, 10.0) == 60.0);
    CHECK(s.smooth("fan", 50.0, 10.0) == 50.0);
}

TEST_CASE("decrease is bounded like increase", "[smoother]") {
    SpeedSmoother s;
    s.smooth("fan", 80.0, 10.0);
    CHECK(s.smooth("fan", 20.0, 10.0) == 70.0);
    CHECK(s.smooth("fan", 20.0, 10.0) == 60.0);
}

TEST_CASE("state is kept per fan", "[smoother]") {
    SpeedSmoother s;
    s.smooth("a", 10.0, 5.0);
    CHECK(s.smooth("b", 90.0, 5.0) == 90.0);
    CHECK(s.smooth("a", 90.0, 5.0) == 15.0);
    CHECK(s.smooth("b", 10.0, 5.0) == 85.0);
}

TEST_CASE("step bound holds over an oscillating sequence", "[smoother]") {
    SpeedSmoother s;
    const std::vector<double> targets{0, 100, 0, 100, 37, 99, 12, 12, 12, 80, 5};
    double prev = s.smooth("fan", targets.front(), 7.5);
    for (size_t i = 1; i < targets.size(); ++i) {
        const double cur = s.smooth("fan", targets[i], 7.5);
        CHECK(std::fabs(cur - prev) <= 7.5 + 1e-9);
        prev = cur;
    }
}

TEST_CASE("reset forgets previous speeds", "[smoother]") {
    SpeedSmoother s;
    s.smooth("fan", 20.0, 10.0);
    s.reset();
    CHECK(s.smooth("fan", 100.0, 10.0) == 100.0);
}
