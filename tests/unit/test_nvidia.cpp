#include <catch2/catch.hpp>

#include "include/NvidiaTools.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

using namespace curvefan;
using curvefan::test::FakeRunner;

using Argv = std::vector<std::string>;

TEST_CASE("gpu temperature output is parsed from the first line", "[nvidia]") {
    CHECK(VendorGpuSensor::parseTemperature("65\n") == 65.0);
    CHECK(VendorGpuSensor::parseTemperature("  71 \n42\n") == 71.0);
    CHECK_FALSE(VendorGpuSensor::parseTemperature("").has_value());
    CHECK_FALSE(VendorGpuSensor::parseTemperature("[N/A]\n").has_value());
}

TEST_CASE("gpu sensor queries nvidia-smi", "[nvidia]") {
    FakeRunner runner;
    runner.results.push_back(FakeRunner::exited(0, "58\n"));
    VendorGpuSensor s(runner);

    CHECK(s.id() == kVendorGpuId);
    CHECK(s.read() == 58.0);
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"nvidia-smi", "--query-gpu=temperature.gpu",
                                  "--format=csv,noheader,nounits"});
}

TEST_CASE("gpu sensor yields nothing when the tool fails", "[nvidia]") {
    FakeRunner runner;
    runner.results.push_back(FakeRunner::exited(9, "57\n"));
    runner.results.push_back(FakeRunner::timedOut());
    runner.results.push_back(FakeRunner::notFound());
    VendorGpuSensor s(runner);

    CHECK_FALSE(s.read().has_value());
    CHECK_FALSE(s.read().has_value());
    CHECK_FALSE(s.read().has_value());
}

TEST_CASE("gpu fan command as root", "[nvidia]") {
    FakeRunner runner;
    runner.fallback = FakeRunner::exited(0);
    VendorGpuFan fan(runner, true);

    REQUIRE(fan.setSpeed(55.0));
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"nvidia-settings",
                                  "-a", "[gpu:0]/GPUFanControlState=1",
                                  "-a", "[fan:0]/GPUTargetFanSpeed=55"});
}

TEST_CASE("gpu fan command goes through sudo when unprivileged", "[nvidia]") {
    FakeRunner runner;
    VendorGpuFan fan(runner, false, 30);
    const auto cmd = fan.buildCommand(70);
    REQUIRE(cmd.size() == 7);
    CHECK(cmd[0] == "sudo");
    CHECK(cmd[1] == "-n");
    CHECK(cmd[2] == "nvidia-settings");
    CHECK(cmd[6] == "[fan:0]/GPUTargetFanSpeed=70");
}

TEST_CASE("gpu fan never drops below the minimum speed", "[nvidia]") {
    FakeRunner runner;
    runner.fallback = FakeRunner::exited(0);
    VendorGpuFan fan(runner, true, 30);

    CHECK(fan.effectivePercent(20.0) == 30);
    CHECK(fan.effectivePercent(0.0) == 30);
    CHECK(fan.effectivePercent(64.9) == 64);
    CHECK(fan.effectivePercent(250.0) == 100);

    REQUIRE(fan.setSpeed(20.0));
    CHECK(runner.calls.back().back() == "[fan:0]/GPUTargetFanSpeed=30");

    fan.setMinSpeed(40);
    CHECK(fan.minSpeed() == 40);
    REQUIRE(fan.setSpeed(35.0));
    CHECK(runner.calls.back().back() == "[fan:0]/GPUTargetFanSpeed=40");
}

TEST_CASE("gpu fan reports tool failure", "[nvidia]") {
    FakeRunner runner;
    runner.results.push_back(FakeRunner::exited(1));
    runner.results.push_back(FakeRunner::notFound());
    VendorGpuFan fan(runner, false);
    CHECK_FALSE(fan.setSpeed(50.0));
    CHECK_FALSE(fan.setSpeed(50.0));
}

TEST_CASE("probe runs nvidia-smi without arguments", "[nvidia]") {
    FakeRunner runner;
    runner.results.push_back(FakeRunner::exited(0, "some table\n"));
    CHECK(probeNvidiaTools(runner));
    CHECK(runner.calls.back() == Argv{"nvidia-smi"});

    runner.results.push_back(FakeRunner::exited(6));
    CHECK_FALSE(probeNvidiaTools(runner));
    CHECK_FALSE(probeNvidiaTools(runner));  // fallback: not installed
}
