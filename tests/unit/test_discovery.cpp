#include <catch2/catch.hpp>

#include "include/Discovery.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

using namespace curvefan;
using curvefan::test::FakeRunner;
using curvefan::test::TempDir;

namespace {

std::vector<std::string> sensorIds(const Inventory& inv) {
    std::vector<std::string> out;
    for (const auto& s : inv.sensors) out.push_back(s->id());
    return out;
}

std::vector<std::string> fanIds(const Inventory& inv) {
    std::vector<std::string> out;
    for (const auto& f : inv.fans) out.push_back(f->id());
    return out;
}

void makeTree(const TempDir& root) {
    root.write("hwmon0/name", "k10temp\n");
    root.write("hwmon0/temp1_input", "41000\n");
    root.write("hwmon0/temp1_label", "Tctl\n");
    root.write("hwmon0/temp2_input", "39000\n");
    root.write("hwmon1/pwm1", "120\n");
    root.write("hwmon1/pwm1_enable", "2\n");
    root.write("hwmon1/pwm1_max", "255\n");
    root.write("hwmon1/fan1_input", "900\n");
    root.write("hwmon1/temp3_max", "90000\n");
    root.write("other/temp1_input", "10000\n");
}

} // namespace

TEST_CASE("hwmon name filters", "[discovery]") {
    CHECK(isHwmonTempInput("temp1_input"));
    CHECK(isHwmonTempInput("temp12_input"));
    CHECK_FALSE(isHwmonTempInput("temp1_max"));
    CHECK_FALSE(isHwmonTempInput("temp_input"));

    CHECK(isHwmonPwmDuty("pwm1"));
    CHECK(isHwmonPwmDuty("pwm10"));
    CHECK_FALSE(isHwmonPwmDuty("pwm1_enable"));
    CHECK_FALSE(isHwmonPwmDuty("pwm1_max"));
    CHECK_FALSE(isHwmonPwmDuty("pwm"));
}

TEST_CASE("discovery lists hwmon inputs and duty files only", "[discovery]") {
    TempDir root;
    makeTree(root);
    FakeRunner runner;

    DiscoveryOptions opt;
    opt.hwmonRoot = root.path().string();
    opt.probeVendor = false;
    const Inventory inv = discoverHardware(opt, runner);

    CHECK(sensorIds(inv) == std::vector<std::string>{root.file("hwmon0/temp1_input"),
                                                      root.file("hwmon0/temp2_input")});
    CHECK(fanIds(inv) == std::vector<std::string>{root.file("hwmon1/pwm1")});
    CHECK(runner.calls.empty());
}

TEST_CASE("discovery adds the gpu when the vendor tools respond", "[discovery]") {
    TempDir root;
    makeTree(root);
    FakeRunner runner;
    runner.results.push_back(FakeRunner::exited(0));

    DiscoveryOptions opt;
    opt.hwmonRoot = root.path().string();
    const Inventory inv = discoverHardware(opt, runner);

    REQUIRE(inv.sensors.size() == 3);
    REQUIRE(inv.fans.size() == 2);
    CHECK(inv.sensors.back()->id() == kVendorGpuId);
    CHECK(inv.fans.back()->id() == kVendorGpuId);
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == std::vector<std::string>{"nvidia-smi"});
}

TEST_CASE("discovery without vendor tools or hwmon root is empty", "[discovery]") {
    TempDir root;
    FakeRunner runner;

    DiscoveryOptions opt;
    opt.hwmonRoot = root.file("does-not-exist");
    const Inventory inv = discoverHardware(opt, runner);

    CHECK(inv.sensors.empty());
    CHECK(inv.fans.empty());
    CHECK(runner.calls.size() == 1);
}

TEST_CASE("discovery does not touch devices", "[discovery]") {
    TempDir root;
    makeTree(root);
    FakeRunner runner;

    DiscoveryOptions opt;
    opt.hwmonRoot = root.path().string();
    opt.probeVendor = false;
    (void)discoverHardware(opt, runner);

    CHECK(root.read("hwmon1/pwm1_enable") == "2\n");
    CHECK(root.read("hwmon1/pwm1") == "120\n");
}
