/*
 * CurveFan — NVIDIA GPU sensor and fan (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/NvidiaTools.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <algorithm>
#include <cmath>

namespace curvefan {

static std::string describeFailure(const CommandResult& r) {
    if (!r.started)  return r.error.empty() ? std::string("not started") : r.error;
    if (r.timedOut)  return r.error.empty() ? std::string("timed out") : r.error;
    return "exit code " + std::to_string(r.exitCode);
}

/* ---------------------------- VendorGpuSensor ----------------------------- */

VendorGpuSensor::VendorGpuSensor(CommandRunner& runner)
: Sensor(kVendorGpuId), runner_(runner) {}

std::optional<double> VendorGpuSensor::parseTemperature(const std::string& out) {
    const auto nl = out.find('\n');
    auto v = util::parse_ll(out.substr(0, nl));
    if (!v) return std::nullopt;
    return static_cast<double>(*v);
}

std::optional<double> VendorGpuSensor::read() {
    const CommandResult r = runner_.run({kNvidiaSmi,
                                         "--query-gpu=temperature.gpu",
                                         "--format=csv,noheader,nounits"});
    if (!r.ok()) {
        LOG_ERROR("nvidia: temperature query failed: %s", describeFailure(r).c_str());
        return std::nullopt;
    }
    auto t = parseTemperature(r.out);
    if (!t) {
        LOG_ERROR("nvidia: unparsable temperature output '%s'", util::trim(r.out).c_str());
        return std::nullopt;
    }
    LOG_TRACE("nvidia: gpu temperature %.0f C", *t);
    return t;
}

/* ------------------------------ VendorGpuFan ------------------------------ */

VendorGpuFan::VendorGpuFan(CommandRunner& runner, bool privileged, int minSpeed)
: Fan(kVendorGpuId), runner_(runner), privileged_(privileged),
  minSpeed_(std::clamp(minSpeed, 0, 100)) {}

void VendorGpuFan::setMinSpeed(int percent) {
    minSpeed_ = std::clamp(percent, 0, 100);
    LOG_INFO("nvidia: fan minimum speed %d%%", minSpeed_);
}

int VendorGpuFan::effectivePercent(double percent) const {
    if (std::isnan(percent)) return minSpeed_;
    const double pc = std::clamp(percent, 0.0, 100.0);
    return std::clamp(static_cast<int>(pc), minSpeed_, 100);
}

std::vector<std::string> VendorGpuFan::buildCommand(int percent) const {
    std::vector<std::string> cmd;
    if (!privileged_) {
        cmd.push_back("sudo");
        cmd.push_back("-n");
    }
    cmd.push_back(kNvidiaSettings);
    cmd.push_back("-a");
    cmd.push_back("[gpu:0]/GPUFanControlState=1");
    cmd.push_back("-a");
    cmd.push_back("[fan:0]/GPUTargetFanSpeed=" + std::to_string(percent));
    return cmd;
}

bool VendorGpuFan::setSpeed(double percent) {
    const int pc = effectivePercent(percent);
    const auto cmd = buildCommand(pc);
    const CommandResult r = runner_.run(cmd);
    if (!r.ok()) {
        LOG_ERROR("nvidia: failed to set fan speed %d%% (%s): %s",
                  pc, joinArgv(cmd).c_str(), describeFailure(r).c_str());
        return false;
    }
    LOG_TRACE("nvidia: fan <- %d%%", pc);
    return true;
}

/* --------------------------------- probe ---------------------------------- */

bool probeNvidiaTools(CommandRunner& runner) {
    const CommandResult r = runner.run({kNvidiaSmi});
    if (!r.ok()) {
        LOG_DEBUG("nvidia: probe failed: %s", describeFailure(r).c_str());
        return false;
    }
    return true;
}

} // namespace curvefan
