/*
 * CurveFan — hardware discovery (header)
 * - One-shot enumeration of hwmon temperature inputs and PWM outputs
 * - Optional NVIDIA sensor/fan when the vendor tools respond
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include "Hardware.hpp"
#include "Process.hpp"

#include <string>

namespace curvefan {

struct Inventory {
    SensorList sensors;
    FanList    fans;
};

struct DiscoveryOptions {
    std::string hwmonRoot;        // e.g. /sys/class/hwmon
    bool probeVendor{true};
    bool privileged{false};       // forwarded to VendorGpuFan
};

/*
 * Never fails as a whole: a missing root or an unavailable tool only
 * shrinks the result. Entries are sorted by identity.
 * The runner must outlive the returned vendor devices.
 */
Inventory discoverHardware(const DiscoveryOptions& opt, CommandRunner& runner);

/* Name filters, exposed for tests. */
bool isHwmonTempInput(const std::string& fileName);   // tempN_input
bool isHwmonPwmDuty(const std::string& fileName);     // pwmN (no suffix)

} // namespace curvefan
