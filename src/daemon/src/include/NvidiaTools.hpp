/*
 * CurveFan — NVIDIA GPU sensor and fan via the vendor command-line tools
 * - nvidia-smi       : temperature query, discovery probe
 * - nvidia-settings  : fan control state + target speed
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include "Hardware.hpp"
#include "Process.hpp"

#include <string>
#include <vector>

namespace curvefan {

inline constexpr const char* kNvidiaSmi      = "nvidia-smi";
inline constexpr const char* kNvidiaSettings = "nvidia-settings";
inline constexpr int kDefaultVendorMinFanSpeed = 26;

class VendorGpuSensor : public Sensor {
public:
    explicit VendorGpuSensor(CommandRunner& runner);

    std::optional<double> read() override;

    /* First line of nvidia-smi csv output as integer Celsius. */
    static std::optional<double> parseTemperature(const std::string& out);

private:
    CommandRunner& runner_;
};

/*
 * Below the vendor threshold some GPU fan controllers stall, so commanded
 * speeds never go under minSpeed while this daemon is in control.
 */
class VendorGpuFan : public Fan {
public:
    // privileged=false prefixes the command with "sudo -n"
    VendorGpuFan(CommandRunner& runner, bool privileged, int minSpeed = kDefaultVendorMinFanSpeed);

    bool setSpeed(double percent) override;
    void setMinSpeed(int percent) override;

    int  minSpeed() const noexcept { return minSpeed_; }
    bool privileged() const noexcept { return privileged_; }

    /* Percent actually sent: truncated, clamped to [minSpeed, 100]. */
    int effectivePercent(double percent) const;

    std::vector<std::string> buildCommand(int percent) const;

private:
    CommandRunner& runner_;
    bool privileged_;
    int  minSpeed_;
};

/* Zero-argument nvidia-smi run; exit 0 means the driver stack is usable. */
bool probeNvidiaTools(CommandRunner& runner);

} // namespace curvefan
