/*
 * CurveFan — hwmon sensors and PWM fans (sysfs)
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include "Hardware.hpp"

#include <optional>
#include <string>

namespace curvefan {

inline constexpr const char* kDefaultHwmonRoot = "/sys/class/hwmon";
inline constexpr int kDefaultPwmMax = 255;
inline constexpr int kPwmEnableManual = 1;

/* tempN_input; the kernel reports millidegree Celsius. */
class HwmonSensor : public Sensor {
public:
    explicit HwmonSensor(std::string inputPath);

    std::optional<double> read() override;
};

/*
 * pwmN duty file. Manual mode (pwmN_enable=1) and the raw range (pwmN_max)
 * are resolved on the first write, so discovery itself never touches the device.
 */
class HwmonFan : public Fan {
public:
    explicit HwmonFan(std::string pwmPath);

    bool setSpeed(double percent) override;
    void resetToAuto() override;

    const std::string& enablePath() const noexcept { return enablePath_; }
    const std::string& maxPath() const noexcept { return maxPath_; }

    // Raw range used for conversion; valid after the first setSpeed().
    int pwmMax() const noexcept { return pwmMax_; }

    /* round(percent/100 * max), clamped to [0, max]. */
    static int percentToRaw(double percent, int pwmMax);

private:
    void prepare();

    std::string enablePath_;
    std::string maxPath_;
    bool prepared_{false};
    int  pwmMax_{kDefaultPwmMax};
    std::optional<int> origEnable_;
};

} // namespace curvefan
