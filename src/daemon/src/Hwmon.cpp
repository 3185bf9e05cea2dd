/*
 * CurveFan — hwmon sensors and PWM fans (implementation)
 * (c) 2025 CurveFan contributors
 *
 * Responsibilities:
 *  - Read tempN_input and convert millidegrees to degrees
 *  - Switch pwmN to manual mode once, remember the previous mode
 *  - Convert percent to the raw range advertised by pwmN_max
 */

#include "include/Hwmon.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace curvefan {

static inline bool fileExists(const std::string& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

/* ------------------------------ HwmonSensor ------------------------------- */

HwmonSensor::HwmonSensor(std::string inputPath)
: Sensor(std::move(inputPath)) {}

std::optional<double> HwmonSensor::read() {
    std::string line;
    if (!util::read_text_file(id(), line)) {
        LOG_ERROR("hwmon: cannot read temperature from %s", id().c_str());
        return std::nullopt;
    }
    auto mc = util::parse_ll(line.substr(0, line.find('\n')));
    if (!mc) {
        LOG_ERROR("hwmon: non-numeric temperature in %s: '%s'", id().c_str(), util::trim(line).c_str());
        return std::nullopt;
    }
    const double c = static_cast<double>(*mc) / 1000.0;
    LOG_TRACE("hwmon: %s -> %.3f C", id().c_str(), c);
    return c;
}

/* -------------------------------- HwmonFan -------------------------------- */

HwmonFan::HwmonFan(std::string pwmPath)
: Fan(std::move(pwmPath)),
  enablePath_(id() + "_enable"),
  maxPath_(id() + "_max")
{}

int HwmonFan::percentToRaw(double percent, int pwmMax) {
    const int vmax = pwmMax > 0 ? pwmMax : kDefaultPwmMax;
    const double pc = std::clamp(percent, 0.0, 100.0);
    const long raw = std::lround(pc / 100.0 * static_cast<double>(vmax));
    return static_cast<int>(std::clamp<long>(raw, 0, vmax));
}

void HwmonFan::prepare() {
    prepared_ = true;

    if (fileExists(enablePath_)) {
        if (auto prev = util::read_first_line_ll(enablePath_); prev && *prev >= 0 && *prev <= INT_MAX) {
            origEnable_ = static_cast<int>(*prev);
        }
        if (util::write_int_file(enablePath_, kPwmEnableManual)) {
            LOG_INFO("hwmon: manual control enabled for %s", id().c_str());
        } else {
            // already manual, or the driver refuses; duty writes may still work
            LOG_WARN("hwmon: could not enable manual control for %s", id().c_str());
            origEnable_.reset();
        }
    } else {
        LOG_DEBUG("hwmon: no enable file for %s", id().c_str());
    }

    pwmMax_ = kDefaultPwmMax;
    if (auto m = util::read_first_line_ll(maxPath_)) {
        if (*m > 0 && *m <= INT_MAX) pwmMax_ = static_cast<int>(*m);
    }
    LOG_DEBUG("hwmon: %s pwm_max=%d", id().c_str(), pwmMax_);
}

bool HwmonFan::setSpeed(double percent) {
    if (!prepared_) prepare();

    const int raw = percentToRaw(percent, pwmMax_);
    if (!util::write_int_file(id(), raw)) {
        LOG_ERROR("hwmon: failed to set %s to %d (%.1f%%)", id().c_str(), raw, percent);
        return false;
    }
    LOG_TRACE("hwmon: %s <- %d (%.1f%%)", id().c_str(), raw, percent);
    return true;
}

void HwmonFan::resetToAuto() {
    if (!origEnable_) return;
    if (util::write_int_file(enablePath_, *origEnable_)) {
        LOG_INFO("hwmon: restored %s=%d", enablePath_.c_str(), *origEnable_);
    } else {
        LOG_WARN("hwmon: failed to restore %s=%d", enablePath_.c_str(), *origEnable_);
    }
    origEnable_.reset();
}

} // namespace curvefan
