/*
 * CurveFan — hardware abstraction (interfaces)
 * - Sensor: produces a temperature in degrees Celsius, or nothing
 * - Fan:    accepts a duty cycle in percent
 * Device failures never escape these interfaces as exceptions.
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace curvefan {

/* Identity shared by the NVIDIA sensor and fan. */
inline constexpr const char* kVendorGpuId = "vendor-gpu";

class Sensor {
public:
    virtual ~Sensor() = default;

    const std::string& id() const noexcept { return id_; }

    // nullopt = no reading this cycle (already logged by the implementation)
    virtual std::optional<double> read() = 0;

protected:
    explicit Sensor(std::string id) : id_(std::move(id)) {}

private:
    std::string id_;
};

class Fan {
public:
    virtual ~Fan() = default;

    const std::string& id() const noexcept { return id_; }

    // percent is clamped to the device range; false = write failed (logged)
    virtual bool setSpeed(double percent) = 0;

    // Hand control back to firmware/driver on shutdown. Default: nothing to undo.
    virtual void resetToAuto() {}

    // Lowest duty the device may be driven at. Only vendor fans honour it.
    virtual void setMinSpeed(int /*percent*/) {}

protected:
    explicit Fan(std::string id) : id_(std::move(id)) {}

private:
    std::string id_;
};

using SensorList = std::vector<std::unique_ptr<Sensor>>;
using FanList    = std::vector<std::unique_ptr<Fan>>;

} // namespace curvefan
