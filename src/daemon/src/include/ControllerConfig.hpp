/*
 * CurveFan — controller configuration (config.json)
 * - curves:   name -> { sensor, points: [[tempC, percent], ...] }
 * - fans:     fan identity -> curve name
 * - hardware: vendor_min_fan_speed, smoothing_step
 * Written by the configuration client, read once at daemon start.
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include "Curve.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace curvefan {

/* Missing, unreadable or invalid configuration; fatal at startup. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HardwareOptions {
    int    vendorMinFanSpeed{26};
    double smoothingStep{10.0};
};

struct ControllerConfig {
    std::map<std::string, FanCurve>    curves;
    std::map<std::string, std::string> fans;   // unbound fans are simply absent
    HardwareOptions hardware;

    const FanCurve* findCurve(const std::string& name) const;
};

void to_json(nlohmann::json& j, const CurvePoint& p);
void from_json(const nlohmann::json& j, CurvePoint& p);

void to_json(nlohmann::json& j, const FanCurve& c);
void from_json(const nlohmann::json& j, FanCurve& c);

void to_json(nlohmann::json& j, const HardwareOptions& h);
void from_json(const nlohmann::json& j, HardwareOptions& h);

void to_json(nlohmann::json& j, const ControllerConfig& c);
void from_json(const nlohmann::json& j, ControllerConfig& c);

/* Structural checks beyond JSON shape; throws ConfigError. */
void validateControllerConfig(const ControllerConfig& c);

/* Parse + validate; throws ConfigError with a user-facing message. */
ControllerConfig parseControllerConfig(const std::string& text);
ControllerConfig loadControllerConfig(const std::string& path);

} // namespace curvefan
