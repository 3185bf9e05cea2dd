/*
 * CurveFan — controller configuration (implementation)
 * (c) 2025 CurveFan contributors
 *
 * Notes:
 *  - Unknown keys (aliases, hidden, ... written by the GUI) are ignored.
 *  - "hardware.nvidia_min_fan_speed" is accepted as an older spelling of
 *    "hardware.vendor_min_fan_speed"; the new key wins when both exist.
 *  - A fan mapped to null or "" counts as unbound.
 */

#include "include/ControllerConfig.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace curvefan {

using nlohmann::json;

const FanCurve* ControllerConfig::findCurve(const std::string& name) const {
    auto it = curves.find(name);
    return it == curves.end() ? nullptr : &it->second;
}

/* ========================= CurvePoint ========================= */

void to_json(json& j, const CurvePoint& p) {
    j = json::array({p.tempC, p.percent});
}

void from_json(const json& j, CurvePoint& p) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number()) {
        throw ConfigError("curve point must be [temperature, speed], got " + j.dump());
    }
    p.tempC   = j[0].get<double>();
    p.percent = j[1].get<double>();
}

/* ========================== FanCurve ========================== */

void to_json(json& j, const FanCurve& c) {
    j = json{{"sensor", c.sensor}, {"points", c.points}};
}

void from_json(const json& j, FanCurve& c) {
    c = FanCurve{};
    if (!j.is_object()) throw ConfigError("curve must be an object");

    const auto s = j.find("sensor");
    if (s == j.end() || !s->is_string()) throw ConfigError("curve needs a 'sensor' string");
    c.sensor = s->get<std::string>();

    const auto pts = j.find("points");
    if (pts == j.end() || !pts->is_array()) throw ConfigError("curve needs a 'points' array");
    c.points.reserve(pts->size());
    for (const auto& p : *pts) c.points.push_back(p.get<CurvePoint>());
}

/* ======================= HardwareOptions ======================= */

void to_json(json& j, const HardwareOptions& h) {
    j = json{{"vendor_min_fan_speed", h.vendorMinFanSpeed},
             {"smoothing_step", h.smoothingStep}};
}

/* Whole-number percent; range-checked as double before narrowing. */
static int percentField(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number()) throw ConfigError(std::string("hardware.") + key + " must be a number");
    const double d = v.get<double>();
    if (!(d >= 0.0 && d <= 100.0)) {
        throw ConfigError(std::string("hardware.") + key + " must be within 0..100");
    }
    return static_cast<int>(d);
}

void from_json(const json& j, HardwareOptions& h) {
    h = HardwareOptions{};
    if (j.is_null()) return;
    if (!j.is_object()) throw ConfigError("'hardware' must be an object");

    if (j.contains("nvidia_min_fan_speed")) h.vendorMinFanSpeed = percentField(j, "nvidia_min_fan_speed");
    if (j.contains("vendor_min_fan_speed")) h.vendorMinFanSpeed = percentField(j, "vendor_min_fan_speed");
    if (j.contains("smoothing_step"))       h.smoothingStep     = j.at("smoothing_step").get<double>();
}

/* ====================== ControllerConfig ====================== */

void to_json(json& j, const ControllerConfig& c) {
    j = json{{"curves", c.curves}, {"fans", c.fans}, {"hardware", c.hardware}};
}

void from_json(const json& j, ControllerConfig& c) {
    c = ControllerConfig{};
    if (!j.is_object()) throw ConfigError("configuration root must be an object");

    if (auto it = j.find("curves"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("'curves' must be an object");
        for (const auto& [name, body] : it->items()) {
            try {
                c.curves.emplace(name, body.get<FanCurve>());
            } catch (const ConfigError& ex) {
                throw ConfigError("curve '" + name + "': " + ex.what());
            }
        }
    }

    if (auto it = j.find("fans"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("'fans' must be an object");
        for (const auto& [fan, curve] : it->items()) {
            if (curve.is_null()) continue;
            if (!curve.is_string()) throw ConfigError("fan '" + fan + "': curve name must be a string");
            const auto name = curve.get<std::string>();
            if (!name.empty()) c.fans.emplace(fan, name);
        }
    }

    if (auto it = j.find("hardware"); it != j.end()) {
        c.hardware = it->get<HardwareOptions>();
    }
}

void validateControllerConfig(const ControllerConfig& c) {
    for (const auto& [name, curve] : c.curves) {
        if (curve.points.empty()) {
            throw ConfigError("curve '" + name + "' has no points");
        }
        if (curve.sensor.empty()) {
            throw ConfigError("curve '" + name + "' has an empty sensor");
        }
    }
    if (c.hardware.vendorMinFanSpeed < 0 || c.hardware.vendorMinFanSpeed > 100) {
        throw ConfigError("hardware.vendor_min_fan_speed must be within 0..100");
    }
    if (!(c.hardware.smoothingStep > 0.0)) {
        throw ConfigError("hardware.smoothing_step must be positive");
    }
}

ControllerConfig parseControllerConfig(const std::string& text) {
    const json j = json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw ConfigError("config is not valid JSON");
    }
    ControllerConfig cfg;
    try {
        cfg = j.get<ControllerConfig>();
    } catch (const ConfigError&) {
        throw;
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("config has an invalid value: ") + ex.what());
    }
    validateControllerConfig(cfg);
    return cfg;
}

ControllerConfig loadControllerConfig(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ConfigError("config.json not found at " + path);
    }
    std::string text;
    if (!util::read_text_file(path, text)) {
        throw ConfigError("cannot read " + path + ": " + std::strerror(errno));
    }
    ControllerConfig cfg = parseControllerConfig(text);
    LOG_INFO("config: loaded %s (curves=%zu fans=%zu)", path.c_str(), cfg.curves.size(), cfg.fans.size());
    return cfg;
}

} // namespace curvefan
