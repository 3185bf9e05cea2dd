/*
 * CurveFan — control loop (implementation)
 * (c) 2025 CurveFan contributors
 *
 * Notes:
 * - Device failures are contained per sensor/fan: a null reading skips the
 *   fans driven by it, a failed write leaves that fan's status untouched.
 * - Fans without a usable binding are skipped every cycle and reported once.
 * - Anything thrown out of a cycle is fatal: status "error", loop ends.
 */

#include "include/FanController.hpp"
#include "include/Curve.hpp"
#include "include/Hardware.hpp"
#include "include/Log.hpp"

#include <exception>
#include <set>
#include <utility>

#include <unistd.h>

namespace curvefan {

FanController::FanController(Options opt, StatusPublisher& publisher, DiscoverFn discover)
: opt_(std::move(opt)),
  publisher_(publisher),
  discover_(std::move(discover))
{
    status_.pid   = static_cast<int>(::getpid());
    status_.state = ControllerState::Starting;
}

FanController::~FanController() {
    shutdown();
}

int FanController::run() {
    if (!start()) {
        shutdown();
        return 1;
    }

    LOG_INFO("controller: running (interval=%lld ms)", static_cast<long long>(opt_.interval.count()));
    try {
        while (!stopRequested()) {
            tick();
            if (!sleepInterval()) break;
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("controller: unhandled exception: %s", ex.what());
        enterError(ex.what());
        shutdown();
        return 1;
    }

    LOG_INFO("controller: stopping");
    shutdown();
    return 0;
}

bool FanController::start() {
    try {
        config_ = loadControllerConfig(opt_.configFile);
    } catch (const ConfigError& ex) {
        LOG_ERROR("controller: %s", ex.what());
        enterError(ex.what());
        return false;
    }

    inventory_ = discover_ ? discover_() : Inventory{};
    bindHardware();

    status_.state = ControllerState::Running;
    status_.errorMessage.reset();
    (void)publisher_.publish(status_);  // failures are logged by the publisher
    return true;
}

void FanController::bindHardware() {
    for (auto& fan : inventory_.fans) {
        if (fan->id() == kVendorGpuId) {
            fan->setMinSpeed(config_.hardware.vendorMinFanSpeed);
        }
    }

    std::set<std::string> fanIds;
    for (const auto& fan : inventory_.fans) fanIds.insert(fan->id());
    std::set<std::string> sensorIds;
    for (const auto& s : inventory_.sensors) sensorIds.insert(s->id());

    for (const auto& [fanId, curveName] : config_.fans) {
        if (!fanIds.count(fanId)) {
            LOG_WARN("controller: fan '%s' (curve '%s') not present on this machine",
                     fanId.c_str(), curveName.c_str());
        }
    }
    for (const auto& [name, curve] : config_.curves) {
        if (!sensorIds.count(curve.sensor)) {
            LOG_WARN("controller: curve '%s' uses unknown sensor '%s'", name.c_str(), curve.sensor.c_str());
        }
    }
    LOG_INFO("controller: %zu sensors, %zu fans, %zu bindings, smoothing step %.1f%%",
             inventory_.sensors.size(), inventory_.fans.size(), config_.fans.size(),
             config_.hardware.smoothingStep);
}

void FanController::tick() {
    readSensors();
    driveFans();
    (void)publisher_.publish(status_);
}

void FanController::readSensors() {
    for (auto& sensor : inventory_.sensors) {
        status_.sensors[sensor->id()] = sensor->read();
    }
}

void FanController::driveFans() {
    for (auto& fan : inventory_.fans) {
        const std::string& id = fan->id();

        auto binding = config_.fans.find(id);
        if (binding == config_.fans.end()) {
            warnOnce(id + "\nunbound", "fan '" + id + "' has no curve assigned, skipping");
            continue;
        }

        const FanCurve* curve = config_.findCurve(binding->second);
        if (!curve) {
            warnOnce(id + "\nmissing\n" + binding->second,
                     "curve '" + binding->second + "' not found for fan '" + id + "', skipping");
            continue;
        }

        auto reading = status_.sensors.find(curve->sensor);
        if (reading == status_.sensors.end() || !reading->second) {
            LOG_DEBUG("controller: no reading from '%s' for fan '%s', keeping last speed",
                      curve->sensor.c_str(), id.c_str());
            continue;
        }

        const double tempC   = *reading->second;
        const double target  = evaluateCurve(tempC, *curve);
        const double applied = smoother_.smooth(id, target, config_.hardware.smoothingStep);

        if (fan->setSpeed(applied)) {
            status_.fans[id] = applied;
            LOG_DEBUG("controller: fan %s: %.1f C -> target %.1f%% -> applied %.1f%%",
                      id.c_str(), tempC, target, applied);
        }
    }
}

void FanController::warnOnce(const std::string& key, const std::string& message) {
    if (!warned_.insert(key).second) return;
    LOG_WARN("controller: %s", message.c_str());
}

void FanController::enterError(const std::string& message) {
    status_.state = ControllerState::Error;
    status_.errorMessage = message.empty() ? std::string("unknown error") : message;
    (void)publisher_.publish(status_);
}

bool FanController::sleepInterval() {
    std::unique_lock<std::mutex> lk(sleepMtx_);
    sleepCv_.wait_for(lk, opt_.interval, [this] { return stopRequested(); });
    return !stopRequested();
}

void FanController::requestStop() {
    {
        std::lock_guard<std::mutex> lk(sleepMtx_);
        stop_.store(true, std::memory_order_relaxed);
    }
    sleepCv_.notify_all();
}

void FanController::shutdown() {
    if (shutDown_) return;
    shutDown_ = true;

    for (auto& fan : inventory_.fans) {
        fan->resetToAuto();
    }
    publisher_.clear();
    LOG_DEBUG("controller: shutdown complete");
}

} // namespace curvefan
