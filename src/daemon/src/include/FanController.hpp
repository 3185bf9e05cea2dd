/*
 * CurveFan — control loop (header)
 * - Loads config.json, binds fans to curves, runs sense -> decide -> act
 * - Owns the controller status and is its only publisher
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include "ControllerConfig.hpp"
#include "Discovery.hpp"
#include "SpeedSmoother.hpp"
#include "StatusPublisher.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace curvefan {

class FanController {
public:
    using DiscoverFn = std::function<Inventory()>;

    struct Options {
        std::string configFile;
        std::chrono::milliseconds interval{1000};
    };

    FanController(Options opt, StatusPublisher& publisher, DiscoverFn discover);
    ~FanController();

    FanController(const FanController&) = delete;
    FanController& operator=(const FanController&) = delete;

    /*
     * Full lifecycle: start(), cycles until requestStop(), shutdown().
     * Returns the process exit code: 0 on a clean stop, 1 after an error.
     */
    int run();

    /*
     * starting -> running: load config, discover hardware, publish "running".
     * starting -> error: publish "error" once and return false.
     */
    bool start();

    /* One cycle: read sensors, drive bound fans, publish status. */
    void tick();

    /* Thread-safe; wakes the inter-cycle sleep. */
    void requestStop();
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }

    /* Return fans to their previous mode and remove the status (idempotent). */
    void shutdown();

    const ControllerStatus& status() const noexcept { return status_; }
    ControllerState state() const noexcept { return status_.state; }
    const ControllerConfig& config() const noexcept { return config_; }
    const Inventory& inventory() const noexcept { return inventory_; }

private:
    void bindHardware();
    void readSensors();
    void driveFans();
    void enterError(const std::string& message);
    bool sleepInterval();
    void warnOnce(const std::string& key, const std::string& message);

private:
    Options           opt_;
    StatusPublisher&  publisher_;
    DiscoverFn        discover_;

    ControllerConfig  config_;
    Inventory         inventory_;
    SpeedSmoother     smoother_;
    ControllerStatus  status_;

    std::unordered_set<std::string> warned_;

    std::atomic<bool> stop_{false};
    bool              shutDown_{false};
    std::mutex        sleepMtx_;
    std::condition_variable sleepCv_;
};

} // namespace curvefan
