/*
 * CurveFan — daemon entry (main)
 * (c) 2025 CurveFan contributors
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "include/Version.hpp"
#include "include/Config.hpp"
#include "include/Discovery.hpp"
#include "include/FanController.hpp"
#include "include/Log.hpp"
#include "include/Process.hpp"
#include "include/StatusPublisher.hpp"
#include "include/Utils.hpp"

using curvefan::DaemonConfig;
using curvefan::FanController;

static std::atomic<bool> gStop{false};
static void sig_handler(int) { gStop.store(true); }

static void usage(const char* exe) {
    std::cout <<
        "CurveFan daemon (curvefand) " << CURVEFAND_VERSION << "\n"
        "Usage: " << exe << " [options] [CONFIG_DIR]\n"
        "Options:\n"
        "  --config-dir DIR       Directory with config.json (default: ./ if it has one,\n"
        "                         else ~/.config/fan_controller)\n"
        "  --interval-ms N        Control cycle interval (default: 1000)\n"
        "  --hwmon-root DIR       hwmon class directory (default: /sys/class/hwmon)\n"
        "  --tool-timeout-ms N    Timeout for nvidia-smi/nvidia-settings (default: 5000)\n"
        "  --no-vendor            Do not probe NVIDIA tools\n"
        "  --logfile PATH         Also write the log to PATH\n"
        "  --once                 Run a single control cycle and exit\n"
        "  --debug                Verbose logging\n"
        "  --version              Print version and exit\n"
        "  -h,--help              Show this help\n";
}

static void install_signals() {
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);
    std::signal(SIGHUP,  sig_handler);
}

static bool parse_positive(const std::string& s, int& out) {
    auto v = curvefan::util::parse_ll(s);
    if (!v || *v <= 0 || *v > 24LL * 3600 * 1000) return false;
    out = static_cast<int>(*v);
    return true;
}

int main(int argc, char** argv) {
    DaemonConfig cfg = curvefan::defaultConfig();
    curvefan::applyEnvFallbacks(cfg);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) { std::cerr << "missing value for " << what << "\n"; std::exit(2); }
            return argv[++i];
        };
        auto next_int = [&](const char* what) -> int {
            int v = 0;
            const std::string s = next(what);
            if (!parse_positive(s, v)) { std::cerr << "invalid value for " << what << ": " << s << "\n"; std::exit(2); }
            return v;
        };

        if (a == "--config-dir")           cfg.configDir = next(a.c_str());
        else if (a == "--interval-ms")     cfg.intervalMs = next_int(a.c_str());
        else if (a == "--hwmon-root")      cfg.hwmonRoot = next(a.c_str());
        else if (a == "--tool-timeout-ms") cfg.toolTimeoutMs = next_int(a.c_str());
        else if (a == "--no-vendor")       cfg.probeVendor = false;
        else if (a == "--logfile")         cfg.logfile = next(a.c_str());
        else if (a == "--once")            cfg.once = true;
        else if (a == "--debug")           cfg.debug = true;
        else if (a == "--version")         { std::cout << CURVEFAND_VERSION << "\n"; return 0; }
        else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
        else if (!a.empty() && a[0] != '-') cfg.configDir = a;
        else {
            std::cerr << "unknown arg: " << a << "\n";
            usage(argv[0]);
            return 2;
        }
    }

    curvefan::Logger::instance().init(cfg.logfile,
                                      cfg.debug ? curvefan::LogLevel::Debug : curvefan::LogLevel::Info,
                                      true);
    curvefan::Logger::instance().enableRotation(
        static_cast<size_t>(std::max(0, curvefan::util::getenv_int("CURVEFAND_LOG_MAX_BYTES", 2 * 1024 * 1024))),
        std::max(1, curvefan::util::getenv_int("CURVEFAND_LOG_MAX_FILES", 3)));
    if (auto lvl = curvefan::util::getenv_str("CURVEFAND_LOG_LEVEL")) {
        curvefan::Logger::instance().setLevel(
            curvefan::parseLogLevel(*lvl, curvefan::Logger::instance().level()));
    }

    curvefan::finalizePaths(cfg);
    LOG_INFO("curvefand %s starting (config=%s status=%s)",
             CURVEFAND_VERSION, cfg.configFile.c_str(), cfg.statusFile.c_str());

    install_signals();

    curvefan::ProcessRunner runner(std::chrono::milliseconds(cfg.toolTimeoutMs));
    curvefan::FileStatusPublisher publisher(cfg.statusFile);

    curvefan::DiscoveryOptions dopt;
    dopt.hwmonRoot   = cfg.hwmonRoot;
    dopt.probeVendor = cfg.probeVendor;
    dopt.privileged  = curvefan::processIsPrivileged();

    FanController::Options copt;
    copt.configFile = cfg.configFile;
    copt.interval   = std::chrono::milliseconds(cfg.intervalMs);

    FanController controller(copt, publisher,
                             [&] { return curvefan::discoverHardware(dopt, runner); });

    if (cfg.once) {
        int rc = 1;
        if (controller.start()) {
            try {
                controller.tick();
                rc = 0;
            } catch (const std::exception& ex) {
                LOG_ERROR("cycle failed: %s", ex.what());
            }
        }
        controller.shutdown();
        curvefan::Logger::instance().shutdown();
        return rc;
    }

    // Control loop on its own thread; the main thread watches for signals.
    std::atomic<bool> loopDone{false};
    int exitCode = 0;
    std::thread loopThread([&] {
        exitCode = controller.run();
        loopDone.store(true);
    });

    while (!gStop.load(std::memory_order_relaxed) && !loopDone.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (gStop.load()) LOG_INFO("curvefand shutting down (signal received)");
    controller.requestStop();
    if (loopThread.joinable()) loopThread.join();

    LOG_INFO("curvefand stopped (exit=%d)", exitCode);
    curvefan::Logger::instance().shutdown();
    return exitCode;
}
