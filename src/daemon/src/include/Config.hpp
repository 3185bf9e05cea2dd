/*
 * CurveFan — daemon settings (public interface)
 * (c) 2025 CurveFan contributors
 *
 * Layering: defaults -> environment (CURVEFAND_*) -> command line.
 * The controller configuration itself (curves/fans) lives in config.json,
 * see ControllerConfig.hpp.
 */
#pragma once

#include <string>

namespace curvefan {

inline constexpr const char* kConfigFileName = "config.json";
inline constexpr const char* kStatusFileName = ".fan_controller_status.json";

struct DaemonConfig {
    // Directory holding config.json and the status file. Empty = resolve.
    std::string configDir;
    std::string configFile;
    std::string statusFile;

    std::string hwmonRoot{"/sys/class/hwmon"};

    int intervalMs{1000};
    int toolTimeoutMs{5000};

    std::string logfile;     // empty = stdio only
    bool debug{false};
    bool once{false};        // single cycle, then exit
    bool probeVendor{true};
};

DaemonConfig defaultConfig();

/* Environment overlay; only variables that are set override. */
void applyEnvFallbacks(DaemonConfig& c);

/*
 * Pick the configuration directory:
 *  1. `explicitDir` if it exists
 *  2. the current directory if it contains config.json
 *  3. $XDG_CONFIG_HOME/fan_controller (or ~/.config/fan_controller), created
 *     on demand; a config.json found in the current directory is not copied.
 */
std::string resolveConfigDir(const std::string& explicitDir);

/* Fill configDir/configFile/statusFile and expand "~"/$VAR in paths. */
void finalizePaths(DaemonConfig& c);

} // namespace curvefan
