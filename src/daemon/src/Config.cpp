/*
 * CurveFan — daemon settings (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/Config.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace curvefan {

DaemonConfig defaultConfig() {
    return DaemonConfig{};
}

void applyEnvFallbacks(DaemonConfig& c) {
    if (auto v = util::getenv_str("CURVEFAND_CONFIG_DIR"); v && !v->empty()) c.configDir = *v;
    if (auto v = util::getenv_str("CURVEFAND_HWMON_ROOT"); v && !v->empty()) c.hwmonRoot = *v;
    if (auto v = util::getenv_str("CURVEFAND_LOGFILE");    v && !v->empty()) c.logfile   = *v;

    c.intervalMs    = util::getenv_int("CURVEFAND_INTERVAL_MS",     c.intervalMs);
    c.toolTimeoutMs = util::getenv_int("CURVEFAND_TOOL_TIMEOUT_MS", c.toolTimeoutMs);
    c.debug         = util::getenv_bool("CURVEFAND_DEBUG",          c.debug);
    c.probeVendor   = util::getenv_bool("CURVEFAND_PROBE_VENDOR",   c.probeVendor);

    if (c.intervalMs <= 0)    c.intervalMs = 1000;
    if (c.toolTimeoutMs <= 0) c.toolTimeoutMs = 5000;
}

static std::string xdgConfigHome() {
    if (auto v = util::getenv_str("XDG_CONFIG_HOME"); v && !v->empty()) return *v;
    if (auto h = util::getenv_str("HOME"); h && !h->empty()) return (fs::path(*h) / ".config").string();
    return {};
}

std::string resolveConfigDir(const std::string& explicitDir) {
    std::error_code ec;

    if (!explicitDir.empty()) {
        const std::string d = util::expandUserPath(explicitDir);
        if (fs::is_directory(d, ec)) return d;
        LOG_WARN("config: directory %s does not exist, falling back", d.c_str());
    }

    const fs::path cwd = fs::current_path(ec);
    if (!ec && fs::exists(cwd / kConfigFileName, ec)) {
        return cwd.string();
    }

    const std::string base = xdgConfigHome();
    const fs::path dir = base.empty() ? fs::path(".") : fs::path(base) / "fan_controller";
    fs::create_directories(dir, ec);
    if (ec) {
        LOG_WARN("config: cannot create %s: %s", dir.string().c_str(), ec.message().c_str());
    }
    return dir.string();
}

void finalizePaths(DaemonConfig& c) {
    c.configDir = resolveConfigDir(c.configDir);
    if (c.configFile.empty()) c.configFile = (fs::path(c.configDir) / kConfigFileName).string();
    if (c.statusFile.empty()) c.statusFile = (fs::path(c.configDir) / kStatusFileName).string();

    c.configFile = util::expandUserPath(c.configFile);
    c.statusFile = util::expandUserPath(c.statusFile);
    c.hwmonRoot  = util::expandUserPath(c.hwmonRoot);
    c.logfile    = util::expandUserPath(c.logfile);
}

} // namespace curvefan
