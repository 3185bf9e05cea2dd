/*
 * CurveFan — hardware discovery (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/Discovery.hpp"
#include "include/Hwmon.hpp"
#include "include/NvidiaTools.hpp"
#include "include/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace curvefan {

bool isHwmonTempInput(const std::string& fileName) {
    static const std::regex re(R"(temp\d+_input)");
    return std::regex_match(fileName, re);
}

bool isHwmonPwmDuty(const std::string& fileName) {
    // pwm1_enable, pwm1_max, pwm1_mode ... are attributes, not duty files
    static const std::regex re(R"(pwm\d+)");
    return std::regex_match(fileName, re);
}

static std::vector<fs::path> hwmonDirs(const fs::path& root) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        LOG_WARN("discovery: hwmon root missing: %s", root.string().c_str());
        return out;
    }
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind("hwmon", 0) != 0) continue;
        std::error_code dec;
        if (!fs::is_directory(it->path(), dec)) continue;
        out.push_back(it->path());
    }
    if (ec) {
        LOG_WARN("discovery: cannot list %s: %s", root.string().c_str(), ec.message().c_str());
    }
    std::sort(out.begin(), out.end());
    return out;
}

Inventory discoverHardware(const DiscoveryOptions& opt, CommandRunner& runner) {
    Inventory inv;
    std::vector<std::string> tempPaths;
    std::vector<std::string> pwmPaths;

    for (const auto& dir : hwmonDirs(opt.hwmonRoot)) {
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (isHwmonTempInput(name)) {
                tempPaths.push_back(it->path().string());
            } else if (isHwmonPwmDuty(name)) {
                pwmPaths.push_back(it->path().string());
            }
        }
        if (ec) {
            LOG_WARN("discovery: cannot list %s: %s", dir.string().c_str(), ec.message().c_str());
        }
    }

    std::sort(tempPaths.begin(), tempPaths.end());
    std::sort(pwmPaths.begin(), pwmPaths.end());

    for (auto& p : tempPaths) {
        LOG_DEBUG("discovery: sensor %s", p.c_str());
        inv.sensors.push_back(std::make_unique<HwmonSensor>(std::move(p)));
    }
    for (auto& p : pwmPaths) {
        LOG_DEBUG("discovery: fan %s", p.c_str());
        inv.fans.push_back(std::make_unique<HwmonFan>(std::move(p)));
    }

    if (opt.probeVendor) {
        if (probeNvidiaTools(runner)) {
            inv.sensors.push_back(std::make_unique<VendorGpuSensor>(runner));
            inv.fans.push_back(std::make_unique<VendorGpuFan>(runner, opt.privileged));
            LOG_INFO("discovery: NVIDIA tools available (%s%s)", kVendorGpuId,
                     opt.privileged ? "" : ", fan control via sudo");
        } else {
            LOG_INFO("discovery: NVIDIA tools not available");
        }
    }

    LOG_INFO("discovery: found %zu sensors and %zu fans", inv.sensors.size(), inv.fans.size());
    return inv;
}

} // namespace curvefan
