/*
 * CurveFan — controller status document (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/StatusPublisher.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace curvefan {

using nlohmann::json;

const char* toString(ControllerState s) {
    switch (s) {
        case ControllerState::Starting: return "starting";
        case ControllerState::Running:  return "running";
        case ControllerState::Error:    return "error";
    }
    return "error";
}

void to_json(json& j, const ControllerStatus& s) {
    json sensors = json::object();
    for (const auto& [id, v] : s.sensors) {
        sensors[id] = v ? json(*v) : json(nullptr);
    }
    j = json{
        {"pid", s.pid},
        {"status", toString(s.state)},
        {"sensors", std::move(sensors)},
        {"fans", s.fans}
    };
    if (s.errorMessage) j["error_message"] = *s.errorMessage;
}

FileStatusPublisher::FileStatusPublisher(std::string path)
: path_(std::move(path)) {}

bool FileStatusPublisher::publish(const ControllerStatus& status) {
    std::string payload;
    try {
        // paths in error messages are bytes, not necessarily UTF-8
        payload = json(status).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& ex) {
        LOG_ERROR("status: cannot serialize: %s", ex.what());
        return false;
    }
    payload.push_back('\n');

    std::string err;
    if (!util::write_text_file_atomic(path_, payload, &err)) {
        LOG_ERROR("status: %s", err.c_str());
        return false;
    }
    LOG_TRACE("status: wrote %s (%s)", path_.c_str(), toString(status.state));
    return true;
}

void FileStatusPublisher::clear() {
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        LOG_DEBUG("status: removed %s", path_.c_str());
    } else if (ec) {
        LOG_WARN("status: cannot remove %s: %s", path_.c_str(), ec.message().c_str());
    }
}

} // namespace curvefan
