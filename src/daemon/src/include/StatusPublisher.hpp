/*
 * CurveFan — controller status document
 * - Snapshot of pid, lifecycle state, sensor readings and fan speeds
 * - Published as JSON for the configuration client; absence = stopped
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace curvefan {

enum class ControllerState {
    Starting,
    Running,
    Error
};

const char* toString(ControllerState s);

struct ControllerStatus {
    int pid{0};
    ControllerState state{ControllerState::Starting};
    std::map<std::string, std::optional<double>> sensors;  // nullopt -> null
    std::map<std::string, double> fans;
    std::optional<std::string> errorMessage;
};

void to_json(nlohmann::json& j, const ControllerStatus& s);

/*
 * Sink for status snapshots. The control loop is the only writer;
 * readers must tolerate a missing or one-cycle-old document.
 */
class StatusPublisher {
public:
    virtual ~StatusPublisher() = default;

    // false on I/O failure (logged); never throws
    virtual bool publish(const ControllerStatus& status) = 0;

    // Remove the document; its absence tells observers the daemon stopped.
    virtual void clear() = 0;
};

/* Writes <path>.tmp and renames it over <path>. */
class FileStatusPublisher : public StatusPublisher {
public:
    explicit FileStatusPublisher(std::string path);

    bool publish(const ControllerStatus& status) override;
    void clear() override;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace curvefan
