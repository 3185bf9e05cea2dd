/*
 * CurveFan — external tool invocation (header)
 * - Spawns vendor command-line tools with a bounded runtime
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace curvefan {

struct CommandResult {
    bool        started{false};   // exec succeeded
    bool        timedOut{false};  // killed after the deadline
    int         exitCode{-1};     // valid when started && !timedOut
    std::string out;              // captured stdout
    std::string error;            // spawn/exec diagnostics

    bool ok() const noexcept { return started && !timedOut && exitCode == 0; }
};

/* Seam for vendor tooling; tests substitute a scripted runner. */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // argv[0] is looked up in PATH. stderr of the child is discarded.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

/* fork/exec runner; the child runs in its own process group, which is SIGKILLed once the timeout expires. */
class ProcessRunner : public CommandRunner {
public:
    explicit ProcessRunner(std::chrono::milliseconds timeout);

    CommandResult run(const std::vector<std::string>& argv) override;

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/* True when running with effective uid 0. */
bool processIsPrivileged();

/* "a b c" rendering of argv for log lines. */
std::string joinArgv(const std::vector<std::string>& argv);

} // namespace curvefan
