/*
 * CurveFan — external tool invocation (implementation)
 * (c) 2025 CurveFan contributors
 *
 * Notes:
 *  - An exec failure in the child is reported back through a CLOEXEC pipe,
 *    so "tool not installed" is distinguishable from "tool exited 127".
 *  - The deadline covers both reading stdout and reaping the child.
 */

#include "include/Process.hpp"
#include "include/Log.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace curvefan {

using clock_type = std::chrono::steady_clock;

static int remainingMs(clock_type::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// The child leads its own process group, so helpers it forked (sudo ->
// nvidia-settings) go down with it.
static void killAndReap(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
}

ProcessRunner::ProcessRunner(std::chrono::milliseconds timeout)
: timeout_(timeout) {}

CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
    CommandResult res;
    if (argv.empty()) {
        res.error = "empty command";
        return res;
    }

    int outPipe[2];
    int errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        return res;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        ::close(outPipe[0]); ::close(outPipe[1]);
        return res;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + std::strerror(errno);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        return res;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        const int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        const int e = errno;
        ssize_t w = ::write(errPipe[1], &e, sizeof(e));
        (void)w;
        ::_exit(127);
    }

    ::setpgid(pid, pid);  // also in the parent; whichever runs first wins
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    // exec status: EOF means exec succeeded (CLOEXEC closed the pipe)
    int execErrno = 0;
    ssize_t n;
    do { n = ::read(errPipe[0], &execErrno, sizeof(execErrno)); } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        ::close(outPipe[0]);
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        res.error = "exec " + argv[0] + " failed: " + std::strerror(execErrno);
        return res;
    }
    res.started = true;

    const auto deadline = clock_type::now() + timeout_;
    char buf[4096];
    bool eof = false;
    while (!eof) {
        const int waitMs = remainingMs(deadline);
        if (waitMs == 0) break;
        pollfd pfd{outPipe[0], POLLIN, 0};
        const int pr = ::poll(&pfd, 1, waitMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) break;
        const ssize_t r = ::read(outPipe[0], buf, sizeof(buf));
        if (r > 0) {
            res.out.append(buf, static_cast<size_t>(r));
        } else if (r == 0) {
            eof = true;
        } else if (errno != EINTR) {
            break;
        }
    }
    ::close(outPipe[0]);

    // reap within the same deadline
    int status = 0;
    for (;;) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            res.error = std::string("waitpid failed: ") + std::strerror(errno);
            return res;
        }
        if (remainingMs(deadline) == 0) {
            killAndReap(pid);
            res.timedOut = true;
            res.error = argv[0] + " timed out after " + std::to_string(timeout_.count()) + " ms";
            LOG_WARN("process: %s", res.error.c_str());
            return res;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (WIFEXITED(status)) {
        res.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.exitCode = 128 + WTERMSIG(status);
    }
    LOG_TRACE("process: %s -> exit=%d", joinArgv(argv).c_str(), res.exitCode);
    return res;
}

bool processIsPrivileged() {
    return ::geteuid() == 0;
}

std::string joinArgv(const std::vector<std::string>& argv) {
    std::string s;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) s.push_back(' ');
        s += argv[i];
    }
    return s;
}

} // namespace curvefan
