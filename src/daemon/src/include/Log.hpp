/*
 * CurveFan — Logging (header)
 * - Thread-safe logger with optional file output and size-based rotation
 * - printf-style API for cheap call-sites in the control loop
 * (c) 2025 CurveFan contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace curvefan {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,  // device or config failure, user-visible through status
    Warn  = 1,  // recoverable anomaly
    Info  = 2,  // default operational messages
    Debug = 3,  // per-cycle decisions
    Trace = 4   // raw device I/O
};

/* Parse "error|warn|info|debug|trace" (case-insensitive); returns def on mismatch. */
LogLevel parseLogLevel(const std::string& s, LogLevel def);

/*
 * Logger — singleton, safe for concurrent writers.
 * - The log file is opened lazily; its directory is created if needed.
 * - Rotation is size-based (maxBytes/maxFiles).
 * - Messages are mirrored to stdout/stderr when mirror mode is enabled.
 */
class Logger {
public:
    static Logger& instance();

    ~Logger();

    /*
     * Configure the logger once at startup.
     *  - logFilePath: destination file (empty = no file, stdio only).
     *  - lvl: minimum severity to emit.
     *  - mirrorToStdio: also print to stdout (info and below) / stderr (warn, error).
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    void setLevel(LogLevel lvl);
    LogLevel level() const;

    /* Close the file (idempotent). Later writes reopen it lazily. */
    void shutdown();

    /*
     * Configure rotation:
     *  - maxBytes: rotate when the file would exceed this size (0 disables).
     *  - maxFiles: number of rotated files to keep (>=1).
     * Default is 2 MiB / 3 files.
     */
    void enableRotation(size_t maxBytes, int maxFiles);

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileIfNeeded();
    void closeFileUnlocked();
    const char* levelTag(LogLevel lvl) const;
    void checkRotateBeforeWrite(size_t incomingBytes);

    /* Shift N-1..1 -> N..2, move active -> .1 */
    void rotateFilesUnlocked();

private:
    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::atomic<bool> mirror_{true};

    std::string filePath_;
    FILE* file_{nullptr};

    size_t maxBytes_{2 * 1024 * 1024};
    int    maxFiles_{3};
    size_t currentSize_{0};
};

#define LOG_ERROR(fmt, ...) ::curvefan::Logger::instance().write(::curvefan::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::curvefan::Logger::instance().write(::curvefan::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::curvefan::Logger::instance().write(::curvefan::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::curvefan::Logger::instance().write(::curvefan::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) ::curvefan::Logger::instance().write(::curvefan::LogLevel::Trace, fmt, ##__VA_ARGS__)

} // namespace curvefan
