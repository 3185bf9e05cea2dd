/*
 * CurveFan — Logging (implementation)
 * (c) 2025 CurveFan contributors
 */

#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <array>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace curvefan {

namespace fs = std::filesystem;

// -----------------------------------------------------------------------------
// helpers
// -----------------------------------------------------------------------------

static inline size_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    return ec ? 0u : static_cast<size_t>(sz);
}

static inline std::string makeTimestamp() {
    // "YYYY-MM-DD HH:MM:SS"
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}

LogLevel parseLogLevel(const std::string& s, LogLevel def) {
    const std::string v = util::to_lower(util::trim(s));
    if (v == "error") return LogLevel::Error;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "info")  return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    if (v == "trace") return LogLevel::Trace;
    return def;
}

// -----------------------------------------------------------------------------
// Logger
// -----------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    std::lock_guard<std::mutex> lock(mtx_);

    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
    mirror_.store(mirrorToStdio, std::memory_order_relaxed);

    closeFileUnlocked();
    filePath_ = logFilePath;
    currentSize_ = 0;

    if (!filePath_.empty()) {
        std::error_code ec;
        util::ensure_parent_dirs(filePath_, &ec);
        openFileIfNeeded();
        currentSize_ = fileSizeOrZero(filePath_);
    }
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::enableRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mtx_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;
    if (!filePath_.empty() && maxBytes_ > 0 && maxFiles_ > 0 && currentSize_ >= maxBytes_) {
        rotateFilesUnlocked();
        openFileIfNeeded();
    }
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::openFileIfNeeded() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        // no file, keep the messages visible on stdio
        mirror_.store(true, std::memory_order_relaxed);
        return;
    }
    std::fseek(file_, 0, SEEK_END);
    long pos = std::ftell(file_);
    currentSize_ = pos > 0 ? static_cast<size_t>(pos) : 0;
}

const char* Logger::levelTag(LogLevel lvl) const {
    switch (lvl) {
        case LogLevel::Error: return "E";
        case LogLevel::Warn:  return "W";
        case LogLevel::Info:  return "I";
        case LogLevel::Debug: return "D";
        case LogLevel::Trace: return "T";
    }
    return "?";
}

void Logger::checkRotateBeforeWrite(size_t incomingBytes) {
    if (maxBytes_ == 0 || maxFiles_ <= 0 || filePath_.empty()) return;
    if (currentSize_ + incomingBytes > maxBytes_) {
        rotateFilesUnlocked();
        openFileIfNeeded();
        currentSize_ = 0;
    }
}

void Logger::rotateFilesUnlocked() {
    closeFileUnlocked();

    std::error_code ec;
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        const fs::path src = filePath_ + "." + std::to_string(i);
        const fs::path dst = filePath_ + "." + std::to_string(i + 1);
        if (fs::exists(src, ec)) {
            fs::remove(dst, ec);
            fs::rename(src, dst, ec);
        }
    }
    const fs::path active = filePath_;
    const fs::path first  = filePath_ + ".1";
    if (fs::exists(active, ec)) {
        fs::remove(first, ec);
        fs::rename(active, first, ec);
    }
    currentSize_ = 0;
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    char msgBuf[2048];
    std::vsnprintf(msgBuf, sizeof(msgBuf), fmt, ap);

    // "2025-09-20 14:22:11 [I] message\n"
    std::string line = makeTimestamp();
    line += " [";
    line += levelTag(lvl);
    line += "] ";
    line += msgBuf;
    if (line.back() != '\n') line.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);

    if (!filePath_.empty()) {
        openFileIfNeeded();
        checkRotateBeforeWrite(line.size());
    }

    if (file_) {
        std::fwrite(line.data(), 1, line.size(), file_);
        std::fflush(file_);
        currentSize_ += line.size();
    }

    if (mirror_.load(std::memory_order_relaxed)) {
        FILE* out = (lvl == LogLevel::Error || lvl == LogLevel::Warn) ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace curvefan
