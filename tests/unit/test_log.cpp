#include <catch2/catch.hpp>

#include "include/Log.hpp"
#include "TestSupport.hpp"

#include <filesystem>

using namespace curvefan;
using curvefan::test::TempDir;

namespace {

/* Points the global logger at a file; restores the quiet test setup afterwards. */
class ScopedLogFile {
public:
    ScopedLogFile(const std::string& path, LogLevel lvl) {
        Logger::instance().init(path, lvl, false);
    }
    ~ScopedLogFile() {
        Logger::instance().enableRotation(2 * 1024 * 1024, 3);
        Logger::instance().init("", LogLevel::Error, false);
    }
};

} // namespace

TEST_CASE("log level names", "[log]") {
    CHECK(parseLogLevel("error", LogLevel::Info) == LogLevel::Error);
    CHECK(parseLogLevel(" WARN ", LogLevel::Info) == LogLevel::Warn);
    CHECK(parseLogLevel("warning", LogLevel::Info) == LogLevel::Warn);
    CHECK(parseLogLevel("Debug", LogLevel::Info) == LogLevel::Debug);
    CHECK(parseLogLevel("trace", LogLevel::Info) == LogLevel::Trace);
    CHECK(parseLogLevel("loud", LogLevel::Warn) == LogLevel::Warn);
}

TEST_CASE("log file receives tagged lines at or above the level", "[log]") {
    TempDir dir;
    const std::string path = dir.file("logs/curvefand.log");
    {
        ScopedLogFile log(path, LogLevel::Info);
        LOG_INFO("fan %s at %d%%", "pwm1", 40);
        LOG_DEBUG("hidden");
        LOG_ERROR("boom");
        Logger::instance().shutdown();
    }

    const std::string text = dir.read("logs/curvefand.log");
    CHECK_THAT(text, Catch::Contains("[I] fan pwm1 at 40%\n"));
    CHECK_THAT(text, Catch::Contains("[E] boom\n"));
    CHECK_THAT(text, !Catch::Contains("hidden"));
}

TEST_CASE("log file rotates by size", "[log]") {
    TempDir dir;
    const std::string path = dir.file("curvefand.log");
    {
        ScopedLogFile log(path, LogLevel::Info);
        Logger::instance().enableRotation(256, 2);
        for (int i = 0; i < 40; ++i) LOG_INFO("cycle %d: all fans nominal", i);
        Logger::instance().shutdown();
    }

    CHECK(std::filesystem::exists(path));
    CHECK(std::filesystem::exists(path + ".1"));
    CHECK(std::filesystem::exists(path + ".2"));
    CHECK_FALSE(std::filesystem::exists(path + ".3"));
    CHECK(std::filesystem::file_size(path) <= 256);
    CHECK_THAT(dir.read("curvefand.log"), Catch::Contains("cycle 39"));
}
