#include <catch2/catch_test_macros.hpp>

#include <jcailloux/tiercache/Log.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace jcailloux::tiercache;

// =============================================================================
// Log tests
// =============================================================================

namespace {
    struct CapturedLog {
        log::Level level;
        std::string message;
    };

    std::vector<CapturedLog> captured_logs;

    void testLogCallback(log::Level level, const char* msg, size_t len) {
        captured_logs.push_back({level, std::string(msg, len)});
    }

    // Installs the capturing callback and restores a silent logger on exit.
    struct CaptureScope {
        CaptureScope() {
            captured_logs.clear();
            log::setMinLevel(log::Level::Debug);
            log::setCallback(testLogCallback);
        }
        ~CaptureScope() {
            log::setCallback(nullptr);
            log::setMinLevel(log::Level::Debug);
        }
    };
}

TEST_CASE("Log: no callback means no output and no crash", "[log]") {
    log::setCallback(nullptr);
    REQUIRE_FALSE(log::enabled(log::Level::Error));

    TIERCACHE_LOG_ERROR << "test error";
    TIERCACHE_LOG_WARN << "test warning";
    TIERCACHE_LOG_DEBUG << "test debug";
}

TEST_CASE("Log: callback receives messages with their level", "[log]") {
    CaptureScope scope;

    TIERCACHE_LOG_ERROR << "error message";
    REQUIRE(captured_logs.size() == 1);
    REQUIRE(captured_logs[0].level == log::Level::Error);
    REQUIRE(captured_logs[0].message == "error message");

    TIERCACHE_LOG_WARN << "warn message";
    TIERCACHE_LOG_INFO << "info message";
    TIERCACHE_LOG_DEBUG << "debug message";
    REQUIRE(captured_logs.size() == 4);
    REQUIRE(captured_logs[1].level == log::Level::Warn);
    REQUIRE(captured_logs[2].level == log::Level::Info);
    REQUIRE(captured_logs[3].level == log::Level::Debug);
}

TEST_CASE("Log: streaming mixed values", "[log]") {
    CaptureScope scope;

    TIERCACHE_LOG_WARN << "RemoteCache: " << 3 << " of " << uint64_t{10} << " keys failed";
    REQUIRE(captured_logs[0].message == "RemoteCache: 3 of 10 keys failed");

    std::string key = "app:user:1";
    TIERCACHE_LOG_DEBUG << "CacheService: promoted " << key << " to L1";
    REQUIRE(captured_logs[1].message == "CacheService: promoted app:user:1 to L1");

    TIERCACHE_LOG_ERROR << 'X' << " = " << std::string_view("hello");
    REQUIRE(captured_logs[2].message == "X = hello");

    const char* null_text = nullptr;
    TIERCACHE_LOG_INFO << "before" << null_text << "after";
    REQUIRE(captured_logs[3].message == "beforeafter");
}

TEST_CASE("Log: minimum level filters below the threshold", "[log]") {
    CaptureScope scope;
    log::setMinLevel(log::Level::Warn);

    REQUIRE_FALSE(log::enabled(log::Level::Debug));
    REQUIRE(log::enabled(log::Level::Warn));

    TIERCACHE_LOG_DEBUG << "dropped";
    TIERCACHE_LOG_INFO << "dropped";
    TIERCACHE_LOG_WARN << "kept";
    TIERCACHE_LOG_ERROR << "kept too";

    REQUIRE(captured_logs.size() == 2);
    REQUIRE(captured_logs[0].message == "kept");
    REQUIRE(captured_logs[1].level == log::Level::Error);
}

TEST_CASE("Log: level names", "[log]") {
    STATIC_REQUIRE(log::levelName(log::Level::Debug) == "debug");
    STATIC_REQUIRE(log::levelName(log::Level::Warn) == "warn");
    REQUIRE(log::levelName(log::Level::Error) == "error");
}
