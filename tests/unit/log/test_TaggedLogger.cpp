#include "EnvGuard.hpp"
#include "log/TaggedLogger.hpp"

#include <doctest/doctest.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using M2M::Testing::EnvBlock;
using M2M::Testing::EnvGuard;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// The logger writes from its worker; destroying it drains the queue
auto logOnce(std::function<void(M2M::TaggedLogger&)> fn) -> std::string {
    return captureStderr([&] {
        M2M::TaggedLogger logger;
        fn(logger);
        std::this_thread::sleep_for(20ms);
    });
}

auto makeBaselineEnvBlock() -> EnvBlock {
    return EnvBlock{
        {"M2M_LOG_ENABLED", nullptr},
        {"M2M_LOG", nullptr},
        {"M2M_LOG_CLEAR_DEFAULT_SKIPS", nullptr},
        {"M2M_LOG_ENABLE_TAGS", nullptr},
        {"M2M_LOG_SKIP_TAGS", nullptr},
    };
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging is disabled by default") {
    auto env = makeBaselineEnvBlock();
    auto output = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("should not appear", std::source_location::current(), "Dispatcher");
    });
    CHECK(output.empty());
}

TEST_CASE("environment flag enables logging") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");

    auto output = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("resolved address", std::source_location::current(), "Address");
    });
    CHECK(output.find("[Address]") != std::string::npos);
    CHECK(output.find("resolved address") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("short variable enables logging and zero keeps it off") {
    auto env = makeBaselineEnvBlock();
    {
        EnvGuard enableLog("M2M_LOG", "on");
        auto     output = logOnce([](M2M::TaggedLogger& logger) {
            logger.log_impl("env enabled", std::source_location::current(), "Registration");
        });
        CHECK(output.find("env enabled") != std::string::npos);
    }
    {
        EnvGuard disabled("M2M_LOG", "0");
        auto     output = logOnce([](M2M::TaggedLogger& logger) {
            logger.log_impl("env disabled", std::source_location::current(), "Dispatcher");
        });
        CHECK(output.empty());
    }
}

TEST_CASE("default skip list hides store chatter") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");

    auto skipped = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("index updated", std::source_location::current(), "Store");
    });
    CHECK(skipped.empty());

    EnvGuard clearSkips("M2M_LOG_CLEAR_DEFAULT_SKIPS", "1");
    auto     kept = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("index updated", std::source_location::current(), "Store");
    });
    CHECK(kept.find("index updated") != std::string::npos);
}

TEST_CASE("enabled tags gate output") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");
    EnvGuard enableTags("M2M_LOG_ENABLE_TAGS", "Security");

    auto accepted = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("keep me", std::source_location::current(), "Security");
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("drop me", std::source_location::current(), "Security", "WARN");
    });
    CHECK(rejected.empty());
}

TEST_CASE("skip tags are trimmed and extend the filter") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");
    EnvGuard extraSkip("M2M_LOG_SKIP_TAGS", " Discovery , Remote ");

    auto skipped = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("filtered", std::source_location::current(), "Remote");
    });
    CHECK(skipped.empty());

    auto passed = logOnce([](M2M::TaggedLogger& logger) {
        logger.log_impl("expected", std::source_location::current(), "Dispatcher");
    });
    CHECK(passed.find("expected") != std::string::npos);
}

TEST_CASE("thread name and source location are printed") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");

    auto output = logOnce([](M2M::TaggedLogger& logger) {
        logger.setThreadName("Worker-7");
#line 42 "dir/dispatch/LoggedFile.cpp"
        logger.log_impl("with name", std::source_location::current(), "Test");
#line 160 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("[Worker-7]") != std::string::npos);
    CHECK(output.find("dispatch/LoggedFile.cpp:42") != std::string::npos);
}

TEST_CASE("runtime switch overrides the environment") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("M2M_LOG_ENABLED", "1");

    auto suppressed = logOnce([](M2M::TaggedLogger& logger) {
        logger.setLoggingEnabled(false);
        CHECK_FALSE(logger.loggingEnabled());
        logger.log_impl("disabled", std::source_location::current(), "Test");
    });
    CHECK(suppressed.empty());
}

#ifdef M2M_LOG_DEBUG
TEST_CASE("macro joins tags") {
    auto output = captureStderr([] {
        M2M::set_thread_name("MacroThread");
        M2M::set_logging_enabled(true);
        m2m_log("via macro", "Alpha", "Beta");
        std::this_thread::sleep_for(50ms);
        M2M::set_logging_enabled(false);
    });
    CHECK(output.find("Alpha][Beta") != std::string::npos);
    CHECK(output.find("[MacroThread]") != std::string::npos);
}
#endif

}
