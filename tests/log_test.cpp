//! # Logger Tests
//!
//! Filter specs, the record line format, environment configuration and the
//! global logger's thread safety.

#include "weft/log/log.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace weft::log;

namespace {

/// Puts the global logger back to its startup state.
void reset_logger() {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}

} // namespace

// ============================================================================
// Levels and Filters
// ============================================================================

TEST(LogLevelTest, NamesParseIgnoringCase) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("OFF"), LogLevel::Off);
    EXPECT_FALSE(parse_level("loud").has_value());
    EXPECT_FALSE(parse_level("").has_value());
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
}

TEST(LogFilterTest, DefaultIsWarn) {
    LogFilter filter;
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "json"));
}

TEST(LogFilterTest, ModuleOverridesDefault) {
    LogFilter filter;
    filter.parse(" json = trace , *=error ");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_EQ(filter.lowest_level(), LogLevel::Trace);
}

TEST(LogFilterTest, BareModuleMeansTrace) {
    LogFilter filter;
    filter.parse("json");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "other"));
}

TEST(LogFilterTest, OffSilencesModule) {
    LogFilter filter;
    filter.parse("json=off,*=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Error, "json"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "other"));
}

TEST(LogFilterTest, UnknownLevelEntryIsIgnored) {
    LogFilter filter;
    filter.parse("json=loud,*=debug");
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "json"));
}

TEST(LogFilterTest, LaterEntryWins) {
    LogFilter filter;
    filter.parse("json=trace,json=error");
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "json"));
}

// ============================================================================
// Sinks
// ============================================================================

TEST(LogSinkTest, LineFormat) {
    LogRecord record{LogLevel::Debug, "json", "skipping unknown field \"x\""};
    EXPECT_EQ(format_line(record), "DEBUG [json] skipping unknown field \"x\"\n");
}

TEST(LogSinkTest, MemorySinkCapturesAndClears) {
    MemorySink sink;
    sink.write({LogLevel::Trace, "json", "opened a.json"});
    sink.write({LogLevel::Trace, "json", "closed a.json"});
    EXPECT_EQ(sink.lines(),
              (std::vector<std::string>{"TRACE [json] opened a.json\n",
                                        "TRACE [json] closed a.json\n"}));
    sink.clear();
    EXPECT_TRUE(sink.lines().empty());
}

// ============================================================================
// Environment
// ============================================================================

class LogEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("WEFT_LOG");
    }

    void TearDown() override {
        unsetenv("WEFT_LOG");
        reset_logger();
    }
};

TEST_F(LogEnvTest, UnsetMeansWarn) {
    auto config = config_from_env();
    EXPECT_EQ(config.filter_spec, "*=warn");
    EXPECT_TRUE(config.to_stderr);
}

TEST_F(LogEnvTest, LevelAppliesToAllModules) {
    setenv("WEFT_LOG", "debug", 1);
    EXPECT_EQ(config_from_env().filter_spec, "*=debug");
}

TEST_F(LogEnvTest, FilterSpecPassesThrough) {
    setenv("WEFT_LOG", "json=trace", 1);
    EXPECT_EQ(config_from_env().filter_spec, "json=trace");
}

TEST_F(LogEnvTest, InitInstallsFilter) {
    setenv("WEFT_LOG", "json=trace,*=off", 1);
    init_from_env();
    auto& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::Trace);
    EXPECT_TRUE(logger.should_log(LogLevel::Trace, "json"));
    EXPECT_FALSE(logger.should_log(LogLevel::Error, "other"));
}

// ============================================================================
// Global Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    MemorySink* sink_ = nullptr;

    void SetUp() override {
        reset_logger();
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        reset_logger();
    }
};

TEST_F(LoggerTest, DebugHiddenByDefault) {
    WEFT_LOG_DEBUG("json", "hidden");
    EXPECT_TRUE(sink_->lines().empty());
}

TEST_F(LoggerTest, SetLevelEnablesDebug) {
    Logger::instance().set_level(LogLevel::Debug);
    WEFT_LOG_DEBUG("json", "count=" << 3);
    WEFT_LOG_TRACE("json", "still hidden");
    EXPECT_EQ(sink_->lines(), (std::vector<std::string>{"DEBUG [json] count=3\n"}));
}

TEST_F(LoggerTest, FilterSelectsModule) {
    Logger::instance().set_filter("json=trace");
    WEFT_LOG_TRACE("json", "kept");
    WEFT_LOG_TRACE("other", "dropped");
    EXPECT_EQ(sink_->lines(), (std::vector<std::string>{"TRACE [json] kept\n"}));
}

TEST_F(LoggerTest, MessageNotBuiltWhenFiltered) {
    int evaluated = 0;
    auto touch = [&evaluated] { return ++evaluated; };
    WEFT_LOG_DEBUG("json", touch());
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggerTest, ConcurrentLoggingAndReconfiguring) {
    constexpr int kThreads = 8;
    constexpr int kMessages = 200;
    Logger::instance().set_level(LogLevel::Trace);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kMessages; ++i) {
                WEFT_LOG_DEBUG("json", "thread " << t << " item " << i);
            }
        });
    }
    // Rewrites the filter while the loggers above are reading it.
    std::thread reconfigure([] {
        for (int i = 0; i < kMessages; ++i) {
            Logger::instance().set_filter(i % 2 == 0 ? "json=trace" : "*=trace");
        }
    });
    for (auto& thread : threads) {
        thread.join();
    }
    reconfigure.join();

    EXPECT_EQ(sink_->lines().size(), static_cast<size_t>(kThreads * kMessages));
}
