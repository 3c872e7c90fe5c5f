//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink text and JSON output, level filtering,
//! command-line option parsing and concurrent logging.

#include "log/log.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace polyfmt::log;
using polyfmt::test::CaptureSink;
using polyfmt::test::ScopedLogCapture;
using polyfmt::test::TempDir;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("ffi=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "ffi"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "ffi"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "ffi"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "batch"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "batch"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("sandbox");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "sandbox"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "dispatch"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "dispatch"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("ffi=trace,sandbox=info,config=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "ffi"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "sandbox"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "sandbox"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cli"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("ffi=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, OffSilencesModule) {
    filter.parse("dispatch=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "dispatch"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "ffi"));
}

TEST(LogLevelTest, ParseNamesAndFallback) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    TempDir dir{"polyfmt_log"};

    auto log_path() const -> std::string { return (dir.path() / "run.log").string(); }

    static auto record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
        LogRecord r;
        r.level = level;
        r.module = module;
        r.message = std::move(message);
        r.file = __FILE__;
        r.line = __LINE__;
        r.timestamp_ms = 12345;
        return r;
    }
};

TEST_F(FileSinkTest, WritesTextRecord) {
    {
        FileSink sink(log_path(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(record(LogLevel::Info, "batch", "42 files"));
        sink.flush();
    }

    std::string content = TempDir::read(log_path());
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[batch]"), std::string::npos);
    EXPECT_NE(content.find("42 files"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(log_path(), true);
        sink.write(record(LogLevel::Info, "ffi", "first"));
    }
    {
        FileSink sink(log_path(), true);
        sink.write(record(LogLevel::Warn, "sandbox", "second"));
    }

    std::string content = TempDir::read(log_path());
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonLinesEscapeSpecialCharacters) {
    {
        FileSink sink(log_path(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(record(LogLevel::Error, "dispatch", "line1\nline2\t\"quoted\"\\"));
    }

    std::string content = TempDir::read(log_path());
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"dispatch\""), std::string::npos);
    EXPECT_NE(content.find("\\n"), std::string::npos);
    EXPECT_NE(content.find("\\t"), std::string::npos);
    EXPECT_NE(content.find("\\\""), std::string::npos);
    EXPECT_NE(content.find("\\\\"), std::string::npos);
}

// ============================================================================
// Command-Line Options
// ============================================================================

namespace {

auto parse(std::vector<std::string> args) -> LogConfig {
    args.insert(args.begin(), "polyfmt");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"src/"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST(LogOptionsTest, ExplicitFlags) {
    auto config = parse({"--log-level=debug", "--log-filter=ffi=trace", "--log-file=out.log",
                         "--log-format=json"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "ffi=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, VerbosityCounts) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--log-level=error", "-vvv"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, QuietRaisesToError) {
    EXPECT_EQ(parse({"--quiet"}).level, LogLevel::Error);
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, MacroRespectsLevel) {
    ScopedLogCapture capture(LogLevel::Info);

    POLYFMT_LOG_DEBUG("ffi", "hidden " << 1);
    POLYFMT_LOG_INFO("ffi", "shown " << 2);

    auto records = capture.sink().records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "ffi");
    EXPECT_EQ(records[0].message, "shown 2");
}

TEST(LoggerTest, ConcurrentLogging) {
    ScopedLogCapture capture;
    auto& logger = Logger::instance();

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "worker-" << t << "-file-" << i;
                logger.log(LogLevel::Info, "batch", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(capture.sink().records().size(),
              static_cast<size_t>(num_threads * messages_per_thread));
}
