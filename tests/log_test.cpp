//! # Logger Unit Tests
//!
//! LogFilter parsing, line formatting, file and fan-out sinks, level and
//! module filtering through the global logger, and CLI option parsing.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace apidiff::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("metadata=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "metadata"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "metadata"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "metadata"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "diff"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "diff"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("registry=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "registry"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "zip"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("surface");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "surface"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "mcp"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("metadata=trace,zip=info,mcp=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "metadata"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "zip"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "zip"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "mcp"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "mcp"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("metadata=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilterUsesInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>* out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_->push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {
        ++flushes;
    }

    int flushes = 0;

private:
    std::vector<Entry>* out_;
};

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = epoch_ms();
    return record;
}

/// Installs a capturing sink on the global logger and restores a quiet
/// default afterwards.
class GlobalLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_sink(std::make_unique<CaptureSink>(&records));
    }
    void TearDown() override {
        Logger::instance().set_sink(std::make_unique<NullSink>());
        Logger::instance().set_filter("");
        Logger::instance().set_level(LogLevel::Warn);
    }

    std::vector<CaptureSink::Entry> records;
};

} // namespace

// ============================================================================
// Line Formatting
// ============================================================================

TEST(LogFormatTest, TextLineContainsLevelModuleAndMessage) {
    auto line = format_text_line(make_record(LogLevel::Warn, "zip", "bad entry"), false);
    EXPECT_NE(line.find("WARN "), std::string::npos);
    EXPECT_NE(line.find("[zip] bad entry"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(LogFormatTest, JsonLineEscapesMessage) {
    auto line = format_json_line(make_record(LogLevel::Error, "mcp", "say \"hi\"\nnow"));
    EXPECT_NE(line.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(line.find("\"module\":\"mcp\""), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"say \"hi\"\nnow")"), std::string::npos);
    EXPECT_EQ(line.substr(0, 6), "{\"ts\":");
}

TEST(LogLevelHelpersTest, LevelNameRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
}

TEST(LogLevelHelpersTest, ParseUnknownDefaultsToInfo) {
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(parse_level(""), LogLevel::Info);
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() /
               ("apidiff_log_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log");
        std::error_code ec;
        fs::remove(path, ec);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    auto read_file() -> std::string {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    fs::path path;
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(path.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "registry", "resolved ExamplePkg 1.0.0"));
        sink.flush();
    }
    auto content = read_file();
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[registry] resolved ExamplePkg 1.0.0"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(path.string(), false);
        sink.write(make_record(LogLevel::Info, "a", "first"));
    }
    {
        FileSink sink(path.string(), true);
        sink.write(make_record(LogLevel::Info, "a", "second"));
    }
    auto content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatWritesOneObjectPerLine) {
    {
        FileSink sink(path.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Debug, "diff", "one"));
        sink.write(make_record(LogLevel::Debug, "diff", "two"));
    }
    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
        ++count;
    }
    EXPECT_EQ(count, 2);
}

TEST(MultiSinkTest, FansOutToAllChildren) {
    std::vector<CaptureSink::Entry> first;
    std::vector<CaptureSink::Entry> second;
    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(&first));
    multi.add(std::make_unique<CaptureSink>(&second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Warn, "zip", "hello"));
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].message, "hello");
}

// ============================================================================
// Global Logger Filtering
// ============================================================================

TEST_F(GlobalLoggerTest, DebugHiddenAtInfoLevel) {
    Logger::instance().set_level(LogLevel::Info);
    APIDIFF_LOG_DEBUG("diff", "hidden");
    APIDIFF_LOG_INFO("diff", "shown " << 42);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown 42");
    EXPECT_EQ(records[0].module, "diff");
}

TEST_F(GlobalLoggerTest, AllHiddenAtOff) {
    Logger::instance().set_level(LogLevel::Off);
    APIDIFF_LOG_ERROR("diff", "x");
    APIDIFF_LOG_FATAL("diff", "y");
    EXPECT_TRUE(records.empty());
}

TEST_F(GlobalLoggerTest, ModuleFilterLowersOneModule) {
    Logger::instance().set_level(LogLevel::Warn);
    Logger::instance().set_filter("metadata=trace,*=warn");

    APIDIFF_LOG_TRACE("metadata", "row");
    APIDIFF_LOG_INFO("surface", "skipped");
    APIDIFF_LOG_WARN("surface", "kept");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].module, "metadata");
    EXPECT_EQ(records[1].message, "kept");
}

TEST_F(GlobalLoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    Logger::instance().set_level(LogLevel::Info);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                APIDIFF_LOG_INFO("inspector", "thread " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(records.size(), 200u);
}

// ============================================================================
// CLI Option Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("APIDIFF_LOG");
    }
    void TearDown() override {
        unsetenv("APIDIFF_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "apidiff");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"diff", "ExamplePkg", "1.0.0", "2.0.0"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=zip=debug", "--log-file=/tmp/x.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "zip=debug");
    EXPECT_EQ(config.log_file, "/tmp/x.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("APIDIFF_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("APIDIFF_LOG", "metadata=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "metadata=trace,*=warn");

    // CLI flags take precedence
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionRecognitionTest, RecognizesOnlyLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--json"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("-"));
}
