//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, FileSink I/O, and the messages the
//! analysis passes emit through the global logger.

#include "analysis/special_functions.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace wrapgen;
using namespace wrapgen::log;
namespace fs = std::filesystem;

namespace {

LogRecord make_record(LogLevel level, std::string_view module, const std::string& message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.timestamp_ms = 1234567890;
    return record;
}

LogFilter parse_filter(std::string_view spec, LogLevel fallback = LogLevel::Info) {
    auto filter = LogFilter::parse(spec, fallback);
    EXPECT_TRUE(is_ok(filter)) << spec;
    return is_ok(filter) ? unwrap(filter) : LogFilter(fallback);
}

/// Sink that copies records into a vector owned by the test.
class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::shared_ptr<std::vector<Entry>> records)
        : records_(std::move(records)) {}

    void write(const LogRecord& record) override {
        records_->push_back({record.level, std::string(record.module), record.message});
    }

private:
    std::shared_ptr<std::vector<Entry>> records_;
};

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

TEST(LogFilterTest, ParseModuleAndDefault) {
    auto filter = parse_filter("analysis=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "analysis"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "analysis"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "config"));
}

TEST(LogFilterTest, BareModuleEnablesTrace) {
    auto filter = parse_filter("analysis");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "analysis"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "config"));
}

TEST(LogFilterTest, ModuleOff) {
    auto filter = parse_filter("config=off,*=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "analysis"));
}

TEST(LogFilterTest, EmptySpecKeepsFallback) {
    auto filter = parse_filter("", LogLevel::Error);

    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "analysis"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "analysis"));
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST(LogFilterTest, MinLevel) {
    EXPECT_EQ(parse_filter("analysis=trace,*=error").min_level(), LogLevel::Trace);
    EXPECT_EQ(parse_filter("*=error", LogLevel::Trace).min_level(), LogLevel::Error);
}

TEST(LogFilterTest, RejectsUnknownLevel) {
    auto filter = LogFilter::parse("analysis=loud", LogLevel::Info);
    ASSERT_TRUE(is_err(filter));
    EXPECT_NE(unwrap_err(filter).find("analysis=loud"), std::string::npos);

    EXPECT_TRUE(is_err(LogFilter::parse("=debug", LogLevel::Info)));
}

TEST(LogLevelTest, NamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_FALSE(parse_level("verbose").has_value());
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    auto line = format_text(make_record(LogLevel::Warn, "config", "unknown key"), false);

    EXPECT_NE(line.find("warn  [config] unknown key"), std::string::npos);
    EXPECT_NE(line.find(".890 "), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find("\033["), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesSpecialCharacters) {
    auto line = format_json(make_record(LogLevel::Error, "analysis", "a\nb\t\"c\"\\"));

    EXPECT_NE(line.find("{\"ts\":1234567890,"), std::string::npos);
    EXPECT_NE(line.find("\"level\":\"error\""), std::string::npos);
    EXPECT_NE(line.find("\"module\":\"analysis\""), std::string::npos);
    EXPECT_NE(line.find("a\\nb\\t\\\"c\\\"\\\\"), std::string::npos);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_file = fs::temp_directory_path() / (std::string("wrapgen_log_") + test->name());
        fs::remove(temp_file);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(temp_file, ec);
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesAndAppends) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "analysis", "first"));
    }
    {
        FileSink sink(temp_file.string(), LogFormat::JSON, true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "config", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("[analysis] first"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

TEST_F(FileSinkTest, TruncateReplacesContent) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text);
        sink.write(make_record(LogLevel::Info, "analysis", "old"));
    }
    {
        FileSink sink(temp_file.string(), LogFormat::Text, false);
        sink.write(make_record(LogLevel::Info, "analysis", "new"));
    }

    std::string content = read_file(temp_file);
    EXPECT_EQ(content.find("old"), std::string::npos);
    EXPECT_NE(content.find("new"), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::vector<CaptureSink::Entry>> records_ =
        std::make_shared<std::vector<CaptureSink::Entry>>();

    void install(const LogConfig& base) {
        LogConfig config = base;
        config.console = false;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(records_));
    }

    void TearDown() override {
        LogConfig quiet;
        quiet.console = false;
        Logger::init(quiet);
    }
};

TEST_F(LoggerTest, LevelGatesMacros) {
    LogConfig config;
    config.level = LogLevel::Info;
    install(config);

    WRAPGEN_LOG_DEBUG("analysis", "hidden " << 1);
    WRAPGEN_LOG_INFO("analysis", "shown " << 2);

    ASSERT_EQ(records_->size(), 1u);
    EXPECT_EQ((*records_)[0].message, "shown 2");
    EXPECT_EQ((*records_)[0].module, "analysis");
    EXPECT_EQ((*records_)[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, FilterOverridesGlobalLevel) {
    LogConfig config;
    config.level = LogLevel::Warn;
    config.filter_spec = "analysis=trace";
    install(config);

    WRAPGEN_LOG_TRACE("analysis", "detail");
    WRAPGEN_LOG_INFO("config", "dropped");
    WRAPGEN_LOG_WARN("config", "kept");

    ASSERT_EQ(records_->size(), 2u);
    EXPECT_EQ((*records_)[0].message, "detail");
    EXPECT_EQ((*records_)[1].message, "kept");
}

TEST_F(LoggerTest, InvalidFilterFallsBackToLevel) {
    LogConfig config;
    config.level = LogLevel::Warn;
    config.filter_spec = "analysis=chatty";
    install(config);

    WRAPGEN_LOG_TRACE("analysis", "dropped");
    WRAPGEN_LOG_WARN("analysis", "kept");

    ASSERT_EQ(records_->size(), 1u);
    EXPECT_EQ((*records_)[0].message, "kept");
}

TEST_F(LoggerTest, ConcurrentWritersKeepEveryRecord) {
    LogConfig config;
    config.level = LogLevel::Info;
    install(config);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i) {
                WRAPGEN_LOG_INFO("analysis", "thread " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(records_->size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, ClassifierTracesDecisions) {
    LogConfig config;
    config.filter_spec = "analysis=trace";
    install(config);

    analysis::Function copy;
    copy.name = "copy";
    copy.symbol = "foo_copy";
    copy.parameters.push_back({"self", library::ValueType::Pointer, true});
    std::vector<analysis::Function> functions = {copy};

    auto infos = analysis::specials::extract(functions, library::TypeKind::Record, {});

    EXPECT_TRUE(infos.has_trait(analysis::specials::Kind::Clone));
    bool found = false;
    for (const auto& entry : *records_) {
        if (entry.module == "analysis" && entry.message == "classified foo_copy as clone") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}
