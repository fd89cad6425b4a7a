//! # wrapgen Logging
//!
//! Leveled messages tagged with the component that emitted them. The
//! generator uses two tags: `"analysis"` for classification decisions and
//! `"config"` for configuration loading.
//!
//! Records go to stderr, to a file, or both, as text or JSON lines. A
//! filter string such as `analysis=trace,*=warn` sets the threshold per tag.
//!
//! ```cpp
//! WRAPGEN_LOG_TRACE("analysis", "classified " << symbol << " as clone");
//! ```

#ifndef WRAPGEN_LOG_HPP
#define WRAPGEN_LOG_HPP

#include "common.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wrapgen::log {

/// Severity, least to most severe. `Off` only appears as a threshold.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Fatal, Off };

/// Lowercase level name ("trace", ..., "off").
const char* level_name(LogLevel level);

/// Inverse of level_name. Upper case is accepted too.
std::optional<LogLevel> parse_level(std::string_view name);

enum class LogFormat { Text, JSON };

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
    int64_t timestamp_ms = 0; ///< Unix time
};

/// `HH:MM:SS.mmm level [module] message`, one line.
std::string format_text(const LogRecord& record, bool colors);

/// `{"ts":..,"level":..,"module":..,"msg":..}`, one line.
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/// Writes to stderr. Colors are used only when stderr is a color terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool colors);
    void write(const LogRecord& record) override;

private:
    LogFormat format_;
    bool colors_;
};

/// Appends to (or truncates) a file. Error and Fatal records are flushed
/// immediately.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format, bool append = true);
    void write(const LogRecord& record) override;

    bool is_open() const {
        return out_.is_open();
    }

private:
    std::ofstream out_;
    LogFormat format_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds with a fallback for untagged modules.
class LogFilter {
public:
    explicit LogFilter(LogLevel fallback = LogLevel::Info) : fallback_(fallback) {}

    /// Parses `module=level` entries separated by commas. `*=level` replaces
    /// the fallback and a bare module name means `module=trace`.
    static auto parse(std::string_view spec, LogLevel fallback) -> Result<LogFilter>;

    bool should_log(LogLevel level, std::string_view module) const;

    /// Most verbose threshold of any module or the fallback.
    LogLevel min_level() const;

private:
    LogLevel fallback_;
    std::unordered_map<std::string, LogLevel> modules_;
};

// ============================================================================
// Logger
// ============================================================================

/// The `[log]` section of `wrapgen.toml`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty for no file output
    bool console = true;
    bool colors = true;
};

/// Process-wide dispatcher. Before init() it has no sinks and drops
/// everything below Info.
class Logger {
public:
    /// Replaces the threshold, filter and sinks. An invalid filter_spec is
    /// reported on stderr and ignored.
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    void write(LogLevel level, std::string_view module, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);

private:
    Logger() = default;

    LogLevel threshold_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

} // namespace wrapgen::log

// Records below this level (0 = Trace .. 6 = Off) are compiled out.
#ifndef WRAPGEN_MIN_LOG_LEVEL
#define WRAPGEN_MIN_LOG_LEVEL 0
#endif

#define WRAPGEN_LOG(level, module, msg)                                                            \
    do {                                                                                           \
        if (static_cast<int>(level) >= WRAPGEN_MIN_LOG_LEVEL &&                                    \
            ::wrapgen::log::Logger::instance().should_log(level, module)) {                        \
            std::ostringstream wrapgen_log_stream_;                                                \
            wrapgen_log_stream_ << msg;                                                            \
            ::wrapgen::log::Logger::instance().write(level, module, wrapgen_log_stream_.str());    \
        }                                                                                          \
    } while (0)

#define WRAPGEN_LOG_TRACE(module, msg) WRAPGEN_LOG(::wrapgen::log::LogLevel::Trace, module, msg)
#define WRAPGEN_LOG_DEBUG(module, msg) WRAPGEN_LOG(::wrapgen::log::LogLevel::Debug, module, msg)
#define WRAPGEN_LOG_INFO(module, msg) WRAPGEN_LOG(::wrapgen::log::LogLevel::Info, module, msg)
#define WRAPGEN_LOG_WARN(module, msg) WRAPGEN_LOG(::wrapgen::log::LogLevel::Warn, module, msg)

#endif // WRAPGEN_LOG_HPP
