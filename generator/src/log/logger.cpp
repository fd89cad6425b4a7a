//! # Logging Implementation

#include "log/log.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#include <unistd.h>

namespace wrapgen::log {

namespace {

constexpr std::array<const char*, 7> LEVEL_NAMES = {"trace", "debug", "info", "warn",
                                                    "error", "fatal", "off"};

/// ANSI color per level, indexed like LEVEL_NAMES.
constexpr std::array<const char*, 7> LEVEL_COLORS = {
    "\033[90m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[1;31m", ""};

bool stderr_is_color_terminal() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void append_json_string(std::ostringstream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
    out << '"';
}

} // namespace

const char* level_name(LogLevel level) {
    return LEVEL_NAMES[static_cast<size_t>(level)];
}

std::optional<LogLevel> parse_level(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (lower == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_text(const LogRecord& record, bool colors) {
    std::time_t seconds = static_cast<std::time_t>(record.timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << record.timestamp_ms % 1000 << std::setfill(' ') << ' ';
    if (colors) {
        out << LEVEL_COLORS[static_cast<size_t>(record.level)];
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << '\n';
    return out.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream out;
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":";
    append_json_string(out, record.module);
    out << ",\"msg\":";
    append_json_string(out, record.message);
    out << "}\n";
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogFormat format, bool colors)
    : format_(format), colors_(colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << (format_ == LogFormat::JSON ? format_json(record) : format_text(record, colors_));
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : out_(path, append ? std::ios::app : std::ios::trunc), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!out_.is_open()) {
        return;
    }
    out_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record, false));
    if (record.level >= LogLevel::Error) {
        out_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

auto LogFilter::parse(std::string_view spec, LogLevel fallback) -> Result<LogFilter> {
    LogFilter filter(fallback);

    size_t start = 0;
    while (start <= spec.size()) {
        size_t comma = spec.find(',', start);
        auto entry = spec.substr(start, comma == std::string_view::npos ? comma : comma - start);
        start = comma == std::string_view::npos ? spec.size() + 1 : comma + 1;

        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            filter.modules_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        auto module = entry.substr(0, eq);
        auto level = parse_level(entry.substr(eq + 1));
        if (module.empty() || !level) {
            return "invalid log filter entry '" + std::string(entry) + "'";
        }
        if (module == "*") {
            filter.fallback_ = *level;
        } else {
            filter.modules_[std::string(module)] = *level;
        }
    }
    return filter;
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = modules_.find(std::string(module));
    return level >= (it == modules_.end() ? fallback_ : it->second);
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = fallback_;
    for (const auto& [_, level] : modules_) {
        if (level < lowest) {
            lowest = level;
        }
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto filter = LogFilter::parse(config.filter_spec, config.level);
    if (is_err(filter)) {
        std::cerr << "warning: " << unwrap_err(filter) << "\n";
    }

    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        sinks.push_back(std::make_unique<ConsoleSink>(config.format, config.colors));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file '" << config.log_file << "'\n";
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.filter_ = is_ok(filter) ? unwrap(filter) : LogFilter(config.level);
    // Module overrides may be more verbose than the configured level.
    logger.threshold_ = logger.filter_.min_level();
    logger.sinks_ = std::move(sinks);
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_ && !sinks_.empty() && filter_.should_log(level, module);
}

void Logger::write(LogLevel level, std::string_view module, const std::string& message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.timestamp_ms = now_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

} // namespace wrapgen::log
