//! # Configuration Loading
//!
//! Line-oriented reader for the TOML subset used by `wrapgen.toml`:
//! `[section]` and `[[object]]` headers, `key = value` pairs with quoted
//! strings or bare booleans, and `#` comments.

#include "config/config.hpp"

#include <fstream>
#include <sstream>

namespace wrapgen::config {

namespace {

enum class Section { None, Options, Log, Object, Unknown };

std::string_view trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Strips surrounding quotes from a string value, or a trailing comment from
/// a bare value. Sets `quoted` accordingly.
std::string_view unquote(std::string_view raw, bool& quoted) {
    quoted = false;
    if (!raw.empty() && raw.front() == '"') {
        size_t close = raw.find('"', 1);
        if (close != std::string_view::npos) {
            quoted = true;
            return raw.substr(1, close - 1);
        }
        return raw;
    }
    size_t hash = raw.find('#');
    if (hash != std::string_view::npos) {
        raw = raw.substr(0, hash);
    }
    return trim(raw);
}

std::string at_line(int line) {
    return "line " + std::to_string(line) + ": ";
}

Result<bool> parse_bool(std::string_view key, std::string_view value, bool quoted, int line) {
    if (!quoted && value == "true")
        return true;
    if (!quoted && value == "false")
        return false;
    return at_line(line) + "expected boolean for '" + std::string(key) + "', found '" +
           std::string(value) + "'";
}

/// Applies one `[options]` key. Returns an error message or an empty string.
std::string apply_option(Config& config, std::string_view key, std::string_view value, bool quoted,
                         int line) {
    if (key == "min_cfg_version") {
        auto version = Version::parse(value);
        if (is_err(version)) {
            return at_line(line) + unwrap_err(version);
        }
        config.min_cfg_version = unwrap(version);
    } else if (key == "trust_return_value_nullability" || key == "generate_display_trait") {
        auto flag = parse_bool(key, value, quoted, line);
        if (is_err(flag)) {
            return unwrap_err(flag);
        }
        if (key == "trust_return_value_nullability") {
            config.trust_return_value_nullability = unwrap(flag);
        } else {
            config.generate_display_trait = unwrap(flag);
        }
    } else {
        WRAPGEN_LOG_WARN("config", "unknown key 'options." << key << "' at line " << line);
    }
    return {};
}

std::string apply_log(log::LogConfig& log_config, std::string_view key, std::string_view value,
                      bool quoted, int line) {
    if (key == "level") {
        auto level = log::parse_level(value);
        if (!level) {
            return at_line(line) + "unknown log level '" + std::string(value) + "'";
        }
        log_config.level = *level;
    } else if (key == "filter") {
        auto filter = log::LogFilter::parse(value, log_config.level);
        if (is_err(filter)) {
            return at_line(line) + unwrap_err(filter);
        }
        log_config.filter_spec = std::string(value);
    } else if (key == "file") {
        log_config.log_file = std::string(value);
    } else if (key == "format") {
        if (value == "json") {
            log_config.format = log::LogFormat::JSON;
        } else if (value == "text") {
            log_config.format = log::LogFormat::Text;
        } else {
            return at_line(line) + "unknown log format '" + std::string(value) + "'";
        }
    } else if (key == "console" || key == "colors") {
        auto flag = parse_bool(key, value, quoted, line);
        if (is_err(flag)) {
            return unwrap_err(flag);
        }
        (key == "console" ? log_config.console : log_config.colors) = unwrap(flag);
    } else {
        WRAPGEN_LOG_WARN("config", "unknown key 'log." << key << "' at line " << line);
    }
    return {};
}

std::string apply_object(ObjectOverride& object, std::string_view key, std::string_view value,
                         bool quoted, int line) {
    if (key == "name") {
        object.name = std::string(value);
    } else if (key == "trust_return_value_nullability" || key == "generate_display_trait") {
        auto flag = parse_bool(key, value, quoted, line);
        if (is_err(flag)) {
            return unwrap_err(flag);
        }
        if (key == "trust_return_value_nullability") {
            object.trust_return_value_nullability = unwrap(flag);
        } else {
            object.generate_display_trait = unwrap(flag);
        }
    } else {
        WRAPGEN_LOG_WARN("config", "unknown key 'object." << key << "' at line " << line);
    }
    return {};
}

} // namespace

// ============================================================================
// Config
// ============================================================================

auto Config::object(std::string_view name) const -> ObjectConfig {
    ObjectConfig resolved;
    resolved.name = std::string(name);
    resolved.trust_return_value_nullability = trust_return_value_nullability;
    resolved.generate_display_trait = generate_display_trait;

    for (const auto& entry : objects) {
        if (entry.name != name)
            continue;
        if (entry.trust_return_value_nullability) {
            resolved.trust_return_value_nullability = *entry.trust_return_value_nullability;
        }
        if (entry.generate_display_trait) {
            resolved.generate_display_trait = *entry.generate_display_trait;
        }
        break;
    }
    return resolved;
}

auto Config::filter_version(std::optional<Version> version) const -> std::optional<Version> {
    if (version && min_cfg_version && *version <= *min_cfg_version) {
        return std::nullopt;
    }
    return version;
}

// ============================================================================
// Parsing
// ============================================================================

auto parse_config(std::string_view content) -> Result<Config> {
    Config config;
    Section section = Section::None;
    int object_line = 0;
    int line_no = 0;

    auto finish_object = [&]() -> std::string {
        if (section == Section::Object && config.objects.back().name.empty()) {
            return at_line(object_line) + "[[object]] without a name";
        }
        return {};
    };

    std::istringstream stream{std::string(content)};
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        ++line_no;
        auto line = trim(raw_line);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            auto err = finish_object();
            if (!err.empty())
                return err;

            auto header = trim(line.substr(0, line.find('#')));
            if (header == "[options]") {
                section = Section::Options;
            } else if (header == "[log]") {
                section = Section::Log;
            } else if (header == "[[object]]") {
                section = Section::Object;
                object_line = line_no;
                config.objects.emplace_back();
            } else {
                WRAPGEN_LOG_WARN("config", "ignoring unknown section " << header << " at line "
                                                                      << line_no);
                section = Section::Unknown;
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            return at_line(line_no) + "expected 'key = value'";
        }
        auto key = trim(line.substr(0, eq));
        bool quoted = false;
        auto value = unquote(trim(line.substr(eq + 1)), quoted);

        std::string err;
        switch (section) {
        case Section::Options:
            err = apply_option(config, key, value, quoted, line_no);
            break;
        case Section::Log:
            err = apply_log(config.log, key, value, quoted, line_no);
            break;
        case Section::Object:
            err = apply_object(config.objects.back(), key, value, quoted, line_no);
            break;
        case Section::None:
            return at_line(line_no) + "key '" + std::string(key) + "' outside of any section";
        case Section::Unknown:
            break;
        }
        if (!err.empty())
            return err;
    }

    auto err = finish_object();
    if (!err.empty())
        return err;

    WRAPGEN_LOG_DEBUG("config", "loaded " << config.objects.size() << " object entries");
    return config;
}

auto load_config(const fs::path& path) -> Result<Config> {
    std::ifstream file(path);
    if (!file) {
        return "cannot read configuration file '" + path.string() + "'";
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str());
    if (is_err(result)) {
        return "invalid configuration file '" + path.string() + "': " + unwrap_err(result);
    }
    return result;
}

void init_logging(const Config& config) {
    log::Logger::init(config.log);
}

} // namespace wrapgen::config
