//! # Generator Configuration
//!
//! Loads generator options and per-type policy from `wrapgen.toml`.
//!
//! ## Configuration File
//!
//! ```toml
//! [options]
//! min_cfg_version = "2.56"
//! trust_return_value_nullability = false
//! generate_display_trait = true
//!
//! [log]
//! level = "warn"
//! filter = "analysis=debug"
//!
//! [[object]]
//! name = "Gtk.Widget"
//! trust_return_value_nullability = true
//! ```
//!
//! `[[object]]` entries are matched by exact type name. Settings an entry
//! leaves out fall back to the `[options]` values.

#ifndef WRAPGEN_CONFIG_HPP
#define WRAPGEN_CONFIG_HPP

#include "common.hpp"
#include "log/log.hpp"
#include "version/version.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wrapgen::config {

namespace fs = std::filesystem;

/// Default configuration file name.
constexpr const char* CONFIG_FILE_NAME = "wrapgen.toml";

/// Resolved policy for one library type.
struct ObjectConfig {
    std::string name;
    /// Trust the manifest's nullability annotation on `to_string` returns.
    bool trust_return_value_nullability = false;
    /// Keep a detected formatting operation.
    bool generate_display_trait = true;
};

/// One `[[object]]` entry. Unset fields inherit from `[options]`.
struct ObjectOverride {
    std::string name;
    std::optional<bool> trust_return_value_nullability;
    std::optional<bool> generate_display_trait;
};

/// Whole-generator configuration.
struct Config {
    /// Library baseline; versions at or below it need no gate.
    std::optional<Version> min_cfg_version;
    bool trust_return_value_nullability = false;
    bool generate_display_trait = true;
    log::LogConfig log;
    std::vector<ObjectOverride> objects;

    /// Policy for the type with the given full name.
    [[nodiscard]] auto object(std::string_view name) const -> ObjectConfig;

    /// Drops versions already guaranteed by `min_cfg_version`.
    [[nodiscard]] auto filter_version(std::optional<Version> version) const
        -> std::optional<Version>;
};

/// Parses configuration text. Errors carry the offending line number.
[[nodiscard]] auto parse_config(std::string_view content) -> Result<Config>;

/// Reads and parses a configuration file.
[[nodiscard]] auto load_config(const fs::path& path) -> Result<Config>;

/// Installs the `[log]` section as the process-wide logger configuration.
/// Until this runs the logger has no sinks.
void init_logging(const Config& config);

} // namespace wrapgen::config

#endif // WRAPGEN_CONFIG_HPP
