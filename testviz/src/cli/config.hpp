//! # Configuration
//!
//! Settings of a testviz run, resolved in this order (later wins):
//!
//! 1. Built-in defaults
//! 2. `--config=<path>`, or `testviz.toml` in the working directory
//! 3. Command-line overrides
//!
//! ## testviz.toml
//!
//! ```toml
//! [thresholds]
//! fast = 0.05        # seconds, 🚀 up to here
//! normal = 0.1       # seconds, 🕐 up to here, 🐌 above
//!
//! [names]
//! no_split = ["HostBuilder", "DBSyncer", "DbSynchronizer"]
//! no_transform = ["DbSynchronizer", "DBSyncer"]
//!
//! [output]
//! color = "auto"     # auto | always | never
//! ```
//!
//! `SimpleTomlParser` handles the subset of TOML this file needs: sections,
//! bare keys, strings, numbers, booleans, string arrays and `#` comments.

#pragma once

#include "common.hpp"
#include "names/naming_options.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace testviz::cli {

/// When the printer emits ANSI colors.
enum class ColorMode { Auto, Always, Never };

/// Parses "auto", "always" or "never".
[[nodiscard]] auto parse_color_mode(std::string_view text) -> std::optional<ColorMode>;

[[nodiscard]] auto color_mode_name(ColorMode mode) -> const char*;

/// Resolved settings of a run.
struct Configuration {
    double threshold_fast = 0.05;
    double threshold_normal = 0.1;
    names::NamingOptions naming = names::NamingOptions::defaults();
    ColorMode color = ColorMode::Auto;

    /// Path of the file the settings came from, empty for defaults only.
    std::string source;
};

/// A configuration file or flag that could not be used.
struct ConfigError {
    std::string message;
    int line = 0; ///< Line in the configuration file, 0 when not file related

    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// TOML Subset
// ============================================================================

using TomlValue = std::variant<std::string, double, bool, std::vector<std::string>>;

/// Keys of one section.
using TomlTable = std::map<std::string, TomlValue>;

/// Sections by name; keys before the first header live under "".
using TomlDocument = std::map<std::string, TomlTable>;

/// Parses the TOML subset used by `testviz.toml`.
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(std::string content);

    /// Parses the whole content.
    [[nodiscard]] auto parse() -> Result<TomlDocument, ConfigError>;

private:
    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;
    std::optional<ConfigError> error_;

    [[nodiscard]] auto is_eof() const -> bool {
        return pos_ >= content_.size();
    }
    [[nodiscard]] auto peek() const -> char {
        return is_eof() ? '\0' : content_[pos_];
    }
    auto advance() -> char;

    void fail(const std::string& message);

    /// Skips spaces and tabs on the current line.
    void skip_blanks();
    /// Skips blanks, comments and line breaks.
    void skip_whitespace();
    void skip_comment();

    /// Requires the rest of the line to be blank or a comment.
    auto expect_line_end() -> bool;

    [[nodiscard]] auto parse_identifier() -> std::string;
    [[nodiscard]] auto parse_value() -> std::optional<TomlValue>;
    [[nodiscard]] auto parse_string() -> std::optional<std::string>;
    [[nodiscard]] auto parse_number() -> std::optional<double>;
    [[nodiscard]] auto parse_boolean() -> std::optional<bool>;
    [[nodiscard]] auto parse_string_array() -> std::optional<std::vector<std::string>>;
};

// ============================================================================
// Loading
// ============================================================================

/// File picked up when no `--config` is given.
constexpr const char* DEFAULT_CONFIG_FILE = "testviz.toml";

/// Applies a parsed document on top of `base`. Unknown keys are ignored
/// with a warning; keys with the wrong type are errors.
[[nodiscard]] auto apply_toml(const TomlDocument& document, Configuration base)
    -> Result<Configuration, ConfigError>;

/// Reads and applies the configuration file at `path` on top of the defaults.
[[nodiscard]] auto load_config(const std::string& path) -> Result<Configuration, ConfigError>;

/// Applies `--threshold-fast=`, `--threshold-normal=`, `--color=` and
/// `--no-color` from `args`.
[[nodiscard]] auto apply_overrides(Configuration& config, const std::vector<std::string>& args)
    -> std::optional<ConfigError>;

/// Checks that thresholds are finite, non-negative and `fast <= normal`.
[[nodiscard]] auto validate(const Configuration& config) -> std::optional<ConfigError>;

/// Defaults, then the configuration file, then `args`; validated.
[[nodiscard]] auto resolve_config(const std::vector<std::string>& args)
    -> Result<Configuration, ConfigError>;

/// True if a run with `mode` should emit colors on a stream that is
/// (`is_terminal`) or is not a terminal.
[[nodiscard]] auto use_colors(ColorMode mode, bool is_terminal) -> bool;

} // namespace testviz::cli
