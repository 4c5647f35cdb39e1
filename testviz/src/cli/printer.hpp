//! # Report Printer
//!
//! Renders a `TestRun` for the terminal.
//!
//! ## Output Format
//!
//! ```text
//! Input source:         TestResults/results.xml
//! Amount of assemblies: 1
//! Computer:             BUILD-01
//!
//!   Assembly:         App.Tests.dll - ✓ Passed (3 of 3 passed).
//!   Date / time:      2023-07-19 18:41:02
//!   Total time:       0.172 seconds.
//!
//!   # tests:          3
//!   ...
//!
//!   🚀 ✓ Test method (0.002 seconds)
//!
//!   Test class
//!      🐌 ✓ Result (0.12 seconds)
//! ```
//!
//! ## Badges
//!
//! | Badge | Duration               |
//! |-------|------------------------|
//! | 🚀    | `<= threshold_fast`    |
//! | 🕐    | `<= threshold_normal`  |
//! | 🐌    | slower                 |

#pragma once

#include "xunit/test_run.hpp"

#include <ostream>
#include <string>

namespace testviz::cli {

namespace colors {
inline const char* reset = "\033[0m";
inline const char* bold = "\033[1m";
inline const char* dim = "\033[2m";
inline const char* red = "\033[31m";
inline const char* green = "\033[32m";
inline const char* yellow = "\033[33m";
} // namespace colors

/// Yields ANSI sequences only when enabled.
struct ColorOutput {
    bool enabled;

    explicit ColorOutput(bool use_color) : enabled(use_color) {}

    const char* reset() const {
        return enabled ? colors::reset : "";
    }
    const char* bold() const {
        return enabled ? colors::bold : "";
    }
    const char* dim() const {
        return enabled ? colors::dim : "";
    }
    const char* red() const {
        return enabled ? colors::red : "";
    }
    const char* green() const {
        return enabled ? colors::green : "";
    }
    const char* yellow() const {
        return enabled ? colors::yellow : "";
    }
};

struct PrintOptions {
    double threshold_fast = 0.05;
    double threshold_normal = 0.1;
    bool use_color = false;
};

/// Speed badge for a test that took `seconds`.
[[nodiscard]] auto timing_badge(double seconds, double threshold_fast, double threshold_normal)
    -> const char*;

/// Colored ✓ (Pass), ○ (Skip) or ⛌ (anything else).
[[nodiscard]] auto status_glyph(const xunit::TestCase& test, const ColorOutput& c) -> std::string;

/// Seconds in their shortest form ("0.05", "1.5", "2").
[[nodiscard]] auto format_seconds(double seconds) -> std::string;

/// Group path and test name joined with " › ".
[[nodiscard]] auto qualified_test_name(const xunit::TestCase& test) -> std::string;

/// The ASCII-art title.
void print_banner(std::ostream& out);

/// Explains the `--logFile` argument when none was given.
void print_missing_log_files(std::ostream& out, const ColorOutput& c);

/// "Failed - <reason>" for a file that could not be loaded.
void print_load_failure(std::ostream& out, const std::string& reason, const ColorOutput& c);

/// Prints the report of one results file.
void print_test_run(std::ostream& out, const std::string& source, const xunit::TestRun& run,
                    const PrintOptions& options);

/// Prints one assembly with its test tree, failures and errors.
void print_assembly(std::ostream& out, const xunit::Assembly& assembly,
                    const PrintOptions& options);

} // namespace testviz::cli
