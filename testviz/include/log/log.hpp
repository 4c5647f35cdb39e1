//! # testviz Logging
//!
//! Leveled, module-tagged diagnostics for testviz. The report itself is
//! written to stdout by the printer; everything that explains *how* the
//! report was produced (files opened, assemblies decoded, configuration
//! resolved, failures) goes through this logger to stderr.
//!
//! | Module   | Messages                                         |
//! |----------|--------------------------------------------------|
//! | `cli`    | arguments, files processed, load failures        |
//! | `config` | configuration file, overrides, unknown keys      |
//! | `xunit`  | decoding, assemblies and tests read              |
//! | `names`  | name decoding details                            |
//!
//! The default level is Warn, so a normal run prints only the report.
//!
//! ```cpp
//! TESTVIZ_LOG_INFO("xunit", "Decoded " << run.assemblies.size() << " assemblies");
//! TESTVIZ_LOG_WARN("config", "Ignoring unknown key '" << key << "'");
//! ```

#ifndef TESTVIZ_LOG_HPP
#define TESTVIZ_LOG_HPP

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace testviz::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Upper-case name of a level ("DEBUG").
auto level_name(LogLevel level) -> const char*;

/// Case-insensitive level name; anything unrecognized maps to Info.
auto parse_level(std::string_view name) -> LogLevel;

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

/// Text line without trailing newline. `colored` wraps the level name in
/// an ANSI color sequence.
auto format_text(const LogRecord& record, bool colored) -> std::string;

/// Single-line JSON object without trailing newline.
auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes records to a stream, stderr by default. Colors are only used when
/// requested and the stream is stderr on a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    ConsoleSink(std::ostream& out, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    bool colors_enabled() const {
        return colors_enabled_;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Writes records to a file given with `--log-file=`. Flushes on Error and
/// Fatal so a crash keeps the last diagnostics.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module levels from a specification like "xunit=trace,config=debug,*=warn".
/// A bare module name enables it at Trace; `*` sets the default.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty = level only
    std::string log_file;    ///< Empty = no file sink
    bool console = true;     ///< stderr sink
    bool colors = true;      ///< Off with `--no-color` or `--color=never`
};

/// Process-wide logger. Starts with a Warn-level console sink;
/// `Logger::init()` replaces sinks, level and filter.
class Logger {
public:
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// True for the flags parse_log_options() consumes.
auto is_log_option(std::string_view arg) -> bool;

/// --log-level=, --log-filter=, --log-file=, --log-format=, -v/-vv/-vvv, -q,
/// with TESTVIZ_LOG as fallback. `--no-color` and `--color=never` also turn
/// off log colors.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 6=Off. Calls below this level compile to nothing.
#ifndef TESTVIZ_MIN_LOG_LEVEL
#define TESTVIZ_MIN_LOG_LEVEL 0
#endif

#define TESTVIZ_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= TESTVIZ_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::testviz::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str());                                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TESTVIZ_LOG_TRACE(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Trace, module, msg)
#define TESTVIZ_LOG_DEBUG(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Debug, module, msg)
#define TESTVIZ_LOG_INFO(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Info, module, msg)
#define TESTVIZ_LOG_WARN(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Warn, module, msg)
#define TESTVIZ_LOG_ERROR(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Error, module, msg)
#define TESTVIZ_LOG_FATAL(module, msg) TESTVIZ_LOG_IMPL(::testviz::log::LogLevel::Fatal, module, msg)

} // namespace testviz::log

#endif // TESTVIZ_LOG_HPP
