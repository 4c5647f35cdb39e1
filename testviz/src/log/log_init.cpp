//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the TESTVIZ_LOG
//! environment variable into a LogConfig.
//!
//! ## Options
//!
//! | Option                  | Effect                              |
//! |-------------------------|-------------------------------------|
//! | `--log-level=<level>`   | Global minimum level                |
//! | `--log-filter=<spec>`   | Per-module levels                   |
//! | `--log-file=<path>`     | Also write diagnostics to a file    |
//! | `--log-format=json`     | JSON lines instead of text          |
//! | `-v`, `-vv`, `-vvv`     | Info, Debug, Trace                  |
//! | `-q`, `--quiet`         | Errors only                         |
//!
//! `--no-color` and `--color=never` belong to the report, but they also keep
//! ANSI codes out of the diagnostics.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace testviz::log {

static bool is_verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return false;
    }
    return true;
}

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || is_verbosity_flag(arg);
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "--no-color" || arg == "--color=never") {
            config.colors = false;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (is_verbosity_flag(arg)) {
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count) {
                v_count = count;
            }
        }
    }

    // -v/-vv/-vvv only apply without an explicit --log-level
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        std::string env_str;
#ifdef _WIN32
        char* env_buf = nullptr;
        size_t env_len = 0;
        if (_dupenv_s(&env_buf, &env_len, "TESTVIZ_LOG") == 0 && env_buf) {
            env_str = env_buf;
            free(env_buf);
        }
#else
        const char* env_log = std::getenv("TESTVIZ_LOG");
        if (env_log) {
            env_str = env_log;
        }
#endif
        if (!env_str.empty()) {
            // "xunit=debug" or "xunit,config" is a filter, anything else a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace testviz::log
