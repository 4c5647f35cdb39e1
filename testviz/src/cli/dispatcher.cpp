//! # CLI Dispatcher
//!
//! ```text
//! testviz_main()
//!   ├─ logging flags     → Logger::init()
//!   ├─ --help, -h        → print_usage()
//!   ├─ --version, -V     → print_version()
//!   ├─ configuration     → resolve_config()
//!   └─ --logFile ...     → render_log_files()
//!                            └─ per file: load_file() → print_test_run()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                              |
//! |------|------------------------------------------------------|
//! | 0    | All files rendered, or no `--logFile` given at all   |
//! | 1    | A file failed to load, or bad arguments/configuration|
//!
//! Failing tests inside a file do not change the exit code.

#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"
#include "xunit/reader.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace testviz::cli {

auto render_log_files(std::ostream& out, const std::vector<std::string>& files,
                      const Configuration& config, const PrintOptions& options) -> int {
    ColorOutput c(options.use_color);
    int failed = 0;

    for (const auto& file : files) {
        try {
            auto loaded = xunit::load_file(file, config.naming);
            if (is_err(loaded)) {
                const auto& error = unwrap_err(loaded);
                TESTVIZ_LOG_ERROR("cli", file << ": " << error.to_string());
                print_load_failure(out, file + ": " + error.to_string(), c);
                ++failed;
                continue;
            }
            print_test_run(out, file, unwrap(loaded), options);
        } catch (const std::exception& e) {
            TESTVIZ_LOG_ERROR("cli", "Unexpected error while processing " << file << ": "
                                                                          << e.what());
            print_load_failure(out, file + ": " + e.what(), c);
            ++failed;
        }
    }

    return failed;
}

/// Returns true for arguments testviz_main() understands.
static auto is_known_option(const std::string& arg) -> bool {
    static const char* const PREFIXES[] = {"--logFile=", "--config=", "--threshold-fast=",
                                           "--threshold-normal=", "--color="};
    for (const char* prefix : PREFIXES) {
        if (arg.starts_with(prefix))
            return true;
    }
    return arg == "--logFile" || arg == "--no-color" || log::is_log_option(arg);
}

static void warn_unknown_arguments(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--logFile") {
            ++i; // its value
            continue;
        }
        if (!is_known_option(args[i])) {
            TESTVIZ_LOG_WARN("cli", "Ignoring unknown argument '" << args[i] << "'");
        }
    }
}

} // namespace testviz::cli

using namespace testviz;
using namespace testviz::cli;

/// Main entry point for the testviz CLI.
int testviz_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            print_version();
            return 0;
        }
    }

    warn_unknown_arguments(args);

    auto resolved = resolve_config(args);
    if (is_err(resolved)) {
        std::cerr << "error: " << unwrap_err(resolved).to_string() << "\n";
        return 1;
    }
    const Configuration& config = unwrap(resolved);

    PrintOptions options;
    options.threshold_fast = config.threshold_fast;
    options.threshold_normal = config.threshold_normal;
    options.use_color = use_colors(config.color, is_stdout_terminal());
    ColorOutput c(options.use_color);

    print_banner(std::cout);

    auto files = find_named(args, "--logFile");
    if (is_err(files)) {
        const auto& error = unwrap_err(files);
        if (error.kind == ArgError::Kind::MissingValue) {
            std::cerr << "error: " << error.message << "\n";
            std::cerr << "Usage: testviz --logFile <path> [--logFile <path> ...]\n";
            return 1;
        }
        print_missing_log_files(std::cout, c);
        return 0;
    }

    const auto& paths = unwrap(files);
    TESTVIZ_LOG_INFO("cli", "Processing " << paths.size() << " results file(s)");

    int failed = render_log_files(std::cout, paths, config, options);
    std::cout.flush();
    log::Logger::instance().flush();

    return failed > 0 ? 1 : 0;
}
