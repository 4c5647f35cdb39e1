#include "utils.hpp"

#include <cstdio>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace testviz::cli {

auto find_named(const std::vector<std::string>& args, const std::string& key)
    -> Result<std::vector<std::string>, ArgError> {
    const std::string prefix = key + "=";
    std::vector<std::string> values;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.starts_with(prefix)) {
            values.push_back(arg.substr(prefix.size()));
            continue;
        }
        if (arg != key)
            continue;

        if (i + 1 >= args.size()) {
            return ArgError{ArgError::Kind::MissingValue, "no value found for arg '" + key + "'"};
        }
        values.push_back(args[++i]);
    }

    if (values.empty()) {
        return ArgError{ArgError::Kind::NotFound, "arg '" + key + "' not found"};
    }
    return values;
}

auto is_stdout_terminal() -> bool {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

void print_usage() {
    std::cout << "testviz " << VERSION << " - .NET xUnit test result visualizer\n\n";
    std::cout << "Usage: testviz --logFile <path> [--logFile <path> ...] [options]\n\n";
    std::cout << "Input:\n";
    std::cout << "  --logFile <path>         xUnit v2+ XML results file (repeatable)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config=<path>          Configuration file (default: ./testviz.toml)\n";
    std::cout << "  --threshold-fast=<s>     Max seconds for the fast badge\n";
    std::cout << "  --threshold-normal=<s>   Max seconds for the normal badge\n";
    std::cout << "  --color=<mode>           auto, always or never\n";
    std::cout << "  --no-color               Same as --color=never\n";
    std::cout << "  --help, -h               Show this help\n";
    std::cout << "  --version, -V            Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  --log-level=<level>      trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<filter>    Per-module levels, e.g. xunit=debug,*=warn\n";
    std::cout << "  --log-file=<path>        Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>       text or json\n";
    std::cout << "  -v, -vv, -vvv            Info, debug, trace\n";
    std::cout << "  -q, --quiet              Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  TESTVIZ_LOG              Log level or filter when no log flag is given\n";
}

void print_version() {
    std::cout << "testviz " << VERSION << "\n";
}

} // namespace testviz::cli
