#include "printer.hpp"

#include "log/log.hpp"

#include <charconv>
#include <set>
#include <sstream>
#include <vector>

namespace testviz::cli {

// ============================================================================
// Test Lines
// ============================================================================

auto timing_badge(double seconds, double threshold_fast, double threshold_normal)
    -> const char* {
    if (seconds <= threshold_fast)
        return "🚀";
    if (seconds <= threshold_normal)
        return "🕐";
    return "🐌";
}

auto status_glyph(const xunit::TestCase& test, const ColorOutput& c) -> std::string {
    std::ostringstream oss;
    oss << c.bold();
    if (test.passed()) {
        oss << c.green() << "✓";
    } else if (test.skipped()) {
        oss << c.yellow() << "○";
    } else {
        oss << c.red() << "⛌";
    }
    oss << c.reset();
    return oss.str();
}

auto format_seconds(double seconds) -> std::string {
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), seconds);
    if (ec != std::errc()) {
        return "?";
    }
    return std::string(buffer, end);
}

auto qualified_test_name(const xunit::TestCase& test) -> std::string {
    std::string result;
    for (const auto& group : test.path) {
        result += group;
        result += " › ";
    }
    result += test.name;
    return result;
}

static void print_test(std::ostream& out, const std::string& indent, const xunit::TestCase& test,
                       const PrintOptions& options, const ColorOutput& c) {
    out << indent << timing_badge(test.time, options.threshold_fast, options.threshold_normal)
        << " " << status_glyph(test, c) << " " << test.name << " " << c.dim() << "("
        << format_seconds(test.time) << " seconds)" << c.reset() << "\n";
}

static void print_group(std::ostream& out, const xunit::TestGroup& group, const std::string& indent,
                        const PrintOptions& options, const ColorOutput& c) {
    out << indent << "  " << c.bold() << group.name << c.reset() << "\n";

    for (const auto& test : group.tests) {
        print_test(out, indent + "     ", test, options, c);
    }
    if (!group.tests.empty()) {
        out << "\n";
    }

    for (const auto& child : group.groups) {
        print_group(out, child, indent + "  ", options, c);
    }
}

// ============================================================================
// Failures
// ============================================================================

static void collect_failures(const xunit::TestGroup& group, std::set<std::string>& seen,
                             std::vector<const xunit::TestCase*>& failures) {
    for (const auto& test : group.tests) {
        if (!test.failed())
            continue;
        // A test with several traits appears under each of their roots
        std::string key = test.qualified_name + '\n' + test.id;
        if (seen.insert(key).second) {
            failures.push_back(&test);
        }
    }
    for (const auto& child : group.groups) {
        collect_failures(child, seen, failures);
    }
}

static auto first_line(const std::string& text) -> std::string {
    std::string line = text.substr(0, text.find('\n'));
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

static void print_failures(std::ostream& out, const xunit::Assembly& assembly,
                           const ColorOutput& c) {
    std::set<std::string> seen;
    std::vector<const xunit::TestCase*> failures;
    for (const auto& root : assembly.test_groups) {
        collect_failures(root, seen, failures);
    }
    if (failures.empty())
        return;

    out << "\n  " << c.bold() << "failures:" << c.reset() << "\n";
    for (const auto* test : failures) {
        out << "    " << c.red() << qualified_test_name(*test) << c.reset();
        if (!test->failure_type.empty()) {
            out << ": " << test->failure_type;
        }
        out << "\n";

        std::string message = first_line(test->failure_message);
        if (!message.empty()) {
            out << "      " << c.dim() << message << c.reset() << "\n";
        }
    }
}

static void print_environment_errors(std::ostream& out, const xunit::Assembly& assembly,
                                     const ColorOutput& c) {
    if (assembly.environment_errors.empty())
        return;

    out << "\n  " << c.bold() << "errors:" << c.reset() << "\n";
    for (const auto& error : assembly.environment_errors) {
        out << "    " << c.red() << error.name << c.reset();
        if (!error.type.empty()) {
            out << " (" << error.type << ")";
        }
        out << "\n";
    }
}

// ============================================================================
// Report
// ============================================================================

void print_banner(std::ostream& out) {
    out << "    _  _ ___ _____   _____       _    __   ___              _ _            \n"
        << "   | \\| | __|_   _| |_   _|__ __| |_  \\ \\ / (_)____  _ __ _| (_)______ _ _ \n"
        << "  _| .` | _|  | |     | |/ -_|_-<  _|  \\ V /| (_-< || / _` | | |_ / -_) '_|\n"
        << " (_)_|\\_|___| |_|     |_|\\___/__/\\__|   \\_/ |_/__/\\_,_\\__,_|_|_/__\\___|_|  \n"
        << "\n";
}

void print_missing_log_files(std::ostream& out, const ColorOutput& c) {
    out << c.bold() << c.red() << "Failed" << c.reset() << ": No LOG files found to process.\n"
        << "        Use the `--logFile` argument to pass a file containing logs in xUnit's v2+ "
           "XML format.\n"
        << "        If you want to specify multiple files, pass the argument once for each log "
           "file.\n"
        << "\n";
}

void print_load_failure(std::ostream& out, const std::string& reason, const ColorOutput& c) {
    out << c.bold() << c.red() << "Failed" << c.reset() << " - " << reason << "\n";
}

void print_assembly(std::ostream& out, const xunit::Assembly& assembly,
                    const PrintOptions& options) {
    ColorOutput c(options.use_color);

    out << "\n  Assembly:         " << assembly.name;
    if (assembly.failed_count != 0) {
        out << " - " << c.bold() << c.red() << "⛌ Failed (" << assembly.failed_count << " of "
            << assembly.total_count << " failed)." << c.reset() << "\n";
    } else {
        out << " - " << c.bold() << c.green() << "✓ Passed (" << assembly.passed_count << " of "
            << assembly.total_count << " passed)." << c.reset() << "\n";
    }

    out << "  Date / time:      " << assembly.run_date << " " << assembly.run_time << "\n";
    if (!assembly.time_rtf.empty()) {
        out << "  Total time:       " << assembly.time_rtf << ".\n";
    } else {
        out << "  Total time:       " << format_seconds(assembly.time) << " seconds.\n";
    }

    out << "\n"
        << "  # tests:          " << assembly.total_count << "\n"
        << "  # Passed tests:   " << assembly.passed_count << "\n"
        << "  # Failed tests:   " << assembly.failed_count << "\n"
        << "  # Skipped tests:  " << assembly.skipped_count << "\n"
        << "  # Not run tests:  " << assembly.not_run_count << "\n"
        << "  # Errors:         " << assembly.error_count << "\n"
        << "\n";

    for (const auto& root : assembly.test_groups) {
        std::string indent;
        if (!root.name.empty()) {
            out << "\n  " << c.bold() << "Trait: " << root.name << c.reset() << "\n";
            indent = "  ";
        }

        for (const auto& test : root.tests) {
            print_test(out, indent + "  ", test, options, c);
        }
        for (const auto& group : root.groups) {
            out << "\n";
            print_group(out, group, indent, options, c);
        }
    }

    print_failures(out, assembly, c);
    print_environment_errors(out, assembly, c);
}

void print_test_run(std::ostream& out, const std::string& source, const xunit::TestRun& run,
                    const PrintOptions& options) {
    out << "Input source:         " << source << "\n";
    out << "Amount of assemblies: " << run.assemblies.size() << "\n";

    if (!run.computer.empty()) {
        out << "Computer:             " << run.computer << "\n";
    }
    if (!run.user.empty()) {
        out << "User:                 " << run.user << "\n";
    }
    if (!run.start_time_rtf.empty()) {
        out << "Start time:           " << run.start_time_rtf << "\n";
    }
    if (!run.end_time_rtf.empty()) {
        out << "End time:             " << run.end_time_rtf << "\n";
    } else if (!run.timestamp.empty()) {
        out << "End time:             " << run.timestamp << "\n";
    }

    for (const auto& assembly : run.assemblies) {
        print_assembly(out, assembly, options);
    }

    TESTVIZ_LOG_DEBUG("cli", "Printed " << run.assemblies.size() << " assembly report(s) for "
                                        << source);
}

} // namespace testviz::cli
