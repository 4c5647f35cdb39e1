#include "xunit/reader.hpp"

#include "log/log.hpp"
#include "names/name_decoder.hpp"
#include "xunit/hierarchy.hpp"

#include <fstream>
#include <sstream>

namespace testviz::xunit {

auto read_test(const TestElement& element, const names::NamingOptions& options) -> TestCase {
    TestCase test;
    test.id = element.id;
    test.qualified_name = element.name;
    test.name = names::friendly_name(element.name, options);
    test.result = element.result;
    test.time = element.time;
    test.failure_type = element.failure.exception_type;
    test.failure_message = element.failure.message;
    test.reason = element.reason;
    test.path = names::group_path(element.name, options);
    return test;
}

auto read_assembly(const AssemblyElement& element, const names::NamingOptions& options)
    -> Assembly {
    Assembly assembly;
    assembly.name = names::assembly_name(element.name);
    assembly.error_count = element.errors;
    assembly.passed_count = element.passed;
    assembly.failed_count = element.failed;
    assembly.not_run_count = element.not_run;
    assembly.skipped_count = element.skipped;
    assembly.total_count = element.total;
    assembly.run_date = element.run_date;
    assembly.run_time = element.run_time;
    assembly.time = element.time;
    assembly.time_rtf = element.time_rtf;
    assembly.environment = element.environment;
    assembly.target_framework = element.target_framework;
    assembly.environment_errors = element.environment_errors;

    HierarchyBuilder builder;
    for (const auto& collection : element.collections) {
        for (const auto& test_element : collection.tests) {
            std::vector<std::string> labels;
            labels.reserve(test_element.traits.size());
            for (const auto& trait : test_element.traits) {
                labels.push_back(names::trait_label(trait.name, trait.value));
            }

            TestCase test = read_test(test_element, options);
            std::vector<std::string> path = test.path;
            builder.add(std::move(path), std::move(test), labels);
        }
    }
    assembly.test_groups = builder.build();

    TESTVIZ_LOG_DEBUG("xunit", "Assembly " << assembly.name << ": " << builder.size()
                                           << " test(s), " << assembly.test_groups.size()
                                           << " root group(s)");
    return assembly;
}

auto read_result(const Document& document, const names::NamingOptions& options) -> TestRun {
    TestRun run;
    run.computer = document.computer;
    run.user = document.user;
    run.start_time_rtf = document.start_rtf;
    run.end_time_rtf = document.finish_rtf;
    run.timestamp = document.timestamp;

    run.assemblies.reserve(document.assemblies.size());
    for (const auto& element : document.assemblies) {
        run.assemblies.push_back(read_assembly(element, options));
    }
    return run;
}

auto load(std::string_view xml, const names::NamingOptions& options)
    -> Result<TestRun, DecodeError> {
    auto decoded = decode(xml);
    if (is_err(decoded)) {
        return unwrap_err(decoded);
    }
    return read_result(unwrap(decoded), options);
}

auto load_file(const std::string& path, const names::NamingOptions& options)
    -> Result<TestRun, DecodeError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        TESTVIZ_LOG_WARN("xunit", "Cannot open file: " << path);
        return DecodeError{"cannot open file: " + path, 0};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    TESTVIZ_LOG_INFO("xunit", "Loading " << path);
    return load(buffer.str(), options);
}

} // namespace testviz::xunit
