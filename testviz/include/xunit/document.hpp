//! # xUnit v2+ Document Model
//!
//! Attribute-typed mirror of xUnit's v2+ XML result format, as produced by
//! `dotnet test --logger xunit` and the xUnit console runners. The format is
//! documented at https://xunit.net/docs/format-xml-v2.
//!
//! ```text
//! <assemblies>                      Document
//!   <assembly>                      AssemblyElement
//!     <errors><error/></errors>     EnvironmentError
//!     <collection>                  CollectionElement
//!       <test>                      TestElement
//!         <traits><trait/></traits> TraitElement
//!         <failure>                 FailureElement
//!         <output/> <reason/>
//!         <warnings><warning/></warnings>
//! ```
//!
//! These types carry exactly what the file says; readable names and
//! grouping are computed later by the reader.

#ifndef TESTVIZ_XUNIT_DOCUMENT_HPP
#define TESTVIZ_XUNIT_DOCUMENT_HPP

#include <string>
#include <vector>

namespace testviz::xunit {

/// `<trait name="" value=""/>`
struct TraitElement {
    std::string name;
    std::string value;
};

/// `<failure exception-type="">` with `<message>` and `<stack-trace>` text.
struct FailureElement {
    std::string exception_type;
    std::string message;
    std::string stack_trace;
};

/// `<test>`: the run of a single test case.
struct TestElement {
    std::string id;
    std::string name;
    std::string type;
    std::string method;
    std::string result;
    std::string source_file;
    std::string source_line;
    double time = 0.0;
    std::string time_rtf;
    FailureElement failure;
    std::string output;
    std::string reason;
    std::vector<TraitElement> traits;
    std::vector<std::string> warnings;
};

/// `<collection>`: a test collection and its tests.
struct CollectionElement {
    std::string id;
    std::string name;
    int failed = 0;
    int not_run = 0;
    int passed = 0;
    int skipped = 0;
    int total = 0;
    std::string time;
    std::string time_rtf;
    std::vector<TestElement> tests;
};

/// `<error name="" type=""/>`: a failure outside any single test, such as an
/// exception thrown while disposing of a fixture.
struct EnvironmentError {
    std::string name;
    std::string type;
};

/// `<assembly>`: the run of one test assembly and its environment.
struct AssemblyElement {
    std::string id;
    std::string name;
    std::string config_file;
    std::string environment;
    std::string target_framework;
    std::string test_framework;
    int errors = 0;
    int failed = 0;
    int not_run = 0;
    int passed = 0;
    int skipped = 0;
    int total = 0;
    std::string run_date;
    std::string run_time;
    std::string start_rtf;
    std::string finish_rtf;
    double time = 0.0;
    std::string time_rtf;
    std::vector<CollectionElement> collections;
    std::vector<EnvironmentError> environment_errors;
};

/// `<assemblies>`: the document root.
struct Document {
    std::string id;
    std::string schema_version;
    std::string computer;
    std::string user;
    std::string start_rtf;
    std::string finish_rtf;
    std::string timestamp;
    std::vector<AssemblyElement> assemblies;
};

} // namespace testviz::xunit

#endif // TESTVIZ_XUNIT_DOCUMENT_HPP
