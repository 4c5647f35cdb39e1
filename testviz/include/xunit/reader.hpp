//! # Result Reader
//!
//! Entry point for turning an xUnit results file into a `TestRun`:
//!
//! ```text
//! file/text ──decode()──► Document ──read_result()──► TestRun
//! ```
//!
//! ## Example
//!
//! ```cpp
//! auto result = xunit::load_file("TestResults/results.xml", options);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#ifndef TESTVIZ_XUNIT_READER_HPP
#define TESTVIZ_XUNIT_READER_HPP

#include "common.hpp"
#include "names/naming_options.hpp"
#include "xunit/document.hpp"
#include "xunit/test_run.hpp"
#include "xunit/xml_decoder.hpp"

#include <string>
#include <string_view>

namespace testviz::xunit {

/// Converts one `<test>` element.
[[nodiscard]] auto read_test(const TestElement& element, const names::NamingOptions& options)
    -> TestCase;

/// Converts one `<assembly>` element, grouping its tests.
[[nodiscard]] auto read_assembly(const AssemblyElement& element,
                                 const names::NamingOptions& options) -> Assembly;

/// Converts a decoded document. Never fails.
[[nodiscard]] auto read_result(const Document& document, const names::NamingOptions& options)
    -> TestRun;

/// Decodes `xml` and converts it.
[[nodiscard]] auto load(std::string_view xml, const names::NamingOptions& options)
    -> Result<TestRun, DecodeError>;

/// Reads the file at `path`, then behaves like `load()`. An unreadable file
/// is reported as a DecodeError.
[[nodiscard]] auto load_file(const std::string& path, const names::NamingOptions& options)
    -> Result<TestRun, DecodeError>;

} // namespace testviz::xunit

#endif // TESTVIZ_XUNIT_READER_HPP
