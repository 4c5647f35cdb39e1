//! # Name Decoder
//!
//! Turns the fully qualified name of an xUnit test into the text shown to
//! the user and into the chain of groups the test belongs to.
//!
//! ## Name Shapes
//!
//! | Shape        | Rule                         | Example                                  |
//! |--------------|------------------------------|------------------------------------------|
//! | Display name | contains a space             | `Adds two numbers`                       |
//! | Plain        | no space, no `+`             | `NS.TestClass.TestMethod`                |
//! | Nested       | no space, contains `+`       | `NS.TestClass+Method+Scenario.Result`    |
//!
//! C# identifiers cannot contain spaces, so a name with a space was set
//! through `DisplayName` and is shown untouched. Nested classes are joined
//! to their parent with `+` by the .NET runtime.
//!
//! ## Example
//!
//! ```cpp
//! auto options = NamingOptions::defaults();
//! friendly_name("NS1.TestClass+Method+SubScenario.Result", options); // "Result"
//! group_path("NS1.TestClass+Method+SubScenario.Result", options);
//! // {"Test class", "Method", "Sub scenario"}
//! ```

#ifndef TESTVIZ_NAMES_NAME_DECODER_HPP
#define TESTVIZ_NAMES_NAME_DECODER_HPP

#include "names/naming_options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace testviz::names {

/// True if `name` contains a space.
[[nodiscard]] auto has_display_name(std::string_view name) -> bool;

/// True if `name` is not a display name and contains `+`.
[[nodiscard]] auto is_nested(std::string_view name) -> bool;

/// CamelCase-splits `identifier` and joins the words into a sentence.
[[nodiscard]] auto humanize(std::string_view identifier, const NamingOptions& options)
    -> std::string;

/// Readable test name: display names verbatim, otherwise the humanized
/// segment after the last `.`.
[[nodiscard]] auto friendly_name(std::string_view name, const NamingOptions& options)
    -> std::string;

/// Humanized group labels of a nested test, outermost first.
/// Empty for display names and for names without `+`.
[[nodiscard]] auto group_path(std::string_view name, const NamingOptions& options)
    -> std::vector<std::string>;

/// Root label for a trait: "<name> - <value>".
[[nodiscard]] auto trait_label(std::string_view name, std::string_view value) -> std::string;

/// File name of an assembly path, accepting both `/` and `\` separators.
[[nodiscard]] auto assembly_name(std::string_view full_name) -> std::string;

} // namespace testviz::names

#endif // TESTVIZ_NAMES_NAME_DECODER_HPP
