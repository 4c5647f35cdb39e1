//! # Naming Options
//!
//! The two word lists that steer how .NET identifiers are turned into
//! readable text:
//!
//! | List           | Used by              | Match rule                        |
//! |----------------|----------------------|-----------------------------------|
//! | `no_split`     | CamelCase scanner    | text read so far is a prefix      |
//! | `no_transform` | Sentence formatter   | exact word                        |
//!
//! Built once at startup (defaults, then `testviz.toml`) and passed by const
//! reference everywhere afterwards.

#ifndef TESTVIZ_NAMES_NAMING_OPTIONS_HPP
#define TESTVIZ_NAMES_NAMING_OPTIONS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace testviz::names {

struct NamingOptions {
    /// Literals the CamelCase scanner must never split (e.g. "HostBuilder").
    std::vector<std::string> no_split;

    /// Words the sentence formatter emits verbatim instead of lower-casing.
    std::vector<std::string> no_transform;

    /// The lists the tool ships with.
    [[nodiscard]] static auto defaults() -> NamingOptions;

    /// Returns true if `text` is a prefix of any `no_split` entry.
    [[nodiscard]] auto is_no_split_prefix(std::string_view text) const -> bool;

    /// Returns true if `word` equals one of the `no_transform` entries.
    [[nodiscard]] auto is_no_transform(std::string_view word) const -> bool;
};

} // namespace testviz::names

#endif // TESTVIZ_NAMES_NAMING_OPTIONS_HPP
