//! # CamelCase Scanner
//!
//! Splits a "CamelCase" identifier into its words.
//!
//! ## Word Rules
//!
//! After the first character of a word has been consumed, the next
//! character decides the shape of the word:
//!
//! | Next character | Word continues while                          | Example           |
//! |----------------|-----------------------------------------------|-------------------|
//! | uppercase      | next is uppercase, or protected by `no_split` | `PDF` in PDFLoader|
//! | anything else  | next is not uppercase, or protected           | `Fully`           |
//!
//! An uppercase run that stops before the end of input gives its last
//! character back: in `PDFLoader` the `L` starts the next word.
//!
//! A character is "protected" when the text of the current word plus that
//! character is a prefix of a `no_split` entry, so `HostBuilder` stays whole.
//!
//! ## Example
//!
//! ```cpp
//! auto words = split("FullyQualifiedName", NamingOptions{});
//! // {"Fully", "Qualified", "Name"}
//! ```

#ifndef TESTVIZ_NAMES_CAMEL_CASE_HPP
#define TESTVIZ_NAMES_CAMEL_CASE_HPP

#include "names/naming_options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace testviz::names {

/// Cursor over an identifier that yields one word per call.
///
/// The scanner borrows both the input and the options; both must outlive it.
class CamelCaseScanner {
public:
    CamelCaseScanner(std::string_view input, const NamingOptions& options);

    /// Returns true once every character has been assigned to a word.
    [[nodiscard]] auto is_at_end() const -> bool;

    /// Reads the next word. Must not be called when `is_at_end()`.
    [[nodiscard]] auto next_word() -> std::string_view;

private:
    std::string_view input_;
    const NamingOptions& options_;
    size_t pos_ = 0;

    [[nodiscard]] auto peek() const -> char;
    void advance();
    void retreat();

    /// True if the word started at `start`, extended by the next character,
    /// is a prefix of a `no_split` entry.
    [[nodiscard]] auto is_no_split_word(size_t start) const -> bool;
};

/// Returns true for the ASCII letters A-Z.
[[nodiscard]] auto is_upper(char c) -> bool;

/// Returns true if `text` is well-formed UTF-8.
[[nodiscard]] auto is_valid_utf8(std::string_view text) -> bool;

/// Splits `input` into words.
///
/// Empty input and input that is not valid UTF-8 come back as a single word
/// equal to the input. Concatenating the result always yields `input`.
[[nodiscard]] auto split(std::string_view input, const NamingOptions& options)
    -> std::vector<std::string>;

} // namespace testviz::names

#endif // TESTVIZ_NAMES_CAMEL_CASE_HPP
