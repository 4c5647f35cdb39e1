//! # Sentence Formatter
//!
//! Joins words into a sentence: the first word is kept as is, every later
//! word is lower-cased unless it is listed in `no_transform`.
//!
//! ```cpp
//! to_sentence({"A", "Collection", "Of", "Words"}, options); // "A collection of words"
//! ```

#ifndef TESTVIZ_NAMES_SENTENCE_HPP
#define TESTVIZ_NAMES_SENTENCE_HPP

#include "names/naming_options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace testviz::names {

/// ASCII lower-casing; other bytes are copied unchanged.
[[nodiscard]] auto to_lower(std::string_view word) -> std::string;

/// Joins `words` with single spaces. An empty list yields "".
[[nodiscard]] auto to_sentence(const std::vector<std::string>& words,
                               const NamingOptions& options) -> std::string;

} // namespace testviz::names

#endif // TESTVIZ_NAMES_SENTENCE_HPP
