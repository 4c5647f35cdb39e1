//! # CamelCase Scanner
//!
//! Implements the word cursor and the UTF-8 guard used by `split()`.

#include "names/camel_case.hpp"

#include "log/log.hpp"

#include <cstdint>

namespace testviz::names {

// ============================================================================
// Character Classes
// ============================================================================

auto is_upper(char c) -> bool {
    return c >= 'A' && c <= 'Z';
}

auto is_valid_utf8(std::string_view text) -> bool {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t cp = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size())
            return false;

        for (size_t k = 1; k < length; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        if ((length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) ||
            (length == 4 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }

        i += length;
    }
    return true;
}

// ============================================================================
// CamelCaseScanner
// ============================================================================

CamelCaseScanner::CamelCaseScanner(std::string_view input, const NamingOptions& options)
    : input_(input), options_(options) {}

auto CamelCaseScanner::is_at_end() const -> bool {
    return pos_ >= input_.size();
}

auto CamelCaseScanner::peek() const -> char {
    return is_at_end() ? '\0' : input_[pos_];
}

void CamelCaseScanner::advance() {
    ++pos_;
}

void CamelCaseScanner::retreat() {
    --pos_;
}

auto CamelCaseScanner::is_no_split_word(size_t start) const -> bool {
    return options_.is_no_split_prefix(input_.substr(start, pos_ + 1 - start));
}

auto CamelCaseScanner::next_word() -> std::string_view {
    size_t start = pos_;
    advance();

    if (!is_at_end() && is_upper(peek())) {
        while (!is_at_end() && (is_upper(peek()) || is_no_split_word(start))) {
            advance();
        }

        // The last uppercase character belongs to the next word
        if (!is_at_end()) {
            retreat();
        }

        return input_.substr(start, pos_ - start);
    }

    while (!is_at_end() && (!is_upper(peek()) || is_no_split_word(start))) {
        advance();
    }

    return input_.substr(start, pos_ - start);
}

// ============================================================================
// split
// ============================================================================

auto split(std::string_view input, const NamingOptions& options) -> std::vector<std::string> {
    if (input.empty() || !is_valid_utf8(input)) {
        return {std::string(input)};
    }

    std::vector<std::string> words;
    CamelCaseScanner scanner(input, options);
    while (!scanner.is_at_end()) {
        words.emplace_back(scanner.next_word());
    }

    TESTVIZ_LOG_TRACE("names", "split '" << input << "' into " << words.size() << " word(s)");
    return words;
}

} // namespace testviz::names
