//! # Name Decoder
//!
//! Group path layout for `NS1.Outer+Method+Scenario.Result`:
//!
//! ```text
//! split on '+':  "NS1.Outer" | "Method" | "Scenario.Result"
//!                   after last '.'  verbatim  before first '.'
//! path:          "Outer"        "Method"   "Scenario"
//! ```

#include "names/name_decoder.hpp"

#include "names/camel_case.hpp"
#include "names/sentence.hpp"

namespace testviz::names {

/// Part of `text` after the last occurrence of `sep` (all of it if absent).
static auto after_last(std::string_view text, char sep) -> std::string_view {
    size_t pos = text.rfind(sep);
    return pos == std::string_view::npos ? text : text.substr(pos + 1);
}

/// Part of `text` before the first occurrence of `sep` (all of it if absent).
static auto before_first(std::string_view text, char sep) -> std::string_view {
    return text.substr(0, text.find(sep));
}

auto has_display_name(std::string_view name) -> bool {
    return name.find(' ') != std::string_view::npos;
}

auto is_nested(std::string_view name) -> bool {
    return !has_display_name(name) && name.find('+') != std::string_view::npos;
}

auto humanize(std::string_view identifier, const NamingOptions& options) -> std::string {
    return to_sentence(split(identifier, options), options);
}

auto friendly_name(std::string_view name, const NamingOptions& options) -> std::string {
    if (has_display_name(name)) {
        return std::string(name);
    }

    return humanize(after_last(name, '.'), options);
}

auto group_path(std::string_view name, const NamingOptions& options) -> std::vector<std::string> {
    if (!is_nested(name)) {
        return {};
    }

    std::vector<std::string_view> chunks;
    size_t pos = 0;
    while (true) {
        size_t plus = name.find('+', pos);
        if (plus == std::string_view::npos) {
            chunks.push_back(name.substr(pos));
            break;
        }
        chunks.push_back(name.substr(pos, plus - pos));
        pos = plus + 1;
    }

    // Nested names always have at least two chunks
    std::vector<std::string> path;
    path.reserve(chunks.size());
    path.push_back(humanize(after_last(chunks.front(), '.'), options));
    for (size_t i = 1; i + 1 < chunks.size(); ++i) {
        path.push_back(humanize(chunks[i], options));
    }
    path.push_back(humanize(before_first(chunks.back(), '.'), options));

    return path;
}

auto trait_label(std::string_view name, std::string_view value) -> std::string {
    std::string label;
    label.reserve(name.size() + value.size() + 3);
    label += name;
    label += " - ";
    label += value;
    return label;
}

auto assembly_name(std::string_view full_name) -> std::string {
    if (full_name.find('/') != std::string_view::npos) {
        return std::string(after_last(full_name, '/'));
    }

    return std::string(after_last(full_name, '\\'));
}

} // namespace testviz::names
