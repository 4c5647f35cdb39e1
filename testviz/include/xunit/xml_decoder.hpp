//! # xUnit XML Decoder
//!
//! Decodes xUnit v2+ XML text into a `Document`, using libxml2's streaming
//! `xmlTextReader`.
//!
//! ## Matching Rules
//!
//! - The root element must be `<assemblies>`
//! - Elements are only picked up at the position the format defines
//!   (a `<test>` directly under `<assemblies>` is ignored)
//! - Unknown elements and attributes are skipped
//! - Missing numeric attributes read as 0, surrounding whitespace is trimmed
//!
//! ## Errors
//!
//! Decoding fails as a whole: XML that is not well-formed, a missing or
//! foreign root element, or a numeric attribute that does not parse.

#ifndef TESTVIZ_XUNIT_XML_DECODER_HPP
#define TESTVIZ_XUNIT_XML_DECODER_HPP

#include "common.hpp"
#include "xunit/document.hpp"

#include <string>
#include <string_view>

namespace testviz::xunit {

/// Why a document could not be decoded.
struct DecodeError {
    std::string message;
    int line = 0; ///< 1-based line reported by the parser, 0 when unknown

    /// "message (line N)" or just "message".
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Decodes `xml` into a Document.
[[nodiscard]] auto decode(std::string_view xml) -> Result<Document, DecodeError>;

/// Parses an integer attribute value. Empty (after trimming) reads as 0.
[[nodiscard]] auto parse_int_attribute(std::string_view text, int& out) -> bool;

/// Parses a floating-point attribute value. Empty (after trimming) reads as 0.
[[nodiscard]] auto parse_double_attribute(std::string_view text, double& out) -> bool;

} // namespace testviz::xunit

#endif // TESTVIZ_XUNIT_XML_DECODER_HPP
