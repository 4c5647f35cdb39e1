//! # Common Definitions
//!
//! This module provides the types and constants shared by every part of
//! testviz.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions in the core**: decoding and configuration errors are
//!   returned via `Result<T, E>`; the name decoding core never fails
//! - **Explicit configuration**: naming and threshold settings are passed by
//!   const reference instead of living in globals

#ifndef TESTVIZ_COMMON_HPP
#define TESTVIZ_COMMON_HPP

#include <string>
#include <variant>

namespace testviz {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = xunit::load(xml, options);
/// if (is_ok(result)) {
///     const auto& run = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace testviz

#endif // TESTVIZ_COMMON_HPP
