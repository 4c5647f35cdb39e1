//! # CLI Utilities Interface
//!
//! ## Functions
//!
//! | Function               | Description                             |
//! |------------------------|-----------------------------------------|
//! | `find_named()`         | Values of a repeatable named argument   |
//! | `is_stdout_terminal()` | Whether stdout is an interactive tty    |
//! | `print_usage()`        | Print CLI help text                     |
//! | `print_version()`      | Print tool version                      |

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace testviz::cli {

/// Why `find_named()` found nothing.
struct ArgError {
    enum class Kind {
        NotFound,     ///< The argument was not passed at all
        MissingValue, ///< The argument was passed last, without a value
    };

    Kind kind;
    std::string message;
};

/// Returns the values of `key` in order of appearance. Both `key <value>`
/// and `key=<value>` are accepted.
[[nodiscard]] auto find_named(const std::vector<std::string>& args, const std::string& key)
    -> Result<std::vector<std::string>, ArgError>;

[[nodiscard]] auto is_stdout_terminal() -> bool;

// Help text
void print_usage();
void print_version();

} // namespace testviz::cli
