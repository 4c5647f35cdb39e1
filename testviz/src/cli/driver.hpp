//! # Driver Interface
//!
//! `testviz_main()` parses the command line and renders every requested
//! results file.

#pragma once

#include "config.hpp"
#include "printer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace testviz::cli {

/// Loads and prints each file in order. A file that cannot be loaded is
/// reported and skipped. Returns the number of such files.
auto render_log_files(std::ostream& out, const std::vector<std::string>& files,
                      const Configuration& config, const PrintOptions& options) -> int;

} // namespace testviz::cli

// Entry point called by main()
int testviz_main(int argc, char* argv[]);
