//! # testviz Entry Point
//!
//! The binary is named `testviz`:
//!
//! ```bash
//! testviz --logFile TestResults/results.xml
//! testviz --logFile unit.xml --logFile integration.xml --no-color
//! ```
//!
//! All work happens in `testviz_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return testviz_main(argc, argv);
}
