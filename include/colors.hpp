#pragma once

#include <string>

namespace Colors {
    const std::string RESET = "\033[0m";
    const std::string GRAY = "\033[90m";            // For debug output
    const std::string RED = "\033[31m";             // For errors
    const std::string SOFT_BLUE = "\033[38;5;81m";  // For the spinner
    const std::string ERASE_LINE = "\r\033[K";      // Column 0, clear to end of line
}
