#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace vaultcrypt::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";

    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
}

// Only std::cout, std::cerr and std::clog are ever coloured, and only when
// attached to a terminal unless forced with SetColorsEnabled.
bool ColorsEnabled(std::ostream& os);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os);

// "PASS" / "FAIL" for diagnostic checks.
std::string PassFail(bool passed, std::ostream& os);

// Encrypted material in yellow, plain material in green.
std::string Verdict(const std::string& text, bool encrypted, std::ostream& os = std::cout);

}  // namespace vaultcrypt::cli
