#include "vaultcrypt/cli_colors.hpp"

#include <atomic>
#include <cstdio>

#include <unistd.h>

namespace vaultcrypt::cli {

namespace {

// -1 follows the terminal, 0 forces off, 1 forces on.
std::atomic<int> g_override{-1};

bool IsStandardStream(const std::ostream& os) {
    return &os == &std::cout || &os == &std::cerr || &os == &std::clog;
}

bool AttachedToTerminal(const std::ostream& os) {
    static const bool stdout_tty = isatty(fileno(stdout)) != 0;
    static const bool stderr_tty = isatty(fileno(stderr)) != 0;
    if (&os == &std::cout) {
        return stdout_tty;
    }
    return stderr_tty;
}

}  // namespace

bool ColorsEnabled(std::ostream& os) {
    if (!IsStandardStream(os)) {
        return false;
    }
    int forced = g_override.load(std::memory_order_relaxed);
    if (forced >= 0) {
        return forced == 1;
    }
    return AttachedToTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    g_override.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

std::string PassFail(bool passed, std::ostream& os) {
    return passed ? Colorize("PASS", color::GREEN, os) : Colorize("FAIL", color::RED, os);
}

std::string Verdict(const std::string& text, bool encrypted, std::ostream& os) {
    return Colorize(text, encrypted ? color::YELLOW : color::GREEN, os);
}

}  // namespace vaultcrypt::cli
