#include "vaultcrypt/log.hpp"

#include "vaultcrypt/cli_colors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace vaultcrypt::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::kWarn)};
std::mutex g_write_mutex;

void Write(Level level, const char* tag, const char* color, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    std::string prefix = cli::Colorize(std::string(tag) + ":", color, std::cerr);
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << prefix << " " << message << "\n";
}

}  // namespace

void SetLevel(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Enabled(Level level) {
    return level != Level::kOff && static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

std::optional<Level> LevelFromString(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "debug") {
        return Level::kDebug;
    }
    if (lowered == "info") {
        return Level::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return Level::kWarn;
    }
    if (lowered == "error") {
        return Level::kError;
    }
    if (lowered == "off" || lowered == "none") {
        return Level::kOff;
    }
    return std::nullopt;
}

void Debug(const std::string& message) {
    Write(Level::kDebug, "DEBUG", cli::color::BRIGHT_BLACK, message);
}

void Info(const std::string& message) {
    Write(Level::kInfo, "INFO", cli::color::CYAN, message);
}

void Warn(const std::string& message) {
    Write(Level::kWarn, "WARN", cli::color::YELLOW, message);
}

void Error(const std::string& message) {
    Write(Level::kError, "ERROR", cli::color::BOLD_RED, message);
}

}  // namespace vaultcrypt::log
