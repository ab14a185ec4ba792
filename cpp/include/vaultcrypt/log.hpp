#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vaultcrypt::log {

enum class Level {
    kDebug = 0,
    kInfo = 1,
    kWarn = 2,
    kError = 3,
    kOff = 4,
};

// Process-wide threshold, default kWarn. Safe to change from any thread.
void SetLevel(Level level);
bool Enabled(Level level);
std::optional<Level> LevelFromString(std::string_view name);

// Lines go to std::cerr as "<LEVEL>: message". Never pass key material,
// passwords or plaintext.
void Debug(const std::string& message);
void Info(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace vaultcrypt::log
