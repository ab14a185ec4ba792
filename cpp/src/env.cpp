#include "vaultcrypt/env.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <strings.h>

namespace vaultcrypt::env {

namespace {

constexpr const char* kTruthy[] = {"1", "true", "yes", "on"};

// Unset and empty are treated alike.
std::optional<std::string> Lookup(std::string_view name) {
    const char* raw = std::getenv(std::string(name).c_str());
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

}  // namespace

std::string Get(std::string_view name) {
    return Lookup(name).value_or(std::string());
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::optional<std::string> value = Lookup(name);
    if (!value) {
        return default_value;
    }
    for (const char* word : kTruthy) {
        if (strcasecmp(value->c_str(), word) == 0) {
            return true;
        }
    }
    return false;
}

// Values past uint32 saturate; anything that is not all digits is ignored.
std::optional<std::uint32_t> GetUint(std::string_view name) {
    std::optional<std::string> value = Lookup(name);
    if (!value || value->find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(value->c_str(), nullptr, 10);
    if (errno == ERANGE || parsed > std::numeric_limits<std::uint32_t>::max()) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::uint32_t>(parsed);
}

}  // namespace vaultcrypt::env
