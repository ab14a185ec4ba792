#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaultcrypt::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::optional<std::uint32_t> GetUint(std::string_view name);

}  // namespace vaultcrypt::env
