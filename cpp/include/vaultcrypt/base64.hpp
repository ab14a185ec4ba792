#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);

// Strict decode. Accepts the URL-safe alphabet and missing padding, ignores
// whitespace. Throws Base64Error (kBase64Empty, kBase64InvalidCharacters,
// kBase64Malformed).
std::vector<std::uint8_t> Decode(std::string_view input);

// Same rules as Decode, reporting failure through `ok` instead of throwing.
std::vector<std::uint8_t> TryDecode(std::string_view input, bool* ok = nullptr);

bool IsValid(std::string_view input);

// ^[A-Za-z0-9+/]*={0,2}$
bool MatchesStandardAlphabet(std::string_view input);

}  // namespace vaultcrypt::base64
