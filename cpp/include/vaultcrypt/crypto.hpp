#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace vaultcrypt::crypto {

using Bytes = std::vector<std::uint8_t>;

struct GcmOutput {
    Bytes ciphertext;
    Bytes tag;
};

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(std::string_view password, const Bytes& salt, std::uint32_t iterations, std::size_t length);
Bytes Sha256(const Bytes& data);

GcmOutput AesGcmEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad);
Bytes AesGcmDecrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext, const Bytes& tag, const Bytes& aad);

void Cleanse(Bytes& data) noexcept;
bool ConstantTimeEquals(const Bytes& a, const Bytes& b) noexcept;

}  // namespace vaultcrypt::crypto
