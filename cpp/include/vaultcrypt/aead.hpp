#pragma once

#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/key.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::aead {

using Bytes = std::vector<std::uint8_t>;

struct EncryptionResult {
    std::string ciphertext;  // base64
    std::string iv;          // base64
    std::string auth_tag;    // base64
    std::string algorithm;
};

struct DecryptionInput {
    std::string ciphertext;  // base64
    std::string iv;          // base64
    std::string auth_tag;    // base64
    const SymmetricKey* key = nullptr;
    std::optional<std::string> aad;
};

struct RawCiphertext {
    Bytes ciphertext;
    Bytes tag;
    Bytes iv;
};

struct EncryptionParameters {
    std::string algorithm;
    std::string key_derivation;
    std::optional<std::uint32_t> iterations;
    std::string salt;  // base64
    std::optional<std::size_t> key_length;
    std::optional<std::size_t> iv_length;
    std::optional<std::size_t> auth_tag_length;
};

struct IntegrityReport {
    bool ciphertext_valid = false;
    bool auth_tag_valid = false;
    bool iv_valid = false;
    std::size_t estimated_original_size = 0;
    std::vector<std::string> issues;
};

Bytes GenerateSalt(std::size_t length = constants::kSaltLen);
Bytes GenerateIv();

// PBKDF2-HMAC-SHA256. Salt must be at least 16 bytes and iterations at least
// 100,000. Returns a non-extractable key; throws KeyDerivationError.
SymmetricKey DeriveKey(std::string_view password,
                       const Bytes& salt,
                       std::uint32_t iterations = constants::kRecommendedIterations);
Bytes DeriveExtractableKey(std::string_view password,
                           const Bytes& salt,
                           std::uint32_t iterations = constants::kRecommendedIterations);

// Byte-level AES-256-GCM. A missing IV is generated; a supplied IV must be
// 12 bytes and never reused under the same key.
RawCiphertext EncryptBytes(const Bytes& plaintext,
                           const SymmetricKey& key,
                           const std::optional<Bytes>& iv = std::nullopt,
                           const Bytes& aad = {});

// Throws DecryptionError with one fixed message whatever the cause.
Bytes DecryptBytes(const Bytes& ciphertext,
                   const Bytes& tag,
                   const Bytes& iv,
                   const SymmetricKey& key,
                   const Bytes& aad = {});

EncryptionResult Encrypt(const Bytes& plaintext,
                         const SymmetricKey& key,
                         const std::optional<Bytes>& iv = std::nullopt,
                         const std::optional<std::string>& aad = std::nullopt);
EncryptionResult EncryptText(std::string_view text,
                             const SymmetricKey& key,
                             const std::optional<Bytes>& iv = std::nullopt,
                             const std::optional<std::string>& aad = std::nullopt);

Bytes Decrypt(const DecryptionInput& input);
std::string DecryptText(const DecryptionInput& input);

std::vector<std::string> ValidateDecryptionInputs(const DecryptionInput& input);

// Cheap structural checks on a raw ciphertext blob before any AEAD attempt.
// Throws UnsupportedFormatError or CorruptionError.
void ValidateCiphertextInput(const Bytes& data);

IntegrityReport ValidateCiphertextIntegrity(const DecryptionInput& input);

EncryptionParameters RecommendedParameters();
std::vector<std::string> ValidateEncryptionParameters(const EncryptionParameters& params);

std::string GetDecryptionErrorMessage(const std::exception& error, std::string_view document_name = {});

// Hex SHA-256 of the key bytes, "FINGERPRINT_FAILED" for non-extractable keys.
std::string KeyFingerprint(const SymmetricKey& key);

}  // namespace vaultcrypt::aead
