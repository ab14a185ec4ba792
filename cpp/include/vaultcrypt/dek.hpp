#pragma once

#include "vaultcrypt/key.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::dek {

using Bytes = std::vector<std::uint8_t>;

// Wrapped per-document key as persisted next to the document.
struct DekInfo {
    std::string dek_id;
    std::string encrypted_dek;  // base64
    std::string dek_iv;         // base64, 12 bytes
    std::string dek_auth_tag;   // base64, 16 bytes
    std::string algorithm;
    std::uint32_t key_length = 0;
    std::uint32_t version = 0;
    std::string created_at;
};

struct EncryptedPayload {
    std::string ciphertext;  // base64
    std::string iv;          // base64
    std::string auth_tag;    // base64
};

struct DocumentEncryptionData {
    std::string ciphertext;
    std::string iv;
    std::string auth_tag;
    DekInfo dek_info;

    EncryptedPayload payload() const { return EncryptedPayload{ciphertext, iv, auth_tag}; }
};

struct DocumentEncryption {
    DocumentEncryptionData encrypted_document;
    DekInfo dek_info;
};

struct DekStats {
    std::string dek_id;
    std::string algorithm;
    std::uint32_t key_length = 0;
    std::uint32_t version = 0;
    std::string created_at;
    std::size_t wrapped_size = 0;
};

// Fresh extractable 256-bit key. Throws DEKGenerationError.
SymmetricKey GenerateDek();

// dek:<unix-millis base36>_<12 random alphanumerics>
std::string GenerateDekId();

// Wraps the DEK under the master key as version 1. Throws DEKError.
DekInfo EncryptDek(const SymmetricKey& dek,
                   const SymmetricKey& master_key,
                   const std::optional<std::string>& dek_id = std::nullopt);

// Returns a non-extractable key. Throws DEKDecryptionError.
SymmetricKey DecryptDek(const DekInfo& info, const SymmetricKey& master_key);

DocumentEncryptionData EncryptDocumentWithDek(const Bytes& plaintext, const SymmetricKey& dek, const DekInfo& info);
Bytes DecryptDocumentWithDek(const EncryptedPayload& payload, const SymmetricKey& dek);

DocumentEncryption CreateDocumentEncryption(const Bytes& plaintext,
                                            const SymmetricKey& master_key,
                                            const std::optional<std::string>& dek_id = std::nullopt);

// Throws DecryptionError whatever stage fails.
Bytes DecryptDocumentWithMasterKey(const EncryptedPayload& payload,
                                   std::string_view dek_info_json,
                                   const SymmetricKey& master_key);

// Rewraps under a new master key. Same id and creation time, version + 1.
DekInfo ReencryptDek(const DekInfo& info, const SymmetricKey& old_master_key, const SymmetricKey& new_master_key);

// Throws DEKError listing every missing or mistyped field.
DekInfo ParseDekInfo(std::string_view json);
std::string SerializeDekInfo(const DekInfo& info);

std::vector<std::string> ValidateDekInfo(const DekInfo& info);

DekStats GetDekStats(const DekInfo& info);

// Wraps and unwraps a known document under a throwaway master key.
bool TestDekFunctionality();

}  // namespace vaultcrypt::dek
