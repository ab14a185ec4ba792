#pragma once

#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/key.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::session {

using Bytes = std::vector<std::uint8_t>;

struct KdfOptions {
    std::uint32_t iterations = constants::kRecommendedIterations;
    std::size_t salt_length = constants::kSaltLen;
};

Bytes NewSalt(const KdfOptions& options = {});

// Holds the derived master key for the lifetime of a login. Move-only; the
// key is wiped on Clear() and on destruction.
class MasterKeySession {
public:
    // Throws KeyDerivationError.
    static MasterKeySession Open(std::string_view password, const Bytes& salt, const KdfOptions& options = {});

    MasterKeySession() = default;
    ~MasterKeySession() = default;
    MasterKeySession(MasterKeySession&& other) noexcept;
    MasterKeySession& operator=(MasterKeySession&& other) noexcept;
    MasterKeySession(const MasterKeySession&) = delete;
    MasterKeySession& operator=(const MasterKeySession&) = delete;

    bool active() const noexcept { return key_.has_value(); }
    const Bytes& salt() const noexcept { return salt_; }
    std::uint32_t iterations() const noexcept { return iterations_; }

    // Throws EncryptionError once cleared.
    const SymmetricKey& key() const;

    void Clear() noexcept;

private:
    std::optional<SymmetricKey> key_;
    Bytes salt_;
    std::uint32_t iterations_ = 0;
};

// Encrypted "validation:<username>" blob stored server-side so a login can
// check a derived key without touching any document.
struct ValidationPayload {
    std::string ciphertext;  // base64
    std::string iv;          // base64
    std::string auth_tag;    // base64
};

ValidationPayload CreateValidationPayload(std::string_view username, const SymmetricKey& key);

// Exact match only. Wrong key or tampered payload returns false.
bool VerifyValidationPayload(const ValidationPayload& payload, std::string_view username, const SymmetricKey& key);

std::string SerializeValidationPayload(const ValidationPayload& payload);

// Throws UnsupportedFormatError.
ValidationPayload ParseValidationPayload(std::string_view json);

// False for unparseable input as well as for a wrong key.
bool VerifyKeyValidation(std::string_view payload_json, std::string_view username, const SymmetricKey& key);

}  // namespace vaultcrypt::session
