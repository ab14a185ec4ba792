#include "vaultcrypt/session.hpp"

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/json.hpp"
#include "vaultcrypt/log.hpp"

#include <stdexcept>
#include <utility>

namespace vaultcrypt::session {

namespace {

Bytes ExpectedValidationText(std::string_view username) {
    Bytes out(constants::kValidationPrefix.begin(), constants::kValidationPrefix.end());
    out.insert(out.end(), username.begin(), username.end());
    return out;
}

}  // namespace

Bytes NewSalt(const KdfOptions& options) {
    return aead::GenerateSalt(options.salt_length);
}

MasterKeySession MasterKeySession::Open(std::string_view password, const Bytes& salt, const KdfOptions& options) {
    MasterKeySession session;
    session.key_.emplace(aead::DeriveKey(password, salt, options.iterations));
    session.salt_ = salt;
    session.iterations_ = options.iterations;
    log::Debug("master key session opened (" + std::to_string(options.iterations) + " iterations)");
    return session;
}

MasterKeySession::MasterKeySession(MasterKeySession&& other) noexcept
    : key_(std::move(other.key_)), salt_(std::move(other.salt_)), iterations_(other.iterations_) {
    other.Clear();
}

MasterKeySession& MasterKeySession::operator=(MasterKeySession&& other) noexcept {
    if (this != &other) {
        Clear();
        key_ = std::move(other.key_);
        salt_ = std::move(other.salt_);
        iterations_ = other.iterations_;
        other.Clear();
    }
    return *this;
}

const SymmetricKey& MasterKeySession::key() const {
    if (!key_) {
        throw EncryptionError("Master key session is not active");
    }
    return *key_;
}

void MasterKeySession::Clear() noexcept {
    key_.reset();
    salt_.clear();
    iterations_ = 0;
}

ValidationPayload CreateValidationPayload(std::string_view username, const SymmetricKey& key) {
    Bytes text = ExpectedValidationText(username);
    aead::EncryptionResult sealed = aead::Encrypt(text, key);
    return ValidationPayload{std::move(sealed.ciphertext), std::move(sealed.iv), std::move(sealed.auth_tag)};
}

bool VerifyValidationPayload(const ValidationPayload& payload, std::string_view username, const SymmetricKey& key) {
    aead::DecryptionInput input;
    input.ciphertext = payload.ciphertext;
    input.iv = payload.iv;
    input.auth_tag = payload.auth_tag;
    input.key = &key;
    Bytes recovered;
    try {
        recovered = aead::Decrypt(input);
    } catch (const DecryptionError&) {
        log::Debug("validation payload did not open under the supplied key");
        return false;
    }
    return crypto::ConstantTimeEquals(recovered, ExpectedValidationText(username));
}

std::string SerializeValidationPayload(const ValidationPayload& payload) {
    return json::Writer()
        .String("ciphertext", payload.ciphertext)
        .String("iv", payload.iv)
        .String("authTag", payload.auth_tag)
        .Finish();
}

ValidationPayload ParseValidationPayload(std::string_view json_text) {
    json::Object object;
    try {
        object = json::Object::Parse(json_text);
    } catch (const std::runtime_error& exc) {
        throw UnsupportedFormatError(std::string("Invalid validation payload: ") + exc.what());
    }
    ValidationPayload payload;
    std::pair<const char*, std::string*> fields[] = {
        {"ciphertext", &payload.ciphertext},
        {"iv", &payload.iv},
        {"authTag", &payload.auth_tag},
    };
    for (auto& field : fields) {
        const json::Value* value = object.Find(field.first);
        if (!value || value->type != json::Type::kString) {
            throw UnsupportedFormatError(std::string("Invalid validation payload: missing ") + field.first);
        }
        *field.second = value->text;
    }
    return payload;
}

bool VerifyKeyValidation(std::string_view payload_json, std::string_view username, const SymmetricKey& key) {
    try {
        return VerifyValidationPayload(ParseValidationPayload(payload_json), username, key);
    } catch (const UnsupportedFormatError& exc) {
        log::Debug(exc.what());
        return false;
    }
}

}  // namespace vaultcrypt::session
