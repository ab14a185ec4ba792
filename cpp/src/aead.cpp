#include "vaultcrypt/aead.hpp"

#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/crypto_utils.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/format.hpp"
#include "vaultcrypt/log.hpp"

#include <stdexcept>
#include <string>

namespace vaultcrypt::aead {

namespace {

constexpr const char* kDecryptFailure = "Decryption failed. Key may be incorrect or data is corrupted.";

Bytes SecureRandom(std::size_t size) {
    try {
        return crypto::RandomBytes(size);
    } catch (const std::runtime_error& exc) {
        throw EncryptionError(std::string("Secure random generation failed: ") + exc.what(),
                              ErrorCode::kCryptoUnavailable);
    }
}

Bytes ToBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes AadBytes(const std::optional<std::string>& aad) {
    if (!aad.has_value()) {
        return {};
    }
    return ToBytes(*aad);
}

std::string DocumentLabel(std::string_view document_name) {
    if (document_name.empty()) {
        return "the document";
    }
    return "\"" + std::string(document_name) + "\"";
}

}  // namespace

Bytes GenerateSalt(std::size_t length) {
    return SecureRandom(length);
}

Bytes GenerateIv() {
    return SecureRandom(constants::kIvLen);
}

Bytes DeriveExtractableKey(std::string_view password, const Bytes& salt, std::uint32_t iterations) {
    if (password.empty()) {
        throw KeyDerivationError("Password must not be empty");
    }
    if (salt.size() < constants::kMinSaltLen) {
        throw KeyDerivationError("Salt must be at least " + std::to_string(constants::kMinSaltLen) + " bytes");
    }
    if (iterations < constants::kMinIterations) {
        throw KeyDerivationError("Iterations must be at least " + std::to_string(constants::kMinIterations));
    }
    try {
        return crypto::Pbkdf2HmacSha256(password, salt, iterations, constants::kKeyLen);
    } catch (const std::runtime_error& exc) {
        throw KeyDerivationError(std::string("Key derivation failed: ") + exc.what());
    }
}

SymmetricKey DeriveKey(std::string_view password, const Bytes& salt, std::uint32_t iterations) {
    crypto::detail::ScopedSecret raw(DeriveExtractableKey(password, salt, iterations));
    return SymmetricKey::Import(raw.bytes(), false);
}

RawCiphertext EncryptBytes(const Bytes& plaintext,
                           const SymmetricKey& key,
                           const std::optional<Bytes>& iv,
                           const Bytes& aad) {
    RawCiphertext out;
    out.iv = iv.has_value() ? *iv : GenerateIv();
    if (out.iv.size() != constants::kIvLen) {
        throw EncryptionError("IV must be " + std::to_string(constants::kIvLen) + " bytes, got "
                              + std::to_string(out.iv.size()));
    }
    const Bytes& material = detail::KeyMaterial(key);
    if (material.size() != constants::kKeyLen) {
        throw EncryptionError("Encryption key is missing or has the wrong length");
    }

    crypto::GcmOutput sealed;
    try {
        sealed = crypto::AesGcmEncrypt(material, out.iv, plaintext, aad);
    } catch (const std::runtime_error& exc) {
        throw EncryptionError(std::string("Encryption failed: ") + exc.what());
    }
    if (sealed.tag.size() != constants::kTagLen) {
        throw EncryptionError("AES-GCM produced a " + std::to_string(sealed.tag.size() * 8)
                              + "-bit tag; only 128-bit tags are supported");
    }
    out.ciphertext = std::move(sealed.ciphertext);
    out.tag = std::move(sealed.tag);
    return out;
}

Bytes DecryptBytes(const Bytes& ciphertext,
                   const Bytes& tag,
                   const Bytes& iv,
                   const SymmetricKey& key,
                   const Bytes& aad) {
    if (iv.size() != constants::kIvLen) {
        log::Debug("decrypt rejected: IV is " + std::to_string(iv.size()) + " bytes");
        throw DecryptionError(kDecryptFailure);
    }
    if (tag.size() != constants::kTagLen) {
        log::Debug("decrypt rejected: auth tag is " + std::to_string(tag.size()) + " bytes");
        throw DecryptionError(kDecryptFailure);
    }
    const Bytes& material = detail::KeyMaterial(key);
    if (material.size() != constants::kKeyLen) {
        log::Debug("decrypt rejected: key material unavailable");
        throw DecryptionError(kDecryptFailure);
    }
    try {
        return crypto::AesGcmDecrypt(material, iv, ciphertext, tag, aad);
    } catch (const std::runtime_error& exc) {
        log::Debug(std::string("decrypt failed: ") + exc.what() + " (ciphertext " + std::to_string(ciphertext.size())
                   + " bytes)");
        throw DecryptionError(kDecryptFailure);
    }
}

EncryptionResult Encrypt(const Bytes& plaintext,
                         const SymmetricKey& key,
                         const std::optional<Bytes>& iv,
                         const std::optional<std::string>& aad) {
    RawCiphertext raw = EncryptBytes(plaintext, key, iv, AadBytes(aad));
    EncryptionResult result;
    result.ciphertext = base64::Encode(raw.ciphertext);
    result.iv = base64::Encode(raw.iv);
    result.auth_tag = base64::Encode(raw.tag);
    result.algorithm = std::string(constants::kAlgorithm);
    return result;
}

EncryptionResult EncryptText(std::string_view text,
                             const SymmetricKey& key,
                             const std::optional<Bytes>& iv,
                             const std::optional<std::string>& aad) {
    return Encrypt(ToBytes(text), key, iv, aad);
}

Bytes Decrypt(const DecryptionInput& input) {
    if (!input.key) {
        log::Debug("decrypt rejected: no key supplied");
        throw DecryptionError(kDecryptFailure);
    }
    bool ciphertext_ok = true;
    Bytes ciphertext;
    if (!input.ciphertext.empty()) {
        ciphertext = base64::TryDecode(input.ciphertext, &ciphertext_ok);
    }
    bool iv_ok = false;
    bool tag_ok = false;
    Bytes iv = base64::TryDecode(input.iv, &iv_ok);
    Bytes tag = base64::TryDecode(input.auth_tag, &tag_ok);
    if (!ciphertext_ok || !iv_ok || !tag_ok) {
        log::Debug(std::string("decrypt rejected: malformed base64 in")
                   + (ciphertext_ok ? "" : " ciphertext") + (iv_ok ? "" : " iv") + (tag_ok ? "" : " auth_tag"));
        throw DecryptionError(kDecryptFailure);
    }
    return DecryptBytes(ciphertext, tag, iv, *input.key, AadBytes(input.aad));
}

std::string DecryptText(const DecryptionInput& input) {
    Bytes plaintext = Decrypt(input);
    std::string text(plaintext.begin(), plaintext.end());
    crypto::Cleanse(plaintext);
    return text;
}

std::vector<std::string> ValidateDecryptionInputs(const DecryptionInput& input) {
    std::vector<std::string> errors;

    if (input.ciphertext.empty()) errors.emplace_back("Ciphertext is required");
    if (input.auth_tag.empty()) errors.emplace_back("Auth tag is required");
    if (input.iv.empty()) errors.emplace_back("IV is required");
    if (!input.key) errors.emplace_back("Key is required");

    if (!input.ciphertext.empty() && !base64::MatchesStandardAlphabet(input.ciphertext)) {
        errors.emplace_back("Ciphertext has invalid base64 format");
    }
    if (!input.auth_tag.empty() && !base64::MatchesStandardAlphabet(input.auth_tag)) {
        errors.emplace_back("Auth tag has invalid base64 format");
    }
    if (!input.iv.empty() && !base64::MatchesStandardAlphabet(input.iv)) {
        errors.emplace_back("IV has invalid base64 format");
    }

    if (!input.ciphertext.empty()) {
        bool ok = false;
        Bytes ciphertext = base64::TryDecode(input.ciphertext, &ok);
        if (!ok) {
            errors.emplace_back("Base64 decode validation failed for ciphertext");
        } else if (ciphertext.empty()) {
            errors.emplace_back("Ciphertext is empty after decoding");
        }
    }
    if (!input.auth_tag.empty()) {
        bool ok = false;
        Bytes tag = base64::TryDecode(input.auth_tag, &ok);
        if (!ok) {
            errors.emplace_back("Base64 decode validation failed for auth tag");
        } else if (tag.size() != constants::kTagLen) {
            errors.emplace_back("Auth tag length mismatch: expected " + std::to_string(constants::kTagLen) + ", got "
                                + std::to_string(tag.size()));
        }
    }
    if (!input.iv.empty()) {
        bool ok = false;
        Bytes iv = base64::TryDecode(input.iv, &ok);
        if (!ok) {
            errors.emplace_back("Base64 decode validation failed for IV");
        } else if (iv.size() != constants::kIvLen) {
            errors.emplace_back("IV length mismatch: expected " + std::to_string(constants::kIvLen) + ", got "
                                + std::to_string(iv.size()));
        }
    }
    return errors;
}

void ValidateCiphertextInput(const Bytes& data) {
    if (data.empty()) {
        throw UnsupportedFormatError("Encrypted data is empty or null");
    }
    if (data.size() < constants::kMinCiphertextLen) {
        throw UnsupportedFormatError("Encrypted data too small: " + std::to_string(data.size())
                                     + " bytes (minimum " + std::to_string(constants::kMinCiphertextLen)
                                     + " required)");
    }
    std::size_t non_zero = 0;
    for (std::uint8_t byte : data) {
        if (byte != 0) {
            ++non_zero;
        }
    }
    if (static_cast<double>(non_zero) < static_cast<double>(data.size()) * constants::kMinNonZeroRatio) {
        throw CorruptionError("Encrypted data appears to be mostly null bytes (possible corruption)");
    }
}

IntegrityReport ValidateCiphertextIntegrity(const DecryptionInput& input) {
    IntegrityReport report;
    bool ciphertext_ok = false;
    bool tag_ok = false;
    bool iv_ok = false;
    Bytes ciphertext = base64::TryDecode(input.ciphertext, &ciphertext_ok);
    Bytes tag = base64::TryDecode(input.auth_tag, &tag_ok);
    Bytes iv = base64::TryDecode(input.iv, &iv_ok);

    if (!ciphertext_ok || ciphertext.empty()) {
        report.issues.emplace_back("Ciphertext is empty or not valid base64");
    } else {
        report.ciphertext_valid = true;
        report.estimated_original_size = ciphertext.size();
    }
    if (!tag_ok || tag.size() != constants::kTagLen) {
        report.issues.push_back("Auth tag length: expected " + std::to_string(constants::kTagLen) + ", got "
                                + (tag_ok ? std::to_string(tag.size()) : std::string("undecodable")));
    } else {
        report.auth_tag_valid = true;
    }
    if (!iv_ok || iv.size() != constants::kIvLen) {
        report.issues.push_back("IV length: expected " + std::to_string(constants::kIvLen) + ", got "
                                + (iv_ok ? std::to_string(iv.size()) : std::string("undecodable")));
    } else {
        report.iv_valid = true;
    }
    return report;
}

EncryptionParameters RecommendedParameters() {
    EncryptionParameters params;
    params.algorithm = std::string(constants::kAlgorithm);
    params.key_derivation = std::string(constants::kKdfAlgorithm);
    params.iterations = constants::kRecommendedIterations;
    params.salt = base64::Encode(GenerateSalt());
    params.key_length = constants::kKeyLen;
    params.iv_length = constants::kIvLen;
    params.auth_tag_length = constants::kTagLen;
    return params;
}

std::vector<std::string> ValidateEncryptionParameters(const EncryptionParameters& params) {
    std::vector<std::string> errors;
    if (!params.algorithm.empty() && params.algorithm != constants::kAlgorithm) {
        errors.push_back("Unsupported algorithm: " + params.algorithm);
    }
    if (!params.key_derivation.empty() && params.key_derivation != constants::kKdfAlgorithm) {
        errors.push_back("Unsupported key derivation: " + params.key_derivation);
    }
    if (params.iterations && *params.iterations < constants::kMinIterations) {
        errors.push_back("Iterations must be at least " + std::to_string(constants::kMinIterations));
    }
    if (params.key_length && *params.key_length != constants::kKeyLen) {
        errors.push_back("Key length must be " + std::to_string(constants::kKeyLen) + " bytes");
    }
    if (params.iv_length && *params.iv_length != constants::kIvLen) {
        errors.push_back("IV length must be " + std::to_string(constants::kIvLen) + " bytes");
    }
    if (params.auth_tag_length && *params.auth_tag_length != constants::kTagLen) {
        errors.push_back("Auth tag length must be " + std::to_string(constants::kTagLen) + " bytes");
    }
    if (!params.salt.empty()) {
        bool ok = false;
        Bytes salt = base64::TryDecode(params.salt, &ok);
        if (!ok) {
            errors.emplace_back("Salt is not valid base64");
        } else if (salt.size() < constants::kMinSaltLen) {
            errors.push_back("Salt must be at least " + std::to_string(constants::kMinSaltLen) + " bytes");
        }
    }
    return errors;
}

std::string GetDecryptionErrorMessage(const std::exception& error, std::string_view document_name) {
    const std::string doc = DocumentLabel(document_name);
    const auto* typed = dynamic_cast<const EncryptionError*>(&error);
    if (!typed) {
        return "Decryption Failed: An unexpected error occurred while decrypting " + doc
               + ". Please try again or contact support.";
    }
    switch (typed->code()) {
        case ErrorCode::kAuthentication:
            return "Authentication Failed: " + doc
                   + " could not be decrypted because the password is incorrect or the data has been tampered "
                     "with. Please verify your password and try again.";
        case ErrorCode::kCorruption:
            return "Data Corruption: " + doc
                   + " appears to be corrupted or incomplete. The file may have been damaged during storage or "
                     "transfer. Please contact your administrator.";
        case ErrorCode::kUnsupportedFormat:
            return "Format Error: " + doc
                   + " has an unsupported or malformed encryption format. This may require system updates or "
                     "technical assistance.";
        case ErrorCode::kKeyDerivation:
            return "Key Error: Unable to generate the encryption key. Please check your password and encryption "
                   "parameters.";
        default:
            return "Encryption Error: " + typed->UserMessage();
    }
}

std::string KeyFingerprint(const SymmetricKey& key) {
    if (!key.extractable() || key.size() != constants::kKeyLen) {
        return "FINGERPRINT_FAILED";
    }
    crypto::detail::ScopedSecret raw(key.ExportRaw());
    try {
        return format::HexEncode(crypto::Sha256(raw.bytes()));
    } catch (const std::runtime_error& exc) {
        log::Debug(std::string("key fingerprint failed: ") + exc.what());
        return "FINGERPRINT_FAILED";
    }
}

}  // namespace vaultcrypt::aead
