#include "vaultcrypt/errors.hpp"

namespace vaultcrypt {

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kEncryptionFailed:
            return "ENCRYPTION_FAILED";
        case ErrorCode::kCryptoUnavailable:
            return "CRYPTO_NOT_SUPPORTED";
        case ErrorCode::kKeyDerivation:
            return "KEY_DERIVATION_ERROR";
        case ErrorCode::kDecryptionFailed:
            return "DECRYPTION_ERROR";
        case ErrorCode::kAuthentication:
            return "AUTHENTICATION_ERROR";
        case ErrorCode::kCorruption:
            return "CORRUPTION_ERROR";
        case ErrorCode::kUnsupportedFormat:
            return "UNSUPPORTED_FORMAT_ERROR";
        case ErrorCode::kBase64Empty:
            return "BASE64_EMPTY_INPUT";
        case ErrorCode::kBase64InvalidCharacters:
            return "BASE64_INVALID_CHARACTERS";
        case ErrorCode::kBase64Malformed:
            return "BASE64_MALFORMED";
        case ErrorCode::kDek:
            return "DEK_ERROR";
        case ErrorCode::kDekGeneration:
            return "DEK_GENERATION_ERROR";
        case ErrorCode::kDekDecryption:
            return "DEK_DECRYPTION_ERROR";
    }
    return "UNKNOWN_ERROR";
}

EncryptionError::EncryptionError(const std::string& message, ErrorCode code)
    : std::runtime_error(message), code_(code) {}

std::string EncryptionError::UserMessage() const {
    switch (code_) {
        case ErrorCode::kAuthentication:
            return "Incorrect password or corrupted file";
        case ErrorCode::kDecryptionFailed:
        case ErrorCode::kDekDecryption:
            return "Decryption failed. Key may be incorrect or data is corrupted.";
        case ErrorCode::kCryptoUnavailable:
            return "Cryptographic backend is unavailable";
        default:
            return what();
    }
}

}  // namespace vaultcrypt
