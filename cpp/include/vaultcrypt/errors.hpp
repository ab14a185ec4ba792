#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace vaultcrypt {

enum class ErrorCode {
    kEncryptionFailed,
    kCryptoUnavailable,
    kKeyDerivation,
    kDecryptionFailed,
    kAuthentication,
    kCorruption,
    kUnsupportedFormat,
    kBase64Empty,
    kBase64InvalidCharacters,
    kBase64Malformed,
    kDek,
    kDekGeneration,
    kDekDecryption,
};

std::string_view ErrorCodeName(ErrorCode code);

// Root of the error taxonomy. Every error thrown by the library derives from
// this type and carries a stable code, so callers pick user-facing text by
// type or code instead of inspecting what().
class EncryptionError : public std::runtime_error {
public:
    explicit EncryptionError(const std::string& message, ErrorCode code = ErrorCode::kEncryptionFailed);

    ErrorCode code() const noexcept { return code_; }
    std::string UserMessage() const;

private:
    ErrorCode code_;
};

class KeyDerivationError : public EncryptionError {
public:
    explicit KeyDerivationError(const std::string& message)
        : EncryptionError(message, ErrorCode::kKeyDerivation) {}
};

class DecryptionError : public EncryptionError {
public:
    explicit DecryptionError(const std::string& message)
        : EncryptionError(message, ErrorCode::kDecryptionFailed) {}

protected:
    DecryptionError(const std::string& message, ErrorCode code) : EncryptionError(message, code) {}
};

// Tag verification failed. Wrong password and tampered data are
// indistinguishable here and share one message.
class AuthenticationError : public DecryptionError {
public:
    explicit AuthenticationError(const std::string& message)
        : DecryptionError(message, ErrorCode::kAuthentication) {}
};

class CorruptionError : public EncryptionError {
public:
    explicit CorruptionError(const std::string& message)
        : EncryptionError(message, ErrorCode::kCorruption) {}
};

class UnsupportedFormatError : public EncryptionError {
public:
    explicit UnsupportedFormatError(const std::string& message)
        : EncryptionError(message, ErrorCode::kUnsupportedFormat) {}
};

class Base64Error : public EncryptionError {
public:
    Base64Error(const std::string& message, ErrorCode code) : EncryptionError(message, code) {}
};

class DEKError : public EncryptionError {
public:
    explicit DEKError(const std::string& message) : EncryptionError(message, ErrorCode::kDek) {}

protected:
    DEKError(const std::string& message, ErrorCode code) : EncryptionError(message, code) {}
};

class DEKGenerationError : public DEKError {
public:
    explicit DEKGenerationError(const std::string& message)
        : DEKError("DEK generation failed: " + message, ErrorCode::kDekGeneration) {}
};

class DEKDecryptionError : public DEKError {
public:
    explicit DEKDecryptionError(const std::string& message)
        : DEKError("DEK decryption failed: " + message, ErrorCode::kDekDecryption) {}
};

}  // namespace vaultcrypt
