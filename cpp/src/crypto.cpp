#include "vaultcrypt/crypto.hpp"

#include "vaultcrypt/crypto_utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace vaultcrypt::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

int CheckedInt(std::size_t value, const char* what) {
    if (value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large");
    }
    return static_cast<int>(value);
}

}  // namespace

namespace detail {

ScopedSecret::~ScopedSecret() {
    Cleanse(bytes_);
}

}  // namespace detail

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedInt(out.size(), "random buffer")) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(std::string_view password, const Bytes& salt, std::uint32_t iterations, std::size_t length) {
    if (iterations == 0 || iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("PBKDF2 iteration count out of range");
    }
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.data(), CheckedInt(password.size(), "password"), salt.data(),
                             CheckedInt(salt.size(), "salt"), static_cast<int>(iterations), EVP_sha256(),
                             CheckedInt(out.size(), "derived key"), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes Sha256(const Bytes& data) {
    detail::UniqueMDCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes out(EVP_MAX_MD_SIZE);
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
    if (!data.empty()) {
        Ensure(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1, "SHA-256 update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    out.resize(out_len);
    return out;
}

GcmOutput AesGcmEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad) {
    if (key.size() != 32) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    GcmOutput out;
    out.ciphertext.resize(plaintext.size());
    out.tag.resize(16);

    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedInt(iv.size(), "IV"), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedInt(aad.size(), "AAD")) == 1,
               "AES-GCM aad failed");
    }
    if (!plaintext.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.ciphertext.data(), &out_len, plaintext.data(),
                                 CheckedInt(plaintext.size(), "plaintext")) == 1,
               "AES-GCM encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.ciphertext.data() + total_len, &out_len) == 1,
           "AES-GCM final failed");
    total_len += out_len;
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(out.tag.size()),
                               out.tag.data()) == 1,
           "AES-GCM get tag failed");

    out.ciphertext.resize(static_cast<std::size_t>(total_len));
    return out;
}

Bytes AesGcmDecrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext, const Bytes& tag, const Bytes& aad) {
    if (key.size() != 32) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    if (tag.size() != 16) {
        throw std::runtime_error("AES-GCM expects 16-byte tag");
    }
    Bytes plaintext(ciphertext.size());
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;
    Bytes tag_copy = tag;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, CheckedInt(iv.size(), "IV"), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &out_len, aad.data(), CheckedInt(aad.size(), "AAD")) == 1,
               "AES-GCM aad failed");
    }
    if (!ciphertext.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), plaintext.data(), &out_len, ciphertext.data(),
                                 CheckedInt(ciphertext.size(), "ciphertext")) == 1,
               "AES-GCM decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_copy.size()),
                               tag_copy.data()) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total_len, &out_len) != 1) {
        Cleanse(plaintext);
        throw std::runtime_error("AES-GCM auth failed");
    }
    total_len += out_len;

    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

void Cleanse(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
}

bool ConstantTimeEquals(const Bytes& a, const Bytes& b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace vaultcrypt::crypto
