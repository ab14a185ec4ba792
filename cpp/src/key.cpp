#include "vaultcrypt/key.hpp"

#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace vaultcrypt {

namespace detail {

const Bytes& KeyMaterial(const SymmetricKey& key) noexcept {
    return key.material_;
}

}  // namespace detail

SymmetricKey::SymmetricKey(Bytes material, bool extractable)
    : material_(std::move(material)), extractable_(extractable) {}

SymmetricKey::~SymmetricKey() {
    crypto::Cleanse(material_);
}

SymmetricKey::SymmetricKey(SymmetricKey&& other) noexcept
    : material_(std::move(other.material_)), extractable_(other.extractable_) {
    other.material_.clear();
}

SymmetricKey& SymmetricKey::operator=(SymmetricKey&& other) noexcept {
    if (this != &other) {
        crypto::Cleanse(material_);
        material_ = std::move(other.material_);
        extractable_ = other.extractable_;
        other.material_.clear();
    }
    return *this;
}

SymmetricKey SymmetricKey::Generate(bool extractable) {
    try {
        return SymmetricKey(crypto::RandomBytes(constants::kKeyLen), extractable);
    } catch (const std::runtime_error& exc) {
        throw EncryptionError(std::string("Key generation failed: ") + exc.what(), ErrorCode::kCryptoUnavailable);
    }
}

SymmetricKey SymmetricKey::Import(const Bytes& raw, bool extractable) {
    if (raw.size() != constants::kKeyLen) {
        throw EncryptionError("Invalid key length: expected " + std::to_string(constants::kKeyLen) + " bytes, got "
                              + std::to_string(raw.size()));
    }
    return SymmetricKey(raw, extractable);
}

std::string_view SymmetricKey::algorithm() const noexcept {
    return constants::kAlgorithm;
}

Bytes SymmetricKey::ExportRaw() const {
    if (!extractable_) {
        throw EncryptionError("Key is not extractable");
    }
    if (material_.empty()) {
        throw EncryptionError("Key material has been released");
    }
    return material_;
}

}  // namespace vaultcrypt
