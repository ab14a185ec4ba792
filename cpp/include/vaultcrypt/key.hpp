#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace vaultcrypt {

using Bytes = std::vector<std::uint8_t>;

class SymmetricKey;

namespace detail {
const Bytes& KeyMaterial(const SymmetricKey& key) noexcept;
}  // namespace detail

// 256-bit AES-GCM key usable for encrypt/decrypt only. Move-only; the key
// bytes are wiped on destruction. Raw bytes leave the object only through
// ExportRaw() on extractable keys.
class SymmetricKey {
public:
    static SymmetricKey Generate(bool extractable);
    static SymmetricKey Import(const Bytes& raw, bool extractable);

    ~SymmetricKey();
    SymmetricKey(SymmetricKey&& other) noexcept;
    SymmetricKey& operator=(SymmetricKey&& other) noexcept;
    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;

    bool extractable() const noexcept { return extractable_; }
    std::size_t size() const noexcept { return material_.size(); }
    std::string_view algorithm() const noexcept;

    // Throws EncryptionError for non-extractable keys. The caller owns the
    // returned copy and should Cleanse() it.
    Bytes ExportRaw() const;

private:
    SymmetricKey(Bytes material, bool extractable);

    friend const Bytes& detail::KeyMaterial(const SymmetricKey& key) noexcept;

    Bytes material_;
    bool extractable_ = false;
};

}  // namespace vaultcrypt
