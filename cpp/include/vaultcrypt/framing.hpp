#pragma once

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/key.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::framing {

using Bytes = std::vector<std::uint8_t>;

// Older writers disagreed on where the GCM tag lives. Each framing rebuilds
// (ciphertext, tag) from the stored fields and runs one AEAD open.
using DecryptFn = Bytes (*)(const Bytes& ciphertext,
                            const Bytes& tag,
                            const Bytes& iv,
                            const SymmetricKey& key,
                            const Bytes& aad);

struct Framing {
    std::string_view name;
    DecryptFn decrypt;
};

// Tried in order; the canonical separate-tag layout comes first.
extern const std::array<Framing, 4> kLegacyFramings;

struct FramingAttempt {
    std::string framing;
    std::string error;
};

struct FallbackResult {
    bool ok = false;
    Bytes plaintext;
    std::string framing;
    std::vector<FramingAttempt> failures;
};

// Never throws for AEAD failures; reports every failed framing.
FallbackResult TryFramings(const Bytes& ciphertext,
                           const Bytes& tag,
                           const Bytes& iv,
                           const SymmetricKey& key,
                           const Bytes& aad = {});

// First successful framing wins. Throws DecryptionError when none does.
Bytes DecryptWithFramings(const Bytes& ciphertext,
                          const Bytes& tag,
                          const Bytes& iv,
                          const SymmetricKey& key,
                          const Bytes& aad = {});

Bytes DecryptWithFallback(const aead::DecryptionInput& input);

}  // namespace vaultcrypt::framing
