#include "vaultcrypt/framing.hpp"

#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/log.hpp"

#include <cstddef>
#include <utility>

namespace vaultcrypt::framing {

namespace {

struct Split {
    Bytes ciphertext;
    Bytes tag;
};

Split SplitTrailingTag(const Bytes& combined) {
    if (combined.size() < constants::kTagLen) {
        throw DecryptionError("combined buffer shorter than the auth tag");
    }
    auto boundary = combined.end() - static_cast<std::ptrdiff_t>(constants::kTagLen);
    return Split{Bytes(combined.begin(), boundary), Bytes(boundary, combined.end())};
}

Bytes SeparateTag(const Bytes& ciphertext, const Bytes& tag, const Bytes& iv, const SymmetricKey& key,
                  const Bytes& aad) {
    return aead::DecryptBytes(ciphertext, tag, iv, key, aad);
}

// The ciphertext field already carries ciphertext||tag; the tag field is ignored.
Bytes EmbeddedTag(const Bytes& ciphertext, const Bytes&, const Bytes& iv, const SymmetricKey& key, const Bytes&) {
    Split split = SplitTrailingTag(ciphertext);
    return aead::DecryptBytes(split.ciphertext, split.tag, iv, key);
}

Bytes TagPrefix(const Bytes& ciphertext, const Bytes& tag, const Bytes& iv, const SymmetricKey& key, const Bytes&) {
    Bytes combined;
    combined.reserve(tag.size() + ciphertext.size());
    combined.insert(combined.end(), tag.begin(), tag.end());
    combined.insert(combined.end(), ciphertext.begin(), ciphertext.end());
    Split split = SplitTrailingTag(combined);
    return aead::DecryptBytes(split.ciphertext, split.tag, iv, key);
}

Bytes EmbeddedTagWithAad(const Bytes& ciphertext, const Bytes&, const Bytes& iv, const SymmetricKey& key,
                         const Bytes& aad) {
    Split split = SplitTrailingTag(ciphertext);
    return aead::DecryptBytes(split.ciphertext, split.tag, iv, key, aad);
}

Bytes DecodeField(const std::string& value, const char* field) {
    bool ok = false;
    Bytes out = base64::TryDecode(value, &ok);
    if (!ok) {
        log::Debug(std::string("legacy decrypt: ") + field + " is not valid base64");
        throw DecryptionError("Decryption failed. Key may be incorrect or data is corrupted.");
    }
    return out;
}

}  // namespace

const std::array<Framing, 4> kLegacyFramings = {{
    {"separate-tag", &SeparateTag},
    {"embedded-tag", &EmbeddedTag},
    {"tag-prefix", &TagPrefix},
    {"embedded-tag-aad", &EmbeddedTagWithAad},
}};

FallbackResult TryFramings(const Bytes& ciphertext,
                           const Bytes& tag,
                           const Bytes& iv,
                           const SymmetricKey& key,
                           const Bytes& aad) {
    FallbackResult result;
    for (const Framing& framing : kLegacyFramings) {
        try {
            result.plaintext = framing.decrypt(ciphertext, tag, iv, key, aad);
            result.ok = true;
            result.framing = std::string(framing.name);
            return result;
        } catch (const EncryptionError& exc) {
            result.failures.push_back(FramingAttempt{std::string(framing.name), exc.what()});
        }
    }
    return result;
}

Bytes DecryptWithFramings(const Bytes& ciphertext,
                          const Bytes& tag,
                          const Bytes& iv,
                          const SymmetricKey& key,
                          const Bytes& aad) {
    FallbackResult result = TryFramings(ciphertext, tag, iv, key, aad);
    if (!result.ok) {
        for (const auto& failure : result.failures) {
            log::Debug("framing " + failure.framing + " failed: " + failure.error);
        }
        throw DecryptionError("All decryption strategies failed. Key may be incorrect or data is corrupted.");
    }
    if (result.framing != kLegacyFramings.front().name) {
        log::Info("decrypted with legacy framing " + result.framing);
    } else {
        log::Debug("decrypted with framing " + result.framing);
    }
    return std::move(result.plaintext);
}

Bytes DecryptWithFallback(const aead::DecryptionInput& input) {
    if (!input.key) {
        throw DecryptionError("Decryption failed. Key may be incorrect or data is corrupted.");
    }
    Bytes ciphertext = input.ciphertext.empty() ? Bytes{} : DecodeField(input.ciphertext, "ciphertext");
    Bytes tag = input.auth_tag.empty() ? Bytes{} : DecodeField(input.auth_tag, "auth tag");
    Bytes iv = DecodeField(input.iv, "iv");
    Bytes aad;
    if (input.aad) {
        aad.assign(input.aad->begin(), input.aad->end());
    }
    return DecryptWithFramings(ciphertext, tag, iv, *input.key, aad);
}

}  // namespace vaultcrypt::framing
