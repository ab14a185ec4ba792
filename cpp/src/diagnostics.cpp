#include "vaultcrypt/diagnostics.hpp"

#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/cli_colors.hpp"
#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/container.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/crypto_utils.hpp"
#include "vaultcrypt/dek.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/format.hpp"
#include "vaultcrypt/log.hpp"

#include <stdexcept>
#include <utility>

namespace vaultcrypt::diagnostics {

namespace {

constexpr std::size_t kPreviewBytes = 8;

struct DecodedField {
    bool ok = false;
    Bytes bytes;
};

DecodedField DecodeField(const std::string& value) {
    DecodedField field;
    field.bytes = base64::TryDecode(value, &field.ok);
    return field;
}

const char* YesNo(bool value) {
    return value ? "yes" : "no";
}

}  // namespace

void DiagnosticsPort::Report(std::string_view check, bool passed) {
    out_ << "  " << check << ": " << cli::PassFail(passed, out_) << "\n";
}

aead::IntegrityReport DiagnosticsPort::AnalyzeEncryptionData(const aead::DecryptionInput& input) {
    DecodedField ciphertext = DecodeField(input.ciphertext);
    DecodedField iv = DecodeField(input.iv);
    DecodedField tag = DecodeField(input.auth_tag);

    out_ << "Encryption data analysis\n";
    out_ << "  ciphertext: " << input.ciphertext.size() << " chars, base64 " << YesNo(ciphertext.ok) << ", "
         << ciphertext.bytes.size() << " bytes\n";
    out_ << "  iv: " << input.iv.size() << " chars, base64 " << YesNo(iv.ok) << ", " << iv.bytes.size()
         << " bytes (expected " << constants::kIvLen << ")";
    if (iv.ok) {
        out_ << " " << format::HexPreview(iv.bytes, kPreviewBytes);
    }
    out_ << "\n";
    out_ << "  auth tag: " << input.auth_tag.size() << " chars, base64 " << YesNo(tag.ok) << ", "
         << tag.bytes.size() << " bytes (expected " << constants::kTagLen << ")";
    if (tag.ok) {
        out_ << " " << format::HexPreview(tag.bytes, kPreviewBytes);
    }
    out_ << "\n";
    out_ << "  key: " << (input.key ? (input.key->extractable() ? "extractable" : "non-extractable") : "missing")
         << "\n";
    if (input.aad) {
        out_ << "  aad: " << input.aad->size() << " bytes\n";
    }

    for (const std::string& error : aead::ValidateDecryptionInputs(input)) {
        out_ << "  input: " << cli::Colorize(error, cli::color::YELLOW, out_) << "\n";
    }
    aead::IntegrityReport report = aead::ValidateCiphertextIntegrity(input);
    for (const std::string& issue : report.issues) {
        out_ << "  integrity: " << cli::Colorize(issue, cli::color::YELLOW, out_) << "\n";
    }
    if (ciphertext.ok) {
        try {
            aead::ValidateCiphertextInput(ciphertext.bytes);
        } catch (const EncryptionError& exc) {
            out_ << "  content: " << cli::Colorize(exc.what(), cli::color::YELLOW, out_) << "\n";
        }
    }
    return report;
}

bool DiagnosticsPort::TestDecryption(const aead::DecryptionInput& input) {
    DecodedField ciphertext = DecodeField(input.ciphertext);
    DecodedField iv = DecodeField(input.iv);
    DecodedField tag = DecodeField(input.auth_tag);

    DecryptionFailure failure;
    failure.timestamp = format::UtcTimestamp();
    failure.ciphertext_size = ciphertext.bytes.size();
    failure.iv_preview = format::HexPreview(iv.bytes, kPreviewBytes);
    failure.tag_preview = format::HexPreview(tag.bytes, kPreviewBytes);

    out_ << "Decryption test\n";
    if (!input.key || !ciphertext.ok || !iv.ok || !tag.ok) {
        std::string reason = !input.key ? "no key supplied" : "input is not valid base64";
        failure.attempts.push_back(framing::FramingAttempt{"input", reason});
        out_ << "  " << cli::Colorize(reason, cli::color::RED, out_) << "\n";
        last_failure_ = std::move(failure);
        return false;
    }

    Bytes aad;
    if (input.aad) {
        aad.assign(input.aad->begin(), input.aad->end());
    }
    framing::FallbackResult result = framing::TryFramings(ciphertext.bytes, tag.bytes, iv.bytes, *input.key, aad);
    for (const auto& attempt : result.failures) {
        out_ << "  " << attempt.framing << ": " << cli::Colorize("failed", cli::color::RED, out_) << "\n";
    }
    if (result.ok) {
        crypto::Cleanse(result.plaintext);
        out_ << "  " << result.framing << ": " << cli::Colorize("ok", cli::color::GREEN, out_) << "\n";
        return true;
    }
    failure.attempts = std::move(result.failures);
    last_failure_ = std::move(failure);
    log::Debug("diagnostic decryption failed under every framing");
    return false;
}

classifier::DetectionResult DiagnosticsPort::DebugDocument(const classifier::DocumentRecord& document,
                                                           const Bytes* data) {
    classifier::DetectionResult result =
        data ? classifier::DetectEncryptionStatus(document, *data) : classifier::DetectEncryptionStatus(document);
    classifier::DecryptionVerdict verdict = classifier::ValidateDecryptionPossible(document, result);

    out_ << "Document " << (document.name.empty() ? document.id : document.name) << "\n";
    out_ << "  status: " << classifier::GetEncryptionStatusDescription(result) << "\n";
    out_ << "  type: " << classifier::EncryptionTypeName(result.encryption_type) << "\n";
    out_ << "  reason: " << result.reason << "\n";
    out_ << "  has DEK: " << YesNo(result.metadata.has_dek) << ", legacy keys: "
         << YesNo(result.metadata.has_legacy_keys) << "\n";
    if (result.metadata.file_signature) {
        out_ << "  signature: " << *result.metadata.file_signature << "\n";
    }
    if (result.metadata.entropy) {
        out_ << "  entropy: " << *result.metadata.entropy << "\n";
    }
    out_ << "  decryptable: " << YesNo(verdict.can_decrypt) << " (" << verdict.reason << ")\n";
    return result;
}

bool DiagnosticsPort::ValidateKeyDerivation(std::string_view password, const Bytes& salt, std::uint32_t iterations) {
    out_ << "Key derivation check (" << iterations << " iterations, " << salt.size() << "-byte salt)\n";
    try {
        crypto::detail::ScopedSecret first(aead::DeriveExtractableKey(password, salt, iterations));
        crypto::detail::ScopedSecret second(aead::DeriveExtractableKey(password, salt, iterations));
        bool same = crypto::ConstantTimeEquals(first.bytes(), second.bytes());
        out_ << "  key fingerprint: " << format::HexPreview(crypto::Sha256(first.bytes()), kPreviewBytes) << "\n";
        Report("deterministic", same);
        Report("key length", first.bytes().size() == constants::kKeyLen);
        return same && first.bytes().size() == constants::kKeyLen;
    } catch (const EncryptionError& exc) {
        out_ << "  " << cli::Colorize(exc.what(), cli::color::RED, out_) << "\n";
        return false;
    } catch (const std::runtime_error& exc) {
        out_ << "  " << cli::Colorize(exc.what(), cli::color::RED, out_) << "\n";
        return false;
    }
}

bool DiagnosticsPort::RunSelfTest() {
    out_ << "Self-test\n";
    bool all_ok = true;
    auto check = [&](std::string_view name, bool passed) {
        Report(name, passed);
        all_ok = all_ok && passed;
    };

    try {
        SymmetricKey key = SymmetricKey::Generate(false);
        const std::string text = "self-test payload";
        aead::EncryptionResult sealed = aead::EncryptText(text, key);
        aead::DecryptionInput input{sealed.ciphertext, sealed.iv, sealed.auth_tag, &key, std::nullopt};
        check("aead round-trip", aead::DecryptText(input) == text);

        Bytes tampered = base64::Decode(sealed.ciphertext);
        tampered[0] ^= 0x01;
        input.ciphertext = base64::Encode(tampered);
        bool rejected = false;
        try {
            aead::Decrypt(input);
        } catch (const DecryptionError&) {
            rejected = true;
        }
        check("aead tamper detection", rejected);
    } catch (const EncryptionError& exc) {
        log::Error(std::string("aead self-test: ") + exc.what());
        check("aead", false);
    }

    check("dek wrap/unwrap", dek::TestDekFunctionality());

    try {
        const std::string password = base64::Encode(crypto::RandomBytes(12));
        const std::string body = "container self-test";
        Bytes plaintext(body.begin(), body.end());
        container::EncryptedContainer created = container::Create(plaintext, "selftest.txt", "text/plain", password);
        container::DecryptedContainer opened = container::Decrypt(created.wrapped_data, password);
        check("container round-trip", opened.plaintext == plaintext && opened.original_filename == "selftest.txt");
        check("container detection", container::IsContainer(created.wrapped_data));
    } catch (const EncryptionError& exc) {
        log::Error(std::string("container self-test: ") + exc.what());
        check("container", false);
    } catch (const std::runtime_error& exc) {
        log::Error(std::string("container self-test: ") + exc.what());
        check("container", false);
    }

    Bytes zeros(constants::kAnalysisWindow, 0);
    classifier::DetectionResult blank = classifier::DetectEncryptionStatus(classifier::DocumentRecord{}, zeros);
    check("classifier low entropy", !blank.is_encrypted);

    out_ << (all_ok ? cli::Colorize("All checks passed", cli::color::BOLD_GREEN, out_)
                    : cli::Colorize("Some checks failed", cli::color::BOLD_RED, out_))
         << "\n";
    return all_ok;
}

}  // namespace vaultcrypt::diagnostics
