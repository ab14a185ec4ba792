#include "vaultcrypt/dek.hpp"

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/crypto_utils.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/format.hpp"
#include "vaultcrypt/json.hpp"
#include "vaultcrypt/log.hpp"

#include <stdexcept>
#include <utility>

namespace vaultcrypt::dek {

namespace {

constexpr std::string_view kSelfTestDocument = "Test document content for DEK testing";

std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

bool IsStrictBase64(const std::string& value) {
    return base64::MatchesStandardAlphabet(value) && base64::IsValid(value);
}

// Unwraps to raw key bytes. The caller wipes them.
Bytes UnwrapRaw(const DekInfo& info, const SymmetricKey& master_key) {
    std::vector<std::string> issues = ValidateDekInfo(info);
    if (!issues.empty()) {
        throw DEKDecryptionError("invalid DEK info: " + Join(issues, "; "));
    }
    aead::DecryptionInput input;
    input.ciphertext = info.encrypted_dek;
    input.iv = info.dek_iv;
    input.auth_tag = info.dek_auth_tag;
    input.key = &master_key;
    Bytes raw;
    try {
        raw = aead::Decrypt(input);
    } catch (const EncryptionError& exc) {
        log::Debug("unwrap of " + info.dek_id + " failed");
        throw DEKDecryptionError(exc.what());
    }
    if (raw.size() != constants::kKeyLen) {
        std::size_t size = raw.size();
        crypto::Cleanse(raw);
        throw DEKDecryptionError("unwrapped key is " + std::to_string(size) + " bytes");
    }
    return raw;
}

DekInfo Wrap(const Bytes& raw, const SymmetricKey& master_key) {
    aead::EncryptionResult wrapped = aead::Encrypt(raw, master_key);
    DekInfo info;
    info.encrypted_dek = std::move(wrapped.ciphertext);
    info.dek_iv = std::move(wrapped.iv);
    info.dek_auth_tag = std::move(wrapped.auth_tag);
    info.algorithm = std::string(constants::kAlgorithm);
    info.key_length = static_cast<std::uint32_t>(constants::kKeyLen);
    return info;
}

}  // namespace

SymmetricKey GenerateDek() {
    try {
        return SymmetricKey::Generate(true);
    } catch (const EncryptionError& exc) {
        throw DEKGenerationError(exc.what());
    }
}

std::string GenerateDekId() {
    std::string suffix;
    while (suffix.size() < constants::kDekIdRandomLen) {
        std::string chunk = base64::Encode(crypto::RandomBytes(constants::kDekIdRandomLen));
        for (char ch : chunk) {
            if (ch == '+' || ch == '/' || ch == '=') {
                continue;
            }
            suffix.push_back(ch);
            if (suffix.size() == constants::kDekIdRandomLen) {
                break;
            }
        }
    }
    return std::string(constants::kDekIdPrefix) + format::ToBase36(format::UnixMillis()) + "_" + suffix;
}

DekInfo EncryptDek(const SymmetricKey& dek, const SymmetricKey& master_key, const std::optional<std::string>& dek_id) {
    DekInfo info;
    try {
        crypto::detail::ScopedSecret raw(dek.ExportRaw());
        info = Wrap(raw.bytes(), master_key);
        info.dek_id = dek_id.has_value() ? *dek_id : GenerateDekId();
    } catch (const EncryptionError& exc) {
        throw DEKError(std::string("DEK encryption failed: ") + exc.what());
    } catch (const std::runtime_error& exc) {
        throw DEKError(std::string("DEK encryption failed: ") + exc.what());
    }
    info.version = constants::kDekVersion;
    info.created_at = format::UtcTimestamp();
    log::Debug("wrapped DEK " + info.dek_id);
    return info;
}

SymmetricKey DecryptDek(const DekInfo& info, const SymmetricKey& master_key) {
    crypto::detail::ScopedSecret raw(UnwrapRaw(info, master_key));
    return SymmetricKey::Import(raw.bytes(), false);
}

DocumentEncryptionData EncryptDocumentWithDek(const Bytes& plaintext, const SymmetricKey& dek, const DekInfo& info) {
    aead::EncryptionResult sealed = aead::Encrypt(plaintext, dek);
    DocumentEncryptionData data;
    data.ciphertext = std::move(sealed.ciphertext);
    data.iv = std::move(sealed.iv);
    data.auth_tag = std::move(sealed.auth_tag);
    data.dek_info = info;
    return data;
}

Bytes DecryptDocumentWithDek(const EncryptedPayload& payload, const SymmetricKey& dek) {
    aead::DecryptionInput input;
    input.ciphertext = payload.ciphertext;
    input.iv = payload.iv;
    input.auth_tag = payload.auth_tag;
    input.key = &dek;
    return aead::Decrypt(input);
}

DocumentEncryption CreateDocumentEncryption(const Bytes& plaintext,
                                            const SymmetricKey& master_key,
                                            const std::optional<std::string>& dek_id) {
    SymmetricKey dek = GenerateDek();
    DekInfo info = EncryptDek(dek, master_key, dek_id);
    DocumentEncryption result;
    result.encrypted_document = EncryptDocumentWithDek(plaintext, dek, info);
    result.dek_info = std::move(info);
    return result;
}

Bytes DecryptDocumentWithMasterKey(const EncryptedPayload& payload,
                                   std::string_view dek_info_json,
                                   const SymmetricKey& master_key) {
    try {
        DekInfo info = ParseDekInfo(dek_info_json);
        SymmetricKey dek = DecryptDek(info, master_key);
        return DecryptDocumentWithDek(payload, dek);
    } catch (const EncryptionError& exc) {
        log::Debug(std::string("document decryption failed (") + std::string(ErrorCodeName(exc.code())) + "): "
                   + exc.what());
        throw DecryptionError(std::string("Document decryption failed: ") + exc.what());
    }
}

DekInfo ReencryptDek(const DekInfo& info, const SymmetricKey& old_master_key, const SymmetricKey& new_master_key) {
    crypto::detail::ScopedSecret raw(UnwrapRaw(info, old_master_key));
    DekInfo rotated;
    try {
        rotated = Wrap(raw.bytes(), new_master_key);
    } catch (const EncryptionError& exc) {
        throw DEKError(std::string("DEK re-encryption failed: ") + exc.what());
    }
    rotated.dek_id = info.dek_id;
    rotated.created_at = info.created_at;
    rotated.version = info.version + 1;
    log::Info("rotated DEK " + info.dek_id + " to version " + std::to_string(rotated.version));
    return rotated;
}

DekInfo ParseDekInfo(std::string_view json_text) {
    json::Object object;
    try {
        object = json::Object::Parse(json_text);
    } catch (const std::runtime_error& exc) {
        throw DEKError(std::string("Failed to parse DEK info: ") + exc.what());
    }

    static constexpr std::string_view kStringFields[] = {"dekId",     "encryptedDek", "dekIv",
                                                         "dekAuthTag", "algorithm",    "createdAt"};
    static constexpr std::string_view kNumberFields[] = {"keyLength", "version"};
    static constexpr std::string_view kBase64Fields[] = {"encryptedDek", "dekIv", "dekAuthTag"};

    std::vector<std::string> missing;
    std::vector<std::string> invalid;
    for (std::string_view field : kStringFields) {
        const json::Value* value = object.Find(field);
        if (!value) {
            missing.emplace_back(field);
        } else if (value->type != json::Type::kString) {
            invalid.push_back(std::string(field) + " (type: " + std::string(json::TypeName(value->type)) + ")");
        }
    }
    for (std::string_view field : kNumberFields) {
        const json::Value* value = object.Find(field);
        if (!value) {
            missing.emplace_back(field);
        } else if (value->type != json::Type::kNumber) {
            invalid.push_back(std::string(field) + " (type: " + std::string(json::TypeName(value->type)) + ")");
        } else if (!value->AsUint() || *value->AsUint() > 0xFFFFFFFFull) {
            invalid.push_back(std::string(field) + " (type: number, not a non-negative integer)");
        }
    }

    std::vector<std::string> problems;
    if (!missing.empty()) {
        problems.push_back("Missing required fields: " + Join(missing, ", "));
    }
    if (!invalid.empty()) {
        problems.push_back("Invalid field types: " + Join(invalid, ", "));
    }
    for (std::string_view field : kBase64Fields) {
        const json::Value* value = object.Find(field);
        if (value && value->type == json::Type::kString && !IsStrictBase64(value->text)) {
            problems.push_back("Field " + std::string(field) + " contains invalid base64 data");
        }
    }
    if (!problems.empty()) {
        throw DEKError("Failed to parse DEK info: " + Join(problems, "; "));
    }

    DekInfo info;
    info.dek_id = object.Find("dekId")->text;
    info.encrypted_dek = object.Find("encryptedDek")->text;
    info.dek_iv = object.Find("dekIv")->text;
    info.dek_auth_tag = object.Find("dekAuthTag")->text;
    info.algorithm = object.Find("algorithm")->text;
    info.key_length = static_cast<std::uint32_t>(*object.Find("keyLength")->AsUint());
    info.version = static_cast<std::uint32_t>(*object.Find("version")->AsUint());
    info.created_at = object.Find("createdAt")->text;
    return info;
}

std::string SerializeDekInfo(const DekInfo& info) {
    return json::Writer()
        .String("dekId", info.dek_id)
        .String("encryptedDek", info.encrypted_dek)
        .String("dekIv", info.dek_iv)
        .String("dekAuthTag", info.dek_auth_tag)
        .String("algorithm", info.algorithm)
        .Number("keyLength", info.key_length)
        .Number("version", info.version)
        .String("createdAt", info.created_at)
        .Finish();
}

std::vector<std::string> ValidateDekInfo(const DekInfo& info) {
    std::vector<std::string> errors;
    if (info.dek_id.compare(0, constants::kDekIdPrefix.size(), constants::kDekIdPrefix) != 0) {
        errors.emplace_back("Invalid DEK ID format");
    }
    if (info.encrypted_dek.empty()) {
        errors.emplace_back("Missing encrypted DEK data");
    }
    if (info.dek_iv.empty() || info.dek_auth_tag.empty()) {
        errors.emplace_back("Missing DEK encryption parameters");
    }
    if (info.algorithm != constants::kAlgorithm) {
        errors.push_back("Unsupported algorithm: " + info.algorithm);
    }
    if (info.key_length != constants::kKeyLen) {
        errors.push_back("Invalid key length: " + std::to_string(info.key_length));
    }

    bool encoding_ok = true;
    for (const std::string* field : {&info.encrypted_dek, &info.dek_iv, &info.dek_auth_tag}) {
        if (!field->empty() && !IsStrictBase64(*field)) {
            encoding_ok = false;
        }
    }
    if (!encoding_ok) {
        errors.emplace_back("Invalid base64 encoding in DEK data");
        return errors;
    }
    if (!info.encrypted_dek.empty()) {
        std::size_t size = base64::TryDecode(info.encrypted_dek).size();
        if (size != constants::kKeyLen) {
            errors.push_back("Invalid wrapped DEK length: " + std::to_string(size));
        }
    }
    if (!info.dek_iv.empty()) {
        std::size_t size = base64::TryDecode(info.dek_iv).size();
        if (size != constants::kIvLen) {
            errors.push_back("Invalid DEK IV length: " + std::to_string(size));
        }
    }
    if (!info.dek_auth_tag.empty()) {
        std::size_t size = base64::TryDecode(info.dek_auth_tag).size();
        if (size != constants::kTagLen) {
            errors.push_back("Invalid DEK auth tag length: " + std::to_string(size));
        }
    }
    return errors;
}

DekStats GetDekStats(const DekInfo& info) {
    DekStats stats;
    stats.dek_id = info.dek_id;
    stats.algorithm = info.algorithm;
    stats.key_length = info.key_length;
    stats.version = info.version;
    stats.created_at = info.created_at;
    bool ok = false;
    Bytes wrapped = base64::TryDecode(info.encrypted_dek, &ok);
    stats.wrapped_size = ok ? wrapped.size() : 0;
    return stats;
}

bool TestDekFunctionality() {
    try {
        SymmetricKey master_key = SymmetricKey::Generate(false);
        Bytes document(kSelfTestDocument.begin(), kSelfTestDocument.end());
        DocumentEncryption created = CreateDocumentEncryption(document, master_key);
        Bytes recovered = DecryptDocumentWithMasterKey(created.encrypted_document.payload(),
                                                       SerializeDekInfo(created.dek_info), master_key);
        if (recovered != document) {
            log::Warn("DEK self-test: round-trip mismatch");
            return false;
        }
        return true;
    } catch (const EncryptionError& exc) {
        log::Warn(std::string("DEK self-test failed: ") + exc.what());
        return false;
    }
}

}  // namespace vaultcrypt::dek
