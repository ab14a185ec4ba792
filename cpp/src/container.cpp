#include "vaultcrypt/container.hpp"

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/file_io.hpp"
#include "vaultcrypt/format.hpp"
#include "vaultcrypt/json.hpp"
#include "vaultcrypt/log.hpp"

#include <cstddef>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <utility>

namespace vaultcrypt::container {

namespace {

constexpr const char* kAuthFailure = "Incorrect password or corrupted file";

const json::Value& RequireField(const json::Object& object, std::string_view field, json::Type type) {
    const json::Value* value = object.Find(field);
    if (!value || value->type != type) {
        throw CorruptionError("Invalid encrypted file: header field " + std::string(field)
                              + " is missing or mistyped");
    }
    return *value;
}

std::uint64_t RequireUint(const json::Object& object, std::string_view field) {
    std::optional<std::uint64_t> value = RequireField(object, field, json::Type::kNumber).AsUint();
    if (!value) {
        throw CorruptionError("Invalid encrypted file: header field " + std::string(field)
                              + " is not a non-negative integer");
    }
    return *value;
}

Bytes RequireBase64(const std::string& value, std::string_view field, std::size_t expected) {
    bool ok = false;
    Bytes decoded = base64::TryDecode(value, &ok);
    if (!ok) {
        throw CorruptionError("Invalid encrypted file: " + std::string(field) + " is not valid base64");
    }
    if (decoded.size() != expected) {
        throw CorruptionError("Invalid encrypted file: " + std::string(field) + " is "
                              + std::to_string(decoded.size()) + " bytes, expected " + std::to_string(expected));
    }
    return decoded;
}

Header ParseHeader(std::string_view text) {
    json::Object object;
    try {
        object = json::Object::Parse(text);
    } catch (const std::runtime_error& exc) {
        throw UnsupportedFormatError(std::string("Invalid encrypted file: malformed header (") + exc.what() + ")");
    }
    const json::Value* signature = object.Find("signature");
    if (!signature || signature->type != json::Type::kString || signature->text != constants::kContainerSignature) {
        throw UnsupportedFormatError("Invalid encrypted file: unrecognized signature");
    }

    Header header;
    header.signature = signature->text;
    std::uint64_t version = RequireUint(object, "version");
    if (version == 0 || version > constants::kContainerVersion) {
        throw UnsupportedFormatError("Unsupported encrypted file version: " + std::to_string(version));
    }
    header.version = static_cast<std::uint32_t>(version);
    header.original_filename = RequireField(object, "originalFilename", json::Type::kString).text;
    header.original_mime_type = RequireField(object, "originalMimeType", json::Type::kString).text;
    header.original_size = RequireUint(object, "originalSize");
    header.encrypted_size = RequireUint(object, "encryptedSize");
    header.salt = RequireField(object, "salt", json::Type::kString).text;
    header.iv = RequireField(object, "iv", json::Type::kString).text;
    header.created_at = RequireField(object, "createdAt", json::Type::kString).text;
    return header;
}

ContainerInfo ToInfo(const Header& header) {
    ContainerInfo info;
    info.original_filename = header.original_filename;
    info.original_mime_type = header.original_mime_type;
    info.original_size = header.original_size;
    info.encrypted_size = header.encrypted_size;
    info.version = header.version;
    info.created_at = header.created_at;
    return info;
}

}  // namespace

std::string SerializeHeader(const Header& header) {
    return json::Writer()
        .String("signature", header.signature)
        .Number("version", header.version)
        .String("originalFilename", header.original_filename)
        .String("originalMimeType", header.original_mime_type)
        .Number("originalSize", header.original_size)
        .Number("encryptedSize", header.encrypted_size)
        .String("salt", header.salt)
        .String("iv", header.iv)
        .String("createdAt", header.created_at)
        .Finish();
}

EncryptedContainer Create(const Bytes& plaintext,
                          std::string_view filename,
                          std::string_view mime_type,
                          std::string_view password) {
    Bytes salt = aead::GenerateSalt(constants::kSaltLen);
    Bytes iv = aead::GenerateIv();
    SymmetricKey key = aead::DeriveKey(password, salt, constants::kContainerIterations);
    aead::RawCiphertext sealed = aead::EncryptBytes(plaintext, key, iv);

    EncryptedContainer out;
    out.header.signature = std::string(constants::kContainerSignature);
    out.header.version = constants::kContainerVersion;
    out.header.original_filename = std::string(filename);
    out.header.original_mime_type = std::string(mime_type);
    out.header.original_size = plaintext.size();
    out.header.encrypted_size = sealed.ciphertext.size();
    out.header.salt = base64::Encode(salt);
    out.header.iv = base64::Encode(sealed.iv);
    out.header.created_at = format::UtcTimestamp();

    std::string header_json = SerializeHeader(out.header);
    if (header_json.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw EncryptionError("Container header too large");
    }
    out.wrapped_data.reserve(constants::kContainerLengthPrefix + header_json.size() + sealed.ciphertext.size()
                             + sealed.tag.size());
    format::PutU32Le(out.wrapped_data, static_cast<std::uint32_t>(header_json.size()));
    out.wrapped_data.insert(out.wrapped_data.end(), header_json.begin(), header_json.end());
    out.wrapped_data.insert(out.wrapped_data.end(), sealed.ciphertext.begin(), sealed.ciphertext.end());
    out.wrapped_data.insert(out.wrapped_data.end(), sealed.tag.begin(), sealed.tag.end());
    out.ciphertext = std::move(sealed.ciphertext);
    out.auth_tag = std::move(sealed.tag);
    log::Debug("created container for " + out.header.original_filename + " (" + std::to_string(out.wrapped_data.size())
               + " bytes)");
    return out;
}

ParsedContainer Parse(const Bytes& data) {
    if (data.size() < constants::kContainerLengthPrefix) {
        throw UnsupportedFormatError("Invalid encrypted file: too short");
    }
    const std::uint64_t header_len = format::ReadU32Le(data, 0);
    if (constants::kContainerLengthPrefix + header_len > data.size()) {
        throw UnsupportedFormatError("Invalid encrypted file: header extends beyond file");
    }
    auto header_begin = data.begin() + static_cast<std::ptrdiff_t>(constants::kContainerLengthPrefix);
    auto header_end = header_begin + static_cast<std::ptrdiff_t>(header_len);
    std::string header_text(header_begin, header_end);

    ParsedContainer parsed;
    parsed.header = ParseHeader(header_text);
    parsed.salt = RequireBase64(parsed.header.salt, "salt", constants::kSaltLen);
    parsed.iv = RequireBase64(parsed.header.iv, "iv", constants::kIvLen);

    const std::uint64_t offset = constants::kContainerLengthPrefix + header_len;
    const std::uint64_t encrypted_size = parsed.header.encrypted_size;
    const std::uint64_t expected = offset + encrypted_size + constants::kTagLen;
    if (expected != data.size()) {
        throw CorruptionError("Invalid encrypted file: expected " + std::to_string(expected) + " bytes, got "
                              + std::to_string(data.size()));
    }
    auto ct_begin = data.begin() + static_cast<std::ptrdiff_t>(offset);
    auto ct_end = ct_begin + static_cast<std::ptrdiff_t>(encrypted_size);
    parsed.ciphertext.assign(ct_begin, ct_end);
    parsed.auth_tag.assign(ct_end, data.end());
    return parsed;
}

DecryptedContainer Decrypt(const Bytes& data, std::string_view password) {
    ParsedContainer parsed = Parse(data);
    SymmetricKey key = aead::DeriveKey(password, parsed.salt, constants::kContainerIterations);

    DecryptedContainer out;
    try {
        out.plaintext = aead::DecryptBytes(parsed.ciphertext, parsed.auth_tag, parsed.iv, key);
    } catch (const DecryptionError&) {
        log::Debug("container authentication failed for " + parsed.header.original_filename);
        throw AuthenticationError(kAuthFailure);
    }
    if (out.plaintext.size() != parsed.header.original_size) {
        std::size_t actual = out.plaintext.size();
        throw CorruptionError("Decrypted size mismatch: expected " + std::to_string(parsed.header.original_size)
                              + ", got " + std::to_string(actual));
    }
    out.original_filename = std::move(parsed.header.original_filename);
    out.original_mime_type = std::move(parsed.header.original_mime_type);
    return out;
}

bool IsContainer(const Bytes& data) {
    try {
        Parse(data);
        return true;
    } catch (const EncryptionError&) {
        return false;
    }
}

std::optional<ContainerInfo> PeekInfo(const Bytes& data) {
    try {
        return ToInfo(Parse(data).header);
    } catch (const EncryptionError& exc) {
        log::Debug(std::string("not a readable container: ") + exc.what());
        return std::nullopt;
    }
}

std::string DefaultExportName(std::string_view filename) {
    return std::string(filename) + std::string(constants::kContainerExtension);
}

std::string CreateFile(const std::string& input_path,
                       const std::string& output_path,
                       std::string_view password,
                       std::string_view mime_type) {
    std::filesystem::path input(input_path);
    Bytes plaintext = ReadFile(input_path);
    std::string filename = input.filename().string();
    EncryptedContainer created = Create(plaintext, filename, mime_type, password);

    std::string target = output_path;
    if (target.empty()) {
        target = (input.parent_path() / DefaultExportName(filename)).string();
    }
    WriteFile(target, created.wrapped_data);
    return target;
}

std::string DecryptFile(const std::string& input_path, const std::string& output_path, std::string_view password) {
    Bytes data = ReadFile(input_path);
    DecryptedContainer decrypted = Decrypt(data, password);

    std::string target = output_path;
    if (target.empty()) {
        std::filesystem::path stored = std::filesystem::path(decrypted.original_filename).filename();
        if (stored.empty() || stored == "." || stored == "..") {
            throw CorruptionError("Invalid encrypted file: stored filename is unusable; pass an output path");
        }
        target = (std::filesystem::path(input_path).parent_path() / stored).string();
    }
    WriteFile(target, decrypted.plaintext);
    return target;
}

}  // namespace vaultcrypt::container
