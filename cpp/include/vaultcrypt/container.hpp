#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::container {

using Bytes = std::vector<std::uint8_t>;

// Layout (little-endian):
//   u32 header_len | header JSON | ciphertext (encryptedSize) | 16-byte tag
struct Header {
    std::string signature;
    std::uint32_t version = 0;
    std::string original_filename;
    std::string original_mime_type;
    std::uint64_t original_size = 0;
    std::uint64_t encrypted_size = 0;
    std::string salt;  // base64, 32 bytes
    std::string iv;    // base64, 12 bytes
    std::string created_at;
};

struct EncryptedContainer {
    Header header;
    Bytes ciphertext;
    Bytes auth_tag;
    Bytes wrapped_data;
};

struct ParsedContainer {
    Header header;
    Bytes salt;
    Bytes iv;
    Bytes ciphertext;
    Bytes auth_tag;
};

struct DecryptedContainer {
    Bytes plaintext;
    std::string original_filename;
    std::string original_mime_type;
};

struct ContainerInfo {
    std::string original_filename;
    std::string original_mime_type;
    std::uint64_t original_size = 0;
    std::uint64_t encrypted_size = 0;
    std::uint32_t version = 0;
    std::string created_at;
};

// Fresh salt and IV per call, PBKDF2 at 100,000 iterations.
EncryptedContainer Create(const Bytes& plaintext,
                          std::string_view filename,
                          std::string_view mime_type,
                          std::string_view password);

// Throws UnsupportedFormatError for foreign data and CorruptionError for a
// recognised container that is damaged.
ParsedContainer Parse(const Bytes& data);

// Wrong password and tampered data both throw AuthenticationError.
DecryptedContainer Decrypt(const Bytes& data, std::string_view password);

bool IsContainer(const Bytes& data);
std::optional<ContainerInfo> PeekInfo(const Bytes& data);

std::string SerializeHeader(const Header& header);
std::string DefaultExportName(std::string_view filename);

// Returns the path written. An empty output path puts the container next to
// the input as <name>.docsafe.
std::string CreateFile(const std::string& input_path,
                       const std::string& output_path,
                       std::string_view password,
                       std::string_view mime_type = "application/octet-stream");

// Returns the path written. An empty output path restores the stored file
// name, reduced to its last component, beside the container.
std::string DecryptFile(const std::string& input_path, const std::string& output_path, std::string_view password);

}  // namespace vaultcrypt::container
