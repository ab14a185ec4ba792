#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::classifier {

using Bytes = std::vector<std::uint8_t>;

enum class EncryptionType {
    kZeroKnowledge,
    kLegacy,
    kNone,
};

// "zero-knowledge", "legacy", "none"
std::string_view EncryptionTypeName(EncryptionType type);

// Storage-side view of a document. Empty strings count as absent.
struct DocumentRecord {
    std::string id;
    std::string name;
    std::optional<std::string> mime_type;
    std::optional<std::uint64_t> file_size;
    std::optional<std::string> encrypted_dek;
    std::optional<std::string> encryption_iv;
    std::optional<std::string> encryption_key_id;
    std::optional<std::string> encryption_auth_tag;
    std::optional<bool> is_encrypted;
};

struct DetectionMetadata {
    bool has_dek = false;
    bool has_legacy_keys = false;
    std::optional<std::string> file_signature;
    std::optional<double> entropy;
};

struct DetectionResult {
    bool is_encrypted = false;
    EncryptionType encryption_type = EncryptionType::kNone;
    double confidence = 0.0;
    std::string reason;
    DetectionMetadata metadata;
};

struct FileAnalysis {
    bool likely_encrypted = false;
    double entropy = 0.0;
    std::optional<std::string> file_signature;
    double confidence = 0.0;
};

struct DecryptionVerdict {
    bool can_decrypt = false;
    std::string reason;
};

// Metadata first, then content, then the database flag. Never throws for
// unknown input; weak evidence yields low confidence.
DetectionResult DetectEncryptionStatus(const DocumentRecord& document);
DetectionResult DetectEncryptionStatus(const DocumentRecord& document, const Bytes& data);

// Looks at the first 2 KB only.
FileAnalysis AnalyzeFileContent(const Bytes& data);

// Shannon entropy in bits per byte, 0.0 for empty input.
double CalculateEntropy(const Bytes& data);

bool IsLikelyText(const Bytes& data);

DecryptionVerdict ValidateDecryptionPossible(const DocumentRecord& document, const DetectionResult& result);

std::string GetEncryptionStatusDescription(const DetectionResult& result);

}  // namespace vaultcrypt::classifier
