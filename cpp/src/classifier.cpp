#include "vaultcrypt/classifier.hpp"

#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/log.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <utility>

namespace vaultcrypt::classifier {

namespace {

constexpr double kLowEntropy = 5.0;
constexpr double kHighEntropy = 7.5;
constexpr double kVeryHighEntropy = 7.8;
constexpr double kLowEntropyConfidence = 0.8;
constexpr double kAmbiguousConfidence = 0.4;

constexpr double kMinPrintableRatio = 0.8;
constexpr double kMinWhitespaceRatio = 0.05;
constexpr double kMaxWhitespaceRatio = 0.5;

struct Signature {
    const char* name;
    std::array<std::uint8_t, 8> magic;
    std::size_t length;
};

constexpr Signature kSignatures[] = {
    {"PDF", {0x25, 0x50, 0x44, 0x46}, 4},
    {"ZIP/Office", {0x50, 0x4B, 0x03, 0x04}, 4},
    {"OLE2/Office", {0xD0, 0xCF, 0x11, 0xE0}, 4},
    {"JPEG", {0xFF, 0xD8, 0xFF}, 3},
    {"PNG", {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 8},
    {"GIF87a", {0x47, 0x49, 0x46, 0x38, 0x37, 0x61}, 6},
    {"GIF89a", {0x47, 0x49, 0x46, 0x38, 0x39, 0x61}, 6},
    {"BMP", {0x42, 0x4D}, 2},
    {"TIFF", {0x49, 0x49, 0x2A, 0x00}, 4},
    {"TIFF", {0x4D, 0x4D, 0x00, 0x2A}, 4},
    {"RTF", {0x7B, 0x5C, 0x72, 0x74, 0x66}, 5},
};

bool Present(const std::optional<std::string>& field) {
    return field.has_value() && !field->empty();
}

std::optional<std::string> MatchSignature(const Bytes& header) {
    for (const Signature& signature : kSignatures) {
        if (header.size() >= signature.length
            && std::equal(signature.magic.begin(), signature.magic.begin() + signature.length, header.begin())) {
            return std::string(signature.name);
        }
    }
    return std::nullopt;
}

std::string FormatFixed(double value, int precision) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return std::string(buffer);
}

DetectionResult FromMetadata(const DocumentRecord& document, bool* decided) {
    DetectionResult result;
    result.metadata.has_dek = Present(document.encrypted_dek);
    result.metadata.has_legacy_keys = Present(document.encryption_key_id) && Present(document.encryption_iv)
                                      && Present(document.encryption_auth_tag);
    *decided = true;
    if (result.metadata.has_dek && Present(document.encryption_iv)) {
        result.is_encrypted = true;
        result.encryption_type = EncryptionType::kZeroKnowledge;
        result.confidence = constants::kZeroKnowledgeConfidence;
        result.reason = "Document has DEK and IV metadata (zero-knowledge encryption)";
        return result;
    }
    if (result.metadata.has_legacy_keys) {
        result.is_encrypted = true;
        result.encryption_type = EncryptionType::kLegacy;
        result.confidence = constants::kLegacyConfidence;
        result.reason = "Document has legacy encryption metadata (key_id, IV, auth_tag)";
        return result;
    }
    *decided = false;
    return result;
}

DetectionResult FromDatabaseFlag(const DocumentRecord& document, DetectionResult result) {
    const bool flagged = document.is_encrypted.value_or(false);
    result.is_encrypted = flagged;
    result.encryption_type = flagged ? EncryptionType::kLegacy : EncryptionType::kNone;
    result.confidence = constants::kDatabaseFlagConfidence;
    result.reason = std::string("Based on database flag (unreliable) - is_encrypted: ") + (flagged ? "true" : "false");
    log::Debug("classifier fell back to the database flag for " + document.id);
    return result;
}

}  // namespace

std::string_view EncryptionTypeName(EncryptionType type) {
    switch (type) {
        case EncryptionType::kZeroKnowledge: return "zero-knowledge";
        case EncryptionType::kLegacy: return "legacy";
        case EncryptionType::kNone: return "none";
    }
    return "none";
}

double CalculateEntropy(const Bytes& data) {
    if (data.empty()) {
        return 0.0;
    }
    std::array<std::size_t, 256> counts{};
    for (std::uint8_t byte : data) {
        ++counts[byte];
    }
    const double total = static_cast<double>(data.size());
    double entropy = 0.0;
    for (std::size_t count : counts) {
        if (count == 0) {
            continue;
        }
        double p = static_cast<double>(count) / total;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

bool IsLikelyText(const Bytes& data) {
    if (data.size() < constants::kMinTextLen) {
        return false;
    }
    const std::size_t sample = std::min(data.size(), constants::kTextSampleLen);
    std::size_t printable = 0;
    std::size_t whitespace = 0;
    for (std::size_t i = 0; i < sample; ++i) {
        std::uint8_t byte = data[i];
        bool is_space = byte == 9 || byte == 10 || byte == 13 || byte == 32;
        if ((byte >= 32 && byte <= 126) || byte == 9 || byte == 10 || byte == 13) {
            ++printable;
            if (is_space) {
                ++whitespace;
            }
        }
    }
    if (printable == 0) {
        return false;
    }
    double printable_ratio = static_cast<double>(printable) / static_cast<double>(sample);
    double whitespace_ratio = static_cast<double>(whitespace) / static_cast<double>(printable);
    return printable_ratio > kMinPrintableRatio && whitespace_ratio > kMinWhitespaceRatio
           && whitespace_ratio < kMaxWhitespaceRatio;
}

FileAnalysis AnalyzeFileContent(const Bytes& data) {
    const std::size_t window = std::min(data.size(), constants::kAnalysisWindow);
    Bytes header(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(window));

    FileAnalysis analysis;
    analysis.entropy = CalculateEntropy(header);

    if (auto signature = MatchSignature(header)) {
        analysis.file_signature = std::move(signature);
        analysis.confidence = constants::kSignatureConfidence;
        return analysis;
    }
    if (IsLikelyText(header)) {
        analysis.file_signature = "Text";
        analysis.confidence = constants::kTextConfidence;
        return analysis;
    }

    analysis.likely_encrypted = analysis.entropy > kHighEntropy;
    if (analysis.entropy > kVeryHighEntropy) {
        analysis.confidence = 0.9;
    } else if (analysis.entropy > kHighEntropy) {
        analysis.confidence = 0.7;
    } else if (analysis.entropy < kLowEntropy) {
        analysis.confidence = kLowEntropyConfidence;
    } else {
        analysis.confidence = kAmbiguousConfidence;
    }
    return analysis;
}

DetectionResult DetectEncryptionStatus(const DocumentRecord& document) {
    bool decided = false;
    DetectionResult result = FromMetadata(document, &decided);
    if (decided) {
        return result;
    }
    return FromDatabaseFlag(document, std::move(result));
}

DetectionResult DetectEncryptionStatus(const DocumentRecord& document, const Bytes& data) {
    bool decided = false;
    DetectionResult result = FromMetadata(document, &decided);
    if (decided || data.empty()) {
        return decided ? result : FromDatabaseFlag(document, std::move(result));
    }

    FileAnalysis analysis = AnalyzeFileContent(data);
    result.metadata.entropy = analysis.entropy;
    result.metadata.file_signature = analysis.file_signature;
    if (analysis.file_signature) {
        result.confidence = analysis.confidence;
        result.reason = "Detected " + *analysis.file_signature + " file signature - file is unencrypted";
        return result;
    }
    if (analysis.likely_encrypted) {
        result.is_encrypted = true;
        result.encryption_type = EncryptionType::kLegacy;
        result.confidence = analysis.confidence;
        result.reason = "File content analysis suggests encryption (entropy: " + FormatFixed(analysis.entropy, 2) + ")";
        return result;
    }
    if (analysis.entropy < kLowEntropy) {
        result.confidence = kLowEntropyConfidence;
        result.reason = "File content has low entropy (" + FormatFixed(analysis.entropy, 2)
                        + ") - file is unencrypted";
        return result;
    }
    log::Debug("content of " + document.id + " is ambiguous (entropy " + FormatFixed(analysis.entropy, 2) + ")");
    return FromDatabaseFlag(document, std::move(result));
}

DecryptionVerdict ValidateDecryptionPossible(const DocumentRecord& document, const DetectionResult& result) {
    if (!result.is_encrypted) {
        return {false, "Document is not encrypted - no decryption needed"};
    }
    if (result.encryption_type == EncryptionType::kZeroKnowledge
        && (!Present(document.encrypted_dek) || !Present(document.encryption_iv))) {
        return {false, "Zero-knowledge document missing DEK data"};
    }
    if (result.encryption_type == EncryptionType::kLegacy
        && (!Present(document.encryption_key_id) || !Present(document.encryption_iv)
            || !Present(document.encryption_auth_tag))) {
        return {false, "Legacy encrypted document missing required metadata"};
    }
    if (result.confidence < constants::kMinDecryptConfidence) {
        return {false, "Low confidence in encryption detection (" + FormatFixed(result.confidence * 100.0, 0) + "%)"};
    }
    return {true, "Document can be decrypted using " + std::string(EncryptionTypeName(result.encryption_type))
                      + " method"};
}

std::string GetEncryptionStatusDescription(const DetectionResult& result) {
    if (!result.is_encrypted) {
        return "Unencrypted document (" + result.reason + ")";
    }
    const long percent = std::lround(result.confidence * 100.0);
    const char* type = result.encryption_type == EncryptionType::kZeroKnowledge ? "Zero-Knowledge Encrypted"
                                                                                : "Legacy Encrypted";
    return std::string(type) + " (" + std::to_string(percent) + "% confidence)";
}

}  // namespace vaultcrypt::classifier
