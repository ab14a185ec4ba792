#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vaultcrypt::constants {

inline constexpr std::string_view kAlgorithm = "AES-GCM";
inline constexpr std::string_view kKdfAlgorithm = "PBKDF2";

inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kIvLen = 12;
inline constexpr std::size_t kTagLen = 16;
inline constexpr std::size_t kSaltLen = 32;
inline constexpr std::size_t kMinSaltLen = 16;

inline constexpr std::uint32_t kMinIterations = 100000;
inline constexpr std::uint32_t kRecommendedIterations = 500000;
inline constexpr std::uint32_t kContainerIterations = 100000;

inline constexpr std::string_view kDekIdPrefix = "dek:";
inline constexpr std::size_t kDekIdRandomLen = 12;
inline constexpr std::uint32_t kDekVersion = 1;

inline constexpr std::string_view kContainerSignature = "DOCSAFE_ENC";
inline constexpr std::uint32_t kContainerVersion = 1;
inline constexpr std::string_view kContainerExtension = ".docsafe";
inline constexpr std::size_t kContainerLengthPrefix = 4;

inline constexpr std::size_t kMinCiphertextLen = 32;
inline constexpr double kMinNonZeroRatio = 0.1;

inline constexpr std::size_t kAnalysisWindow = 2048;
inline constexpr std::size_t kTextSampleLen = 500;
inline constexpr std::size_t kMinTextLen = 50;

inline constexpr double kZeroKnowledgeConfidence = 1.0;
inline constexpr double kLegacyConfidence = 0.95;
inline constexpr double kSignatureConfidence = 0.95;
inline constexpr double kTextConfidence = 0.9;
inline constexpr double kDatabaseFlagConfidence = 0.3;
inline constexpr double kMinDecryptConfidence = 0.5;

inline constexpr std::string_view kValidationPrefix = "validation:";

inline constexpr std::string_view kLogLevelEnv = "VAULTCRYPT_LOG_LEVEL";
inline constexpr std::string_view kNoColorEnv = "VAULTCRYPT_NO_COLOR";
inline constexpr std::string_view kMasterKdfItersEnv = "VAULTCRYPT_MASTER_KDF_ITERS";

}  // namespace vaultcrypt::constants
