#pragma once

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/classifier.hpp"
#include "vaultcrypt/framing.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace vaultcrypt::diagnostics {

using Bytes = std::vector<std::uint8_t>;

struct DecryptionFailure {
    std::string timestamp;
    std::size_t ciphertext_size = 0;
    std::string iv_preview;   // hex
    std::string tag_preview;  // hex
    std::vector<framing::FramingAttempt> attempts;
};

// Troubleshooting entry points. Output goes to the stream given at
// construction; nothing here prints key bytes, passwords or plaintext.
class DiagnosticsPort {
public:
    explicit DiagnosticsPort(std::ostream& out) : out_(out) {}

    aead::IntegrityReport AnalyzeEncryptionData(const aead::DecryptionInput& input);

    // Tries every legacy framing. Records the failure when none succeeds.
    bool TestDecryption(const aead::DecryptionInput& input);

    classifier::DetectionResult DebugDocument(const classifier::DocumentRecord& document, const Bytes* data = nullptr);

    // Derives twice and checks the results agree.
    bool ValidateKeyDerivation(std::string_view password, const Bytes& salt, std::uint32_t iterations);

    bool RunSelfTest();

    const std::optional<DecryptionFailure>& last_failure() const noexcept { return last_failure_; }

private:
    void Report(std::string_view check, bool passed);

    std::ostream& out_;
    std::optional<DecryptionFailure> last_failure_;
};

}  // namespace vaultcrypt::diagnostics
