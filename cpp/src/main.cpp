#include "vaultcrypt/classifier.hpp"
#include "vaultcrypt/cli_colors.hpp"
#include "vaultcrypt/constants.hpp"
#include "vaultcrypt/container.hpp"
#include "vaultcrypt/diagnostics.hpp"
#include "vaultcrypt/env.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/file_io.hpp"
#include "vaultcrypt/log.hpp"
#include "vaultcrypt/session.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  vaultcrypt export <file> -p <password> [--out <path>] [--mime <type>]\n";
    std::cout << "  vaultcrypt import <file.docsafe> -p <password> [--out <path>]\n";
    std::cout << "  vaultcrypt info <file.docsafe>\n";
    std::cout << "  vaultcrypt detect <file>\n";
    std::cout << "  vaultcrypt entropy <file>\n";
    std::cout << "  vaultcrypt selftest\n";
    std::cout << "Global flags: --no-color, --verbose\n";
}

struct FileArgs {
    std::string input;
    std::string output;
    std::string password;
    std::string mime_type = "application/octet-stream";
};

FileArgs ParseFileArgs(const std::vector<std::string>& args, bool allow_mime) {
    FileArgs opts;
    if (args.size() < 2) {
        throw UsageError("Missing input path");
    }
    opts.input = args[1];
    std::size_t idx = 2;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (flag == "-p" || flag == "--password") {
            if (idx + 1 >= args.size()) {
                throw UsageError("Missing password value");
            }
            opts.password = args[idx + 1];
            idx += 2;
        } else if (flag == "--out" || flag == "-o") {
            if (idx + 1 >= args.size()) {
                throw UsageError("Missing output path");
            }
            opts.output = args[idx + 1];
            idx += 2;
        } else if (allow_mime && flag == "--mime") {
            if (idx + 1 >= args.size()) {
                throw UsageError("Missing mime type");
            }
            opts.mime_type = args[idx + 1];
            idx += 2;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.password.empty()) {
        throw UsageError("Password is required");
    }
    return opts;
}

const std::string& RequirePath(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        throw UsageError("Expected exactly one path");
    }
    return args[1];
}

std::string Fixed(double value, int precision) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return std::string(buffer);
}

void ApplyEnvironment() {
    using namespace vaultcrypt;
    if (env::IsEnabled(constants::kNoColorEnv)) {
        cli::SetColorsEnabled(false);
    }
    std::string level = env::Get(constants::kLogLevelEnv);
    if (!level.empty()) {
        if (auto parsed = log::LevelFromString(level)) {
            log::SetLevel(*parsed);
        } else {
            log::Warn("ignoring unknown " + std::string(constants::kLogLevelEnv) + " value: " + level);
        }
    }
}

std::uint32_t MasterKdfIterations() {
    using namespace vaultcrypt;
    std::optional<std::uint32_t> configured = env::GetUint(constants::kMasterKdfItersEnv);
    if (!configured) {
        return constants::kRecommendedIterations;
    }
    if (*configured < constants::kMinIterations) {
        log::Warn(std::string(constants::kMasterKdfItersEnv) + " below " + std::to_string(constants::kMinIterations)
                  + " ignored");
        return constants::kRecommendedIterations;
    }
    return *configured;
}

int RunExport(const std::vector<std::string>& args) {
    FileArgs opts = ParseFileArgs(args, true);
    std::string written = vaultcrypt::container::CreateFile(opts.input, opts.output, opts.password, opts.mime_type);
    std::cout << written << "\n";
    return 0;
}

int RunImport(const std::vector<std::string>& args) {
    FileArgs opts = ParseFileArgs(args, false);
    std::string written = vaultcrypt::container::DecryptFile(opts.input, opts.output, opts.password);
    std::cout << written << "\n";
    return 0;
}

int RunInfo(const std::vector<std::string>& args) {
    const std::string& path = RequirePath(args);
    auto info = vaultcrypt::container::PeekInfo(vaultcrypt::ReadFile(path));
    if (!info) {
        std::cerr << vaultcrypt::cli::Colorize("Error:", vaultcrypt::cli::color::RED, std::cerr) << " " << path
                  << " is not an encrypted container\n";
        return 1;
    }
    std::cout << "original_filename: " << info->original_filename << "\n";
    std::cout << "original_mime_type: " << info->original_mime_type << "\n";
    std::cout << "original_size: " << info->original_size << " bytes\n";
    std::cout << "encrypted_size: " << info->encrypted_size << " bytes\n";
    std::cout << "version: " << info->version << "\n";
    std::cout << "created_at: " << info->created_at << "\n";
    return 0;
}

int RunDetect(const std::vector<std::string>& args) {
    using namespace vaultcrypt;
    const std::string& path = RequirePath(args);
    std::vector<std::uint8_t> data = ReadFile(path);
    if (container::IsContainer(data)) {
        std::cout << cli::Verdict("Encrypted container", true) << " (" << constants::kContainerExtension << ")\n";
        return 0;
    }
    classifier::DocumentRecord record;
    record.id = path;
    record.name = std::filesystem::path(path).filename().string();
    record.file_size = data.size();
    classifier::DetectionResult result = classifier::DetectEncryptionStatus(record, data);
    std::string status = classifier::GetEncryptionStatusDescription(result);
    std::cout << cli::Verdict(status, result.is_encrypted) << "\n";
    std::cout << "type: " << classifier::EncryptionTypeName(result.encryption_type) << "\n";
    std::cout << "confidence: " << Fixed(result.confidence, 2) << "\n";
    std::cout << "reason: " << result.reason << "\n";
    if (result.metadata.file_signature) {
        std::cout << "signature: " << *result.metadata.file_signature << "\n";
    }
    if (result.metadata.entropy) {
        std::cout << "entropy: " << Fixed(*result.metadata.entropy, 4) << "\n";
    }
    return 0;
}

int RunEntropy(const std::vector<std::string>& args) {
    using namespace vaultcrypt;
    const std::string& path = RequirePath(args);
    std::vector<std::uint8_t> data = ReadFile(path);
    classifier::FileAnalysis analysis = classifier::AnalyzeFileContent(data);
    std::cout << "entropy: " << Fixed(classifier::CalculateEntropy(data), 4) << " bits/byte\n";
    std::cout << "header_entropy: " << Fixed(analysis.entropy, 4) << " bits/byte\n";
    std::cout << "likely_encrypted: " << (analysis.likely_encrypted ? "yes" : "no") << "\n";
    return 0;
}

int RunSelfTest() {
    using namespace vaultcrypt;
    diagnostics::DiagnosticsPort port(std::cout);
    bool ok = port.RunSelfTest();

    session::KdfOptions kdf;
    kdf.iterations = MasterKdfIterations();
    ok = port.ValidateKeyDerivation("selftest-password", session::NewSalt(kdf), kdf.iterations) && ok;
    return ok ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    bool verbose = false;
    bool no_color = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            no_color = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            args.push_back(std::move(arg));
        }
    }
    ApplyEnvironment();
    if (no_color) {
        vaultcrypt::cli::SetColorsEnabled(false);
    }
    if (verbose) {
        vaultcrypt::log::SetLevel(vaultcrypt::log::Level::kDebug);
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }

    const std::string& command = args[0];
    try {
        if (command == "export") {
            return RunExport(args);
        }
        if (command == "import") {
            return RunImport(args);
        }
        if (command == "info") {
            return RunInfo(args);
        }
        if (command == "detect") {
            return RunDetect(args);
        }
        if (command == "entropy") {
            return RunEntropy(args);
        }
        if (command == "selftest") {
            return RunSelfTest();
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const vaultcrypt::EncryptionError& exc) {
        vaultcrypt::log::Debug(std::string(vaultcrypt::ErrorCodeName(exc.code())) + ": " + exc.what());
        std::cerr << "Error: " << exc.UserMessage() << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
