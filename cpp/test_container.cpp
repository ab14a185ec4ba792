#include "test_support.hpp"

#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/container.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/file_io.hpp"
#include "vaultcrypt/format.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace vaultcrypt;
using vaultcrypt::test::Check;
using vaultcrypt::test::Contains;
using vaultcrypt::test::ErrorCodeOf;
using vaultcrypt::test::MessageOf;
using vaultcrypt::test::Section;
using vaultcrypt::test::ToBytes;

namespace {

using Bytes = std::vector<std::uint8_t>;

constexpr const char* kPassword = "correct horse battery staple";

Bytes Assemble(const std::string& header_json, const Bytes& ciphertext, const Bytes& tag) {
    Bytes out;
    format::PutU32Le(out, static_cast<std::uint32_t>(header_json.size()));
    out.insert(out.end(), header_json.begin(), header_json.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

container::Header SampleHeader() {
    container::Header header;
    header.signature = "DOCSAFE_ENC";
    header.version = 1;
    header.original_filename = "a.txt";
    header.original_mime_type = "text/plain";
    header.original_size = 4;
    header.encrypted_size = 4;
    header.salt = base64::Encode(Bytes(32, 1));
    header.iv = base64::Encode(Bytes(12, 2));
    header.created_at = "2026-10-17T08:00:00.000Z";
    return header;
}

void TestRoundTrip() {
    Section("round-trip");
    const Bytes plaintext = ToBytes("%PDF-1.7 pretend this is a report");
    container::EncryptedContainer created = container::Create(plaintext, "report.pdf", "application/pdf", kPassword);

    const std::uint32_t header_len = format::ReadU32Le(created.wrapped_data, 0);
    std::string header_json(created.wrapped_data.begin() + 4, created.wrapped_data.begin() + 4 + header_len);
    Check(header_json.rfind("{\"signature\":\"DOCSAFE_ENC\",\"version\":1,\"originalFilename\":\"report.pdf\"", 0) == 0,
          "header field order");
    Check(header_json == container::SerializeHeader(created.header), "header is the serialized header");
    Check(created.header.encrypted_size == plaintext.size() && created.ciphertext.size() == plaintext.size(),
          "encryptedSize equals ciphertext length");
    Check(created.wrapped_data.size() == 4 + header_len + plaintext.size() + 16, "layout length");
    Check(Bytes(created.wrapped_data.end() - 16, created.wrapped_data.end()) == created.auth_tag, "tag trails");
    Check(base64::Decode(created.header.salt).size() == 32 && base64::Decode(created.header.iv).size() == 12,
          "salt and iv sizes");

    container::DecryptedContainer opened = container::Decrypt(created.wrapped_data, kPassword);
    Check(opened.plaintext == plaintext, "plaintext restored");
    Check(opened.original_filename == "report.pdf" && opened.original_mime_type == "application/pdf",
          "file name and type restored");

    container::EncryptedContainer again = container::Create(plaintext, "report.pdf", "application/pdf", kPassword);
    Check(again.header.salt != created.header.salt && again.header.iv != created.header.iv, "fresh salt and iv");

    container::EncryptedContainer empty = container::Create({}, "empty.bin", "application/octet-stream", kPassword);
    Check(container::Decrypt(empty.wrapped_data, kPassword).plaintext.empty(), "empty file round-trip");

    container::EncryptedContainer quoted = container::Create(plaintext, "we\"ird\\name.txt", "text/plain", kPassword);
    Check(container::Decrypt(quoted.wrapped_data, kPassword).original_filename == "we\"ird\\name.txt",
          "escaped file name round-trip");
}

void TestAuthentication() {
    Section("authentication");
    const Bytes plaintext = ToBytes("secret minutes");
    container::EncryptedContainer created = container::Create(plaintext, "minutes.txt", "text/plain", kPassword);

    auto wrong = MessageOf<AuthenticationError>([&] { container::Decrypt(created.wrapped_data, "hunter2"); });
    Check(wrong == std::string("Incorrect password or corrupted file"), "wrong password");

    Bytes tampered = created.wrapped_data;
    tampered[tampered.size() - 20] ^= 0x01;
    auto flipped = MessageOf<AuthenticationError>([&] { container::Decrypt(tampered, kPassword); });
    Check(flipped == wrong, "tampered ciphertext reads the same as a wrong password");

    Bytes bad_tag = created.wrapped_data;
    bad_tag.back() ^= 0x80;
    Check(ErrorCodeOf([&] { container::Decrypt(bad_tag, kPassword); }) == ErrorCode::kAuthentication, "tampered tag");
}

void TestParseFailures() {
    Section("parse failures");
    const Bytes plaintext = ToBytes("truncate me");
    container::EncryptedContainer created = container::Create(plaintext, "t.txt", "text/plain", kPassword);

    Bytes truncated(created.wrapped_data.begin(), created.wrapped_data.end() - 1);
    auto short_msg = MessageOf<CorruptionError>([&] { container::Parse(truncated); });
    Check(short_msg && Contains(*short_msg, "expected " + std::to_string(created.wrapped_data.size()) + " bytes, got "
                                                + std::to_string(truncated.size())),
          "truncation is a length mismatch");
    Bytes extended = created.wrapped_data;
    extended.push_back(0);
    Check(ErrorCodeOf([&] { container::Parse(extended); }) == ErrorCode::kCorruption, "trailing byte");

    Check(ErrorCodeOf([] { container::Parse(Bytes{1, 0}); }) == ErrorCode::kUnsupportedFormat, "under four bytes");
    auto overflow = MessageOf<UnsupportedFormatError>([] { container::Parse(Bytes{0xFF, 0, 0, 0, '{', '}'}); });
    Check(overflow == std::string("Invalid encrypted file: header extends beyond file"), "header overflow");
    std::string not_json = "not json";
    Check(ErrorCodeOf([&] { container::Parse(Assemble(not_json, {}, {})); }) == ErrorCode::kUnsupportedFormat,
          "malformed header json");

    container::Header foreign = SampleHeader();
    foreign.signature = "OTHER";
    auto signature = MessageOf<UnsupportedFormatError>(
        [&] { container::Parse(Assemble(container::SerializeHeader(foreign), Bytes(4, 7), Bytes(16, 8))); });
    Check(signature == std::string("Invalid encrypted file: unrecognized signature"), "foreign signature");

    container::Header short_iv = SampleHeader();
    short_iv.iv = base64::Encode(Bytes(8, 2));
    Check(ErrorCodeOf([&] {
              container::Parse(Assemble(container::SerializeHeader(short_iv), Bytes(4, 7), Bytes(16, 8)));
          }) == ErrorCode::kCorruption,
          "mis-sized iv");

    container::Header bad_salt = SampleHeader();
    bad_salt.salt = "***";
    Check(ErrorCodeOf([&] {
              container::Parse(Assemble(container::SerializeHeader(bad_salt), Bytes(4, 7), Bytes(16, 8)));
          }) == ErrorCode::kCorruption,
          "malformed salt");

    std::string mistyped = container::SerializeHeader(SampleHeader());
    mistyped.replace(mistyped.find("\"originalSize\":4"), 16, "\"originalSize\":\"4\"");
    Check(ErrorCodeOf([&] { container::Parse(Assemble(mistyped, Bytes(4, 7), Bytes(16, 8))); })
              == ErrorCode::kCorruption,
          "mistyped size field");

    container::ParsedContainer parsed =
        container::Parse(Assemble(container::SerializeHeader(SampleHeader()), Bytes(4, 7), Bytes(16, 8)));
    Check(parsed.ciphertext == Bytes(4, 7) && parsed.auth_tag == Bytes(16, 8) && parsed.iv == Bytes(12, 2),
          "hand-built container parses");
}

void TestSizeMismatch() {
    Section("size mismatch");
    const Bytes plaintext = ToBytes("twelve bytes");
    container::EncryptedContainer created = container::Create(plaintext, "s.txt", "text/plain", kPassword);
    container::Header lying = created.header;
    lying.original_size = 99;
    Bytes rebuilt = Assemble(container::SerializeHeader(lying), created.ciphertext, created.auth_tag);
    auto mismatch = MessageOf<CorruptionError>([&] { container::Decrypt(rebuilt, kPassword); });
    Check(mismatch == std::string("Decrypted size mismatch: expected 99, got 12"), "original size enforced");
}

void TestInspection() {
    Section("inspection");
    container::EncryptedContainer created = container::Create(ToBytes("peek"), "p.txt", "text/plain", kPassword);
    Check(container::IsContainer(created.wrapped_data), "container recognised");
    Check(!container::IsContainer(ToBytes("%PDF-1.4")), "pdf is not a container");
    Check(!container::IsContainer({}), "empty is not a container");
    Check(!container::IsContainer(crypto::RandomBytes(256)), "random bytes are not a container");

    auto info = container::PeekInfo(created.wrapped_data);
    Check(info && info->original_filename == "p.txt" && info->original_size == 4 && info->encrypted_size == 4
              && info->version == 1,
          "peek without password");
    Check(!container::PeekInfo(ToBytes("junk")).has_value(), "peek on junk");
    Check(container::DefaultExportName("a.pdf") == "a.pdf.docsafe", "export name");
}

void TestFiles() {
    Section("files");
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("vaultcrypt-test-" + format::HexEncode(crypto::RandomBytes(6)));
    fs::create_directories(dir);
    fs::path source = dir / "notes.txt";
    const Bytes body = ToBytes("file level round-trip");
    WriteFile(source.string(), body);

    std::string exported = container::CreateFile(source.string(), "", kPassword, "text/plain");
    Check(fs::path(exported) == dir / "notes.txt.docsafe", "default export path");
    Check(container::PeekInfo(ReadFile(exported))->original_mime_type == "text/plain", "mime type stored");

    fs::remove(source);
    std::string restored = container::DecryptFile(exported, "", kPassword);
    Check(fs::path(restored) == source && ReadFile(restored) == body, "restored beside the container");

    fs::path explicit_out = dir / "copy.txt";
    container::DecryptFile(exported, explicit_out.string(), kPassword);
    Check(ReadFile(explicit_out.string()) == body, "explicit output path");
    Check(ErrorCodeOf([&] { container::DecryptFile(exported, explicit_out.string(), "wrong"); })
              == ErrorCode::kAuthentication,
          "file decrypt with wrong password");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

}  // namespace

int main() {
    try {
        TestRoundTrip();
        TestAuthentication();
        TestParseFailures();
        TestSizeMismatch();
        TestInspection();
        TestFiles();
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
    return vaultcrypt::test::Finish("test_container");
}
