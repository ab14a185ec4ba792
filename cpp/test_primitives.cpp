#include "test_support.hpp"

#include "vaultcrypt/aead.hpp"
#include "vaultcrypt/base64.hpp"
#include "vaultcrypt/crypto.hpp"
#include "vaultcrypt/errors.hpp"
#include "vaultcrypt/format.hpp"
#include "vaultcrypt/framing.hpp"
#include "vaultcrypt/json.hpp"
#include "vaultcrypt/key.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace vaultcrypt;
using vaultcrypt::test::Check;
using vaultcrypt::test::Contains;
using vaultcrypt::test::ErrorCodeOf;
using vaultcrypt::test::MessageOf;
using vaultcrypt::test::Section;
using vaultcrypt::test::Throws;
using vaultcrypt::test::ToBytes;

namespace {

using Bytes = std::vector<std::uint8_t>;

Bytes Hex(const std::string& hex) {
    Bytes out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

Bytes Salt(std::uint8_t seed) {
    Bytes salt(32);
    for (std::size_t i = 0; i < salt.size(); ++i) {
        salt[i] = static_cast<std::uint8_t>(seed + i);
    }
    return salt;
}

std::string FlipFirstByte(const std::string& encoded) {
    Bytes raw = base64::Decode(encoded);
    raw[0] ^= 0x01;
    return base64::Encode(raw);
}

void TestBase64() {
    Section("base64");
    Check(base64::Encode(ToBytes("hello")) == "aGVsbG8=", "encode hello");
    Check(base64::Decode("aGVsbG8=") == ToBytes("hello"), "decode hello");
    Check(base64::Decode("aGVsbG8") == ToBytes("hello"), "missing padding is restored");
    Check(base64::Decode("  aGVs\nbG8=\t") == ToBytes("hello"), "whitespace ignored");
    Check(base64::Decode("-_8=") == base64::Decode("+/8="), "url-safe alphabet accepted");
    Check(ErrorCodeOf([] { base64::Decode(""); }) == ErrorCode::kBase64Empty, "empty input");
    Check(ErrorCodeOf([] { base64::Decode("   "); }) == ErrorCode::kBase64Empty, "whitespace-only input");
    Check(ErrorCodeOf([] { base64::Decode("#"); }) == ErrorCode::kBase64InvalidCharacters, "invalid character");
    Check(ErrorCodeOf([] { base64::Decode("a"); }) == ErrorCode::kBase64Malformed, "single character");
    Check(ErrorCodeOf([] { base64::Decode("ab=c"); }) == ErrorCode::kBase64Malformed, "padding in the middle");
    Check(ErrorCodeOf([] { base64::Decode("a==="); }) == ErrorCode::kBase64Malformed, "too much padding");

    bool ok = true;
    Bytes decoded = base64::TryDecode("%%%", &ok);
    Check(!ok && decoded.empty(), "TryDecode reports failure");
    Check(base64::IsValid("AAAA") && !base64::IsValid("A"), "IsValid");
    Check(base64::MatchesStandardAlphabet("ab+/cd=="), "standard alphabet accepted");
    Check(!base64::MatchesStandardAlphabet("ab-_"), "url-safe rejected by strict check");
    Check(!base64::MatchesStandardAlphabet("ab=c"), "inner padding rejected by strict check");
}

void TestKnownAnswers() {
    Section("known answers");
    Check(format::HexEncode(crypto::Sha256(ToBytes("abc")))
              == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
          "sha256(abc)");
    Check(format::HexEncode(crypto::Pbkdf2HmacSha256("password", ToBytes("salt"), 1, 32))
              == "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b",
          "pbkdf2-hmac-sha256 c=1");

    Bytes zero_key(32, 0);
    Bytes zero_iv(12, 0);
    crypto::GcmOutput empty = crypto::AesGcmEncrypt(zero_key, zero_iv, {}, {});
    Check(empty.ciphertext.empty() && format::HexEncode(empty.tag) == "530f8afbc74536b9a963b4f1c4cb738b",
          "aes-256-gcm empty plaintext tag");
    crypto::GcmOutput block = crypto::AesGcmEncrypt(zero_key, zero_iv, Bytes(16, 0), {});
    Check(format::HexEncode(block.ciphertext) == "cea7403d4d606b6e074ec5d3baf39d18", "aes-256-gcm one block");
    Check(format::HexEncode(block.tag) == "d0d1c8a799996bf0265b98b5d48ab919", "aes-256-gcm one block tag");
}

void TestKeyDerivation() {
    Section("key derivation");
    const Bytes salt = Salt(1);
    Bytes first = aead::DeriveExtractableKey("correct horse", salt, constants::kMinIterations);
    Bytes second = aead::DeriveExtractableKey("correct horse", salt, constants::kMinIterations);
    Bytes other_salt = aead::DeriveExtractableKey("correct horse", Salt(2), constants::kMinIterations);
    Check(first.size() == 32, "derived key is 32 bytes");
    Check(first == second, "derivation is deterministic");
    Check(first != other_salt, "salt changes the key");

    Check(ErrorCodeOf([&] { aead::DeriveKey("pw", Bytes(15, 1), constants::kMinIterations); })
              == ErrorCode::kKeyDerivation,
          "short salt rejected");
    Check(ErrorCodeOf([&] { aead::DeriveKey("pw", salt, constants::kMinIterations - 1); })
              == ErrorCode::kKeyDerivation,
          "low iteration count rejected");
    Check(ErrorCodeOf([&] { aead::DeriveKey("", salt, constants::kMinIterations); }) == ErrorCode::kKeyDerivation,
          "empty password rejected");

    SymmetricKey derived = aead::DeriveKey("correct horse", salt, constants::kMinIterations);
    Check(!derived.extractable(), "derived key is non-extractable");
    Check(Throws<EncryptionError>([&] { derived.ExportRaw(); }), "non-extractable key refuses export");
    Check(aead::KeyFingerprint(derived) == "FINGERPRINT_FAILED", "fingerprint of non-extractable key");

    SymmetricKey imported = SymmetricKey::Import(first, true);
    Check(aead::KeyFingerprint(imported) == format::HexEncode(crypto::Sha256(first)), "fingerprint is sha256 hex");
    Check(Throws<EncryptionError>([] { SymmetricKey::Import(Bytes(16, 0), true); }), "import rejects 128-bit key");
}

void TestRoundTrip() {
    Section("aead round-trip");
    SymmetricKey key = SymmetricKey::Generate(false);
    Bytes large = crypto::RandomBytes(100000);
    for (const Bytes& plaintext : {Bytes{}, Bytes{0x42}, ToBytes("The quick brown fox"), large}) {
        aead::EncryptionResult sealed = aead::Encrypt(plaintext, key);
        aead::DecryptionInput input{sealed.ciphertext, sealed.iv, sealed.auth_tag, &key, std::nullopt};
        Check(aead::Decrypt(input) == plaintext, "round-trip of " + std::to_string(plaintext.size()) + " bytes");
        Check(base64::Decode(sealed.iv).size() == 12 && base64::Decode(sealed.auth_tag).size() == 16,
              "iv and tag sizes for " + std::to_string(plaintext.size()) + " bytes");
    }

    aead::EncryptionResult a = aead::EncryptText("same", key);
    aead::EncryptionResult b = aead::EncryptText("same", key);
    Check(a.iv != b.iv && a.ciphertext != b.ciphertext, "fresh iv per encryption");
    Check(a.algorithm == "AES-GCM", "algorithm label");

    aead::EncryptionResult with_aad = aead::EncryptText("bound", key, std::nullopt, std::string("doc-1"));
    aead::DecryptionInput input{with_aad.ciphertext, with_aad.iv, with_aad.auth_tag, &key, std::string("doc-1")};
    Check(aead::DecryptText(input) == "bound", "aad round-trip");
    input.aad = std::string("doc-2");
    Check(Throws<DecryptionError>([&] { aead::Decrypt(input); }), "aad mismatch rejected");

    Check(Throws<EncryptionError>([&] { aead::EncryptText("x", key, Bytes(8, 0)); }), "supplied iv must be 12 bytes");
    aead::EncryptionResult fixed = aead::EncryptText("x", key, Bytes(12, 7));
    Check(base64::Decode(fixed.iv) == Bytes(12, 7), "supplied iv is used");
}

void TestTamper() {
    Section("tamper sensitivity");
    SymmetricKey key = SymmetricKey::Generate(false);
    SymmetricKey other = SymmetricKey::Generate(false);
    aead::EncryptionResult sealed = aead::EncryptText("attack at dawn", key);
    const aead::DecryptionInput good{sealed.ciphertext, sealed.iv, sealed.auth_tag, &key, std::nullopt};

    aead::DecryptionInput bad_ct = good;
    bad_ct.ciphertext = FlipFirstByte(good.ciphertext);
    aead::DecryptionInput bad_iv = good;
    bad_iv.iv = FlipFirstByte(good.iv);
    aead::DecryptionInput bad_tag = good;
    bad_tag.auth_tag = FlipFirstByte(good.auth_tag);
    aead::DecryptionInput wrong_key = good;
    wrong_key.key = &other;
    aead::DecryptionInput short_iv = good;
    short_iv.iv = base64::Encode(Bytes(8, 1));
    aead::DecryptionInput garbage = good;
    garbage.ciphertext = "###";

    auto ct_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(bad_ct); });
    auto iv_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(bad_iv); });
    auto tag_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(bad_tag); });
    auto key_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(wrong_key); });
    auto len_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(short_iv); });
    auto b64_msg = MessageOf<DecryptionError>([&] { aead::Decrypt(garbage); });
    Check(ct_msg.has_value(), "flipped ciphertext bit");
    Check(iv_msg.has_value(), "flipped iv bit");
    Check(tag_msg.has_value(), "flipped tag bit");
    Check(key_msg.has_value(), "wrong key");
    Check(len_msg.has_value(), "short iv");
    Check(b64_msg.has_value(), "bad base64");
    Check(ct_msg == iv_msg && iv_msg == tag_msg && tag_msg == key_msg && key_msg == len_msg && len_msg == b64_msg,
          "one message for every failure");
    Check(aead::DecryptText(good) == "attack at dawn", "untouched input still decrypts");
}

void TestValidation() {
    Section("validation");
    std::vector<std::string> empty = aead::ValidateDecryptionInputs(aead::DecryptionInput{});
    Check(empty.size() == 4, "four required fields reported");
    Check(empty.size() == 4 && empty[0] == "Ciphertext is required" && empty[3] == "Key is required",
          "required field messages");

    SymmetricKey key = SymmetricKey::Generate(false);
    aead::DecryptionInput input{base64::Encode(Bytes(40, 9)), base64::Encode(Bytes(8, 1)),
                                base64::Encode(Bytes(16, 2)), &key, std::nullopt};
    std::vector<std::string> errors = aead::ValidateDecryptionInputs(input);
    Check(errors.size() == 1 && errors[0] == "IV length mismatch: expected 12, got 8", "iv length mismatch");
    input.auth_tag = "ab-_";
    errors = aead::ValidateDecryptionInputs(input);
    Check(errors.size() >= 2 && errors[0] == "Auth tag has invalid base64 format", "url-safe tag flagged");

    aead::IntegrityReport report = aead::ValidateCiphertextIntegrity(input);
    Check(report.ciphertext_valid && !report.iv_valid && report.estimated_original_size == 40, "integrity report");

    Check(ErrorCodeOf([] { aead::ValidateCiphertextInput({}); }) == ErrorCode::kUnsupportedFormat, "empty blob");
    auto small = MessageOf<UnsupportedFormatError>([] { aead::ValidateCiphertextInput(Bytes(10, 1)); });
    Check(small == std::string("Encrypted data too small: 10 bytes (minimum 32 required)"), "small blob");
    Check(ErrorCodeOf([] { aead::ValidateCiphertextInput(Bytes(64, 0)); }) == ErrorCode::kCorruption,
          "null blob is corruption");
    Check(!ErrorCodeOf([] { aead::ValidateCiphertextInput(crypto::RandomBytes(64)); }).has_value(),
          "random blob passes");

    aead::EncryptionParameters params = aead::RecommendedParameters();
    Check(params.iterations == constants::kRecommendedIterations && aead::ValidateEncryptionParameters(params).empty(),
          "recommended parameters are valid");
    params.iterations = 1000;
    params.iv_length = 16;
    errors = aead::ValidateEncryptionParameters(params);
    Check(errors.size() == 2 && errors[0] == "Iterations must be at least 100000"
              && errors[1] == "IV length must be 12 bytes",
          "parameter violations listed");
}

void TestErrorMessages() {
    Section("error messages");
    AuthenticationError auth("Incorrect password or corrupted file");
    CorruptionError corrupt("bad bytes");
    std::runtime_error plain("boom");
    Check(Contains(aead::GetDecryptionErrorMessage(auth, "report.pdf"), "Authentication Failed: \"report.pdf\""),
          "authentication message");
    Check(Contains(aead::GetDecryptionErrorMessage(corrupt), "Data Corruption: the document"), "corruption message");
    Check(Contains(aead::GetDecryptionErrorMessage(plain), "unexpected error"), "generic message");
    Check(auth.UserMessage() == "Incorrect password or corrupted file", "authentication user message");
    Check(ErrorCodeName(ErrorCode::kDekDecryption) == "DEK_DECRYPTION_ERROR", "error code name");
    DEKDecryptionError dek_error("bad wrap");
    Check(std::string(dek_error.what()) == "DEK decryption failed: bad wrap", "dek decryption prefix");
}

void TestFramings() {
    Section("legacy framings");
    SymmetricKey key = SymmetricKey::Generate(false);
    SymmetricKey other = SymmetricKey::Generate(false);
    const Bytes plaintext = ToBytes("legacy document body that spans more than one block");
    aead::RawCiphertext sealed = aead::EncryptBytes(plaintext, key);

    framing::FallbackResult canonical = framing::TryFramings(sealed.ciphertext, sealed.tag, sealed.iv, key);
    Check(canonical.ok && canonical.framing == "separate-tag" && canonical.plaintext == plaintext,
          "canonical framing wins first");

    Bytes combined = sealed.ciphertext;
    combined.insert(combined.end(), sealed.tag.begin(), sealed.tag.end());
    framing::FallbackResult embedded = framing::TryFramings(combined, {}, sealed.iv, key);
    Check(embedded.ok && embedded.framing == "embedded-tag" && embedded.plaintext == plaintext,
          "embedded tag recovered");

    // Writer that stored the first 16 bytes of ciphertext||tag in the tag field.
    Bytes head(combined.begin(), combined.begin() + 16);
    Bytes rest(combined.begin() + 16, combined.end());
    framing::FallbackResult prefixed = framing::TryFramings(rest, head, sealed.iv, key);
    Check(prefixed.ok && prefixed.framing == "tag-prefix" && prefixed.plaintext == plaintext, "tag prefix recovered");

    const Bytes aad = ToBytes("doc-7");
    aead::RawCiphertext bound = aead::EncryptBytes(plaintext, key, std::nullopt, aad);
    Bytes bound_combined = bound.ciphertext;
    bound_combined.insert(bound_combined.end(), bound.tag.begin(), bound.tag.end());
    framing::FallbackResult with_aad = framing::TryFramings(bound_combined, {}, bound.iv, key, aad);
    Check(with_aad.ok && with_aad.framing == "embedded-tag-aad", "embedded tag with aad recovered");

    framing::FallbackResult none = framing::TryFramings(sealed.ciphertext, sealed.tag, sealed.iv, other);
    Check(!none.ok && none.failures.size() == framing::kLegacyFramings.size(), "every framing reported on failure");
    Check(Throws<DecryptionError>([&] { framing::DecryptWithFramings(sealed.ciphertext, sealed.tag, sealed.iv, other); }),
          "all framings failing throws");

    aead::DecryptionInput input{base64::Encode(combined), base64::Encode(sealed.iv), "", &key, std::nullopt};
    Check(framing::DecryptWithFallback(input) == plaintext, "fallback from base64 fields");
}

void TestJsonAndFormat() {
    Section("json and format");
    json::Object object = json::Object::Parse(
        R"({"name":"a\"b\\cé","n":42,"f":1.5,"t":true,"z":null,"arr":[1,{"x":[]}],"obj":{"k":"v"}})");
    Check(object.Find("name") && object.Find("name")->text == "a\"b\\c\xC3\xA9", "string escapes");
    Check(object.Find("n") && object.Find("n")->AsUint() == 42u, "integer member");
    Check(object.Find("f") && !object.Find("f")->AsUint() && object.Find("f")->number == 1.5, "fractional member");
    Check(object.Find("t") && object.Find("t")->type == json::Type::kBool && object.Find("t")->boolean, "bool");
    Check(object.Find("arr") && object.Find("arr")->type == json::Type::kArray, "nested array kept");
    Check(object.Find("obj") && object.Find("obj")->text == R"({"k":"v"})", "nested object raw text");
    Check(!object.Has("missing"), "missing member");
    Check(Throws<std::runtime_error>([] { json::Object::Parse("{\"a\":1,}"); }), "trailing comma rejected");
    Check(Throws<std::runtime_error>([] { json::Object::Parse("[1,2]"); }), "array root rejected");
    Check(Throws<std::runtime_error>([] { json::Object::Parse("{\"a\":1} x"); }), "trailing garbage rejected");

    std::string written = json::Writer().String("k", "line\nbreak").Number("n", 7).Bool("b", false).Finish();
    Check(written == R"({"k":"line\nbreak","n":7,"b":false})", "writer output");
    Check(json::Object::Parse(written).Find("k")->text == "line\nbreak", "writer output parses");

    Bytes buffer;
    format::PutU32Le(buffer, 0x01020304u);
    Check(buffer == Bytes({0x04, 0x03, 0x02, 0x01}) && format::ReadU32Le(buffer, 0) == 0x01020304u,
          "little-endian u32");
    Check(Throws<std::runtime_error>([&] { format::ReadU32Le(buffer, 1); }), "short u32 read");
    Check(format::ToBase36(0) == "0" && format::ToBase36(35) == "z" && format::ToBase36(36) == "10", "base36");
    std::string stamp = format::UtcTimestamp();
    Check(stamp.size() == 24 && stamp[10] == 'T' && stamp[19] == '.' && stamp.back() == 'Z', "timestamp shape");
}

}  // namespace

int main() {
    try {
        TestBase64();
        TestKnownAnswers();
        TestKeyDerivation();
        TestRoundTrip();
        TestTamper();
        TestValidation();
        TestErrorMessages();
        TestFramings();
        TestJsonAndFormat();
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
    return vaultcrypt::test::Finish("test_primitives");
}
