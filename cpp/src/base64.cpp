#include "vaultcrypt/base64.hpp"

#include "vaultcrypt/errors.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace vaultcrypt::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    // URL-safe alphabet maps onto '+' and '/'.
    table[static_cast<std::uint8_t>('-')] = 62;
    table[static_cast<std::uint8_t>('_')] = 63;
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

struct DecodeFailure {
    ErrorCode code;
    std::string message;
};

std::optional<DecodeFailure> DecodeInto(std::string_view input, std::vector<std::uint8_t>& out) {
    std::string clean;
    clean.reserve(input.size());
    for (unsigned char c : input) {
        if (!std::isspace(c)) {
            clean.push_back(static_cast<char>(c));
        }
    }
    if (clean.empty()) {
        return DecodeFailure{ErrorCode::kBase64Empty, "Base64 input is empty"};
    }
    for (unsigned char c : clean) {
        if (c != '=' && kDecTable[c] == 0xFF) {
            return DecodeFailure{ErrorCode::kBase64InvalidCharacters,
                                 "Base64 input contains invalid characters"};
        }
    }
    std::size_t data_len = clean.find('=');
    if (data_len == std::string::npos) {
        data_len = clean.size();
    }
    std::size_t padding = clean.size() - data_len;
    if (clean.find_first_not_of('=', data_len) != std::string::npos) {
        return DecodeFailure{ErrorCode::kBase64Malformed, "Base64 padding is only allowed at the end"};
    }
    if (padding > 2 || data_len % 4 == 1 || (padding > 0 && clean.size() % 4 != 0)) {
        return DecodeFailure{ErrorCode::kBase64Malformed, "Base64 input has an invalid length"};
    }

    out.clear();
    out.reserve((data_len / 4) * 3 + 2);
    int val = 0;
    int valb = -8;
    for (std::size_t i = 0; i < data_len; ++i) {
        val = ((val << 6) + kDecTable[static_cast<unsigned char>(clean[i])]) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    if (i < data.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        if (i + 1 < data.size()) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back(kEncTable[(triple >> 6) & 0x3F]);
            out.push_back('=');
        } else {
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back('=');
            out.push_back('=');
        }
    }
    return out;
}

std::vector<std::uint8_t> Decode(std::string_view input) {
    std::vector<std::uint8_t> out;
    if (auto failure = DecodeInto(input, out)) {
        throw Base64Error(failure->message, failure->code);
    }
    return out;
}

std::vector<std::uint8_t> TryDecode(std::string_view input, bool* ok) {
    std::vector<std::uint8_t> out;
    bool success = !DecodeInto(input, out).has_value();
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

bool IsValid(std::string_view input) {
    std::vector<std::uint8_t> scratch;
    return !DecodeInto(input, scratch).has_value();
}

bool MatchesStandardAlphabet(std::string_view input) {
    std::size_t data_len = input.find('=');
    if (data_len == std::string_view::npos) {
        data_len = input.size();
    }
    if (input.size() - data_len > 2) {
        return false;
    }
    for (std::size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (i >= data_len) {
            if (c != '=') {
                return false;
            }
            continue;
        }
        if (c == '-' || c == '_' || kDecTable[c] == 0xFF) {
            return false;
        }
    }
    return true;
}

}  // namespace vaultcrypt::base64
