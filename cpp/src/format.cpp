#include "vaultcrypt/format.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace vaultcrypt::format {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

void PutU32Le(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

std::uint32_t ReadU32Le(const Bytes& data, std::size_t offset) {
    if (offset > data.size() || data.size() - offset < 4) {
        throw std::runtime_error("Malformed length-prefixed blob (missing length)");
    }
    return static_cast<std::uint32_t>(data[offset])
           | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
}

std::uint64_t UnixMillis() {
    auto now = std::chrono::system_clock::now();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count());
}

std::string UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm) == 0) {
        return {};
    }
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, static_cast<int>(millis));
    return std::string(out);
}

std::string ToBase36(std::uint64_t value) {
    constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(kDigits[value % 36]);
        value /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string HexEncode(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::string HexPreview(const Bytes& data, std::size_t max_bytes) {
    std::size_t count = std::min(data.size(), max_bytes);
    std::string out;
    out.reserve(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out.push_back(' ');
        }
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace vaultcrypt::format
