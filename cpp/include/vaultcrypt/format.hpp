#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vaultcrypt::format {

using Bytes = std::vector<std::uint8_t>;

void PutU32Le(Bytes& out, std::uint32_t value);
std::uint32_t ReadU32Le(const Bytes& data, std::size_t offset);

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-17T08:00:00.000Z
std::string UtcTimestamp();
std::string ToBase36(std::uint64_t value);
std::uint64_t UnixMillis();

std::string HexEncode(const Bytes& data);
std::string HexPreview(const Bytes& data, std::size_t max_bytes);

}  // namespace vaultcrypt::format
