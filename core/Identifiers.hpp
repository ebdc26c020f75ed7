#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace securewatch {

// Random (version 4) UUID from OpenSSL's CSPRNG.
std::string GenerateUUID();

// Lower-case hex SHA-256 digest.
std::string Sha256Hex(const std::string& data);

std::string TimestampToISO8601(uint64_t ms_epoch);
std::string TimestampToDateString(uint64_t ms_epoch);

// Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z]" (UTC). Returns nullopt on malformed input.
std::optional<uint64_t> ParseISO8601(const std::string& text);

} // namespace securewatch
