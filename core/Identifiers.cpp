#include "core/Identifiers.hpp"
#include "core/Errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace securewatch {

std::string GenerateUUID() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        throw EngineError("RAND_bytes failed while generating UUID");
    }

    // Set version 4 bits
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant bits
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char uuid_str[37];
    std::snprintf(uuid_str, sizeof(uuid_str),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3],
        bytes[4], bytes[5],
        bytes[6], bytes[7],
        bytes[8], bytes[9],
        bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);

    return std::string(uuid_str);
}

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw EngineError("EVP_Digest(sha256) failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string TimestampToISO8601(uint64_t ms_epoch) {
    auto seconds = static_cast<time_t>(ms_epoch / 1000);
    auto millis = ms_epoch % 1000;

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(millis));

    return std::string(buf);
}

std::string TimestampToDateString(uint64_t ms_epoch) {
    auto seconds = static_cast<time_t>(ms_epoch / 1000);

    std::tm tm_buf{};
    gmtime_r(&seconds, &tm_buf);

    char buf[12];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);

    return std::string(buf);
}

std::optional<uint64_t> ParseISO8601(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    uint64_t millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            char c = static_cast<char>(iss.get());
            if (digits < 3) {
                millis = millis * 10 + static_cast<uint64_t>(c - '0');
            }
            ++digits;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    time_t seconds = timegm(&tm_buf);
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(seconds) * 1000 + millis;
}

} // namespace securewatch
