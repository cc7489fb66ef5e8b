#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current UTC time.
std::string now_iso();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Replace every "{key}" occurrence in arg. Unknown placeholders are left as-is.
std::string substitute_placeholders(
    const std::string& arg,
    const std::vector<std::pair<std::string, std::string>>& replacements);

// Well-formed UTF-8 (no overlongs, surrogates or code points past U+10FFFF).
bool is_valid_utf8(const std::string& s);

// Exponential backoff: initial_ms for attempt 1, doubling, capped at max_ms.
std::int64_t backoff_delay_ms(int attempt, int initial_ms, int max_ms);

// Keep only the last max_bytes of s, cut at a line start when possible.
std::string tail_excerpt(const std::string& s, std::size_t max_bytes);

// Standard base64 (with padding). decode stops at the first '=' or invalid char.
std::string base64_encode(const std::string& input);
std::string base64_decode(const std::string& input);
