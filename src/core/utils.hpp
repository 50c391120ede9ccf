#pragma once

#include <string>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Seconds since the Unix epoch.
int64_t now_epoch();

// Random RFC 4122 version 4 identifier, e.g. "1b4e28ba-2fa1-41d2-883f-0016d3cca427".
std::string generate_uuid();

// 32 lowercase hex characters from a non-deterministic source.
std::string generate_token();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}
