#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace vrpassist::core {

inline constexpr std::string_view kAnonymousSessionPrefix = "anon_";

// Random RFC 4122 version 4 UUID, lowercase 8-4-4-4-12 form
inline std::string random_uuid() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = gen();
        for (size_t b = 0; b < 8; ++b) {
            bytes[i + b] = static_cast<uint8_t>(word >> (b * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

// Session id for solve requests that arrive without an x-session-id header
inline std::string generate_anonymous_session_id() {
    return std::string(kAnonymousSessionPrefix) + random_uuid();
}

inline bool is_anonymous_session_id(std::string_view id) {
    return id.starts_with(kAnonymousSessionPrefix);
}

// Fallback id for tool calls the provider returned without one
inline std::string generate_tool_call_id() {
    return "call_" + random_uuid().substr(0, 12);
}

}  // namespace vrpassist::core
