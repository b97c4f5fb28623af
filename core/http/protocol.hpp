#pragma once

#include <cstdint>
#include <string>

namespace hpipe {
namespace http {

// Wire names shared by the server routes and the client transport loop

// Resume offset on requests; accepted total offset (PUT) or start offset (GET) on responses
constexpr const char *kOffsetHeader = "X-Pipe-Offset";
constexpr const char *kOffsetParam = "offset";

// "1" on the sender's final segment
constexpr const char *kEofHeader = "X-Pipe-Eof";

// HEAD response headers
constexpr const char *kWindowStartHeader = "X-Pipe-Window-Start";
constexpr const char *kStateHeader = "X-Pipe-State";
constexpr const char *kSenderHeader = "X-Pipe-Sender";  // attached, absent, finished
constexpr const char *kErrorHeader = "X-Pipe-Error";    // Failure name on 410 HEAD responses
constexpr const char *kBackpressureHeader = "X-Pipe-Backpressure";  // "1" while the window is full

constexpr const char *kSenderAttached = "attached";
constexpr const char *kSenderAbsent = "absent";
constexpr const char *kSenderFinished = "finished";

constexpr const char *kStatusPath = "/v0/status";

// Strict decimal parse (no sign, no whitespace, no overflow)
inline bool parse_offset(const std::string &text, uint64_t &offset) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    offset = value;
    return true;
}

}  // namespace http
}  // namespace hpipe
