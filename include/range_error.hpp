#pragma once

#include <string>
#include <string_view>

namespace rangefetch {

enum class RangeError {
    InvalidArgument,
    UnsupportedRange,
    ParseError,
    ValidationFailed,
    RangeMismatch,
    LengthMismatch,
    TransportError,
    Timeout,
    Cancelled,
    ChecksumMismatch,
    FileWriteError
};

struct RangeErrorInfo {
    RangeError error;
    std::string message;
    int status_code = 0;
};

constexpr std::string_view to_string(RangeError error) {
    switch (error) {
        case RangeError::InvalidArgument: return "invalid argument";
        case RangeError::UnsupportedRange: return "range not supported";
        case RangeError::ParseError: return "parse error";
        case RangeError::ValidationFailed: return "validation failed";
        case RangeError::RangeMismatch: return "range mismatch";
        case RangeError::LengthMismatch: return "length mismatch";
        case RangeError::TransportError: return "transport error";
        case RangeError::Timeout: return "timeout";
        case RangeError::Cancelled: return "cancelled";
        case RangeError::ChecksumMismatch: return "checksum mismatch";
        case RangeError::FileWriteError: return "file write error";
    }
    return "unknown";
}

inline std::string describe(const RangeErrorInfo& info) {
    std::string out(to_string(info.error));
    if (!info.message.empty()) {
        out += ": ";
        out += info.message;
    }
    return out;
}

} // namespace rangefetch
