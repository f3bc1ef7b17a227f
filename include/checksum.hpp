#pragma once

#include "range_error.hpp"
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rangefetch {

// Lowercase hex SHA-256 of content.
std::string sha256_hex(std::span<const char> content);

// Decodes hex in either case; nullopt on odd length or a non-hex digit.
std::optional<std::vector<unsigned char>> decode_hex(std::string_view hex);

// ChecksumMismatch when expected_hex is not a valid SHA-256 digest or does
// not match. The comparison runs in constant time.
std::expected<void, RangeErrorInfo> verify_sha256(std::span<const char> content, std::string_view expected_hex);

} // namespace rangefetch
