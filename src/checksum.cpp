#include "checksum.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <array>
#include <memory>
#include <stdexcept>

namespace rangefetch {

namespace {

constexpr size_t kSha256Size = 32;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::array<unsigned char, kSha256Size> sha256(std::span<const char> content) {
    std::array<unsigned char, kSha256Size> hash{};
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned int hash_len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &hash_len) != 1 ||
        hash_len != kSha256Size) {
        throw std::runtime_error("OpenSSL SHA-256 digest failed");
    }
    return hash;
}

} // namespace

std::string sha256_hex(std::span<const char> content) {
    static constexpr char digits[] = "0123456789abcdef";
    auto hash = sha256(content);
    std::string actual;
    actual.reserve(kSha256Size * 2);
    for (unsigned char b : hash) {
        actual += digits[b >> 4];
        actual += digits[b & 0x0f];
    }
    return actual;
}

std::optional<std::vector<unsigned char>> decode_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::expected<void, RangeErrorInfo> verify_sha256(std::span<const char> content, std::string_view expected_hex) {
    auto expected = decode_hex(expected_hex);
    if (!expected || expected->size() != kSha256Size) {
        return std::unexpected(RangeErrorInfo{RangeError::ChecksumMismatch,
            "invalid sha256 digest \"" + std::string(expected_hex) + "\""});
    }
    auto actual = sha256(content);
    if (CRYPTO_memcmp(actual.data(), expected->data(), kSha256Size) != 0) {
        return std::unexpected(RangeErrorInfo{RangeError::ChecksumMismatch,
            "sha256 checksum not equal with " + std::string(expected_hex)});
    }
    return {};
}

} // namespace rangefetch
