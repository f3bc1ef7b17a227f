#pragma once

#include "chunk_planner.hpp"
#include "context.hpp"
#include "http_client.hpp"
#include "range_error.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rangefetch {

struct DownloadConfig {
    size_t worker_count = 48;
    int64_t chunk_size = kDefaultChunkSize;
    std::chrono::milliseconds chunk_timeout = std::chrono::minutes(1);
    // Extra headers copied into every request of the download.
    std::map<std::string, std::string> headers;
};

// Downloads the whole resource into memory using parallel Range requests.
// The server must answer 206 and report the total size.
std::expected<std::vector<char>, RangeErrorInfo> download(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    const DownloadConfig& config = {}
);

// download() followed by a SHA-256 check of the assembled content.
std::expected<std::vector<char>, RangeErrorInfo> download_with_checksum(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    std::string_view expected_sha256_hex,
    const DownloadConfig& config = {}
);

// Streams the resource into path. Chunks are written by a single writer at
// their offsets, so the whole content is never held in memory. On failure
// the partially written file is left in place.
std::expected<void, RangeErrorInfo> download_to_file(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    const std::filesystem::path& path,
    const DownloadConfig& config = {}
);

} // namespace rangefetch
