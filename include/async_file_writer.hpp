#pragma once

#include "channel.hpp"
#include "context.hpp"
#include "range_error.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

namespace rangefetch {

// A fetched chunk on its way to the writer.
struct ChunkResult {
    int64_t offset = 0;
    std::vector<char> content;
};

// Sole owner of the destination file descriptor. Workers never touch the
// file; they hand ChunkResults to drain(), which serialises every pwrite.
class AsyncFileWriter {
public:
    // Creates or truncates path and preallocates file_size bytes.
    static std::expected<AsyncFileWriter, RangeErrorInfo> create(
        const std::filesystem::path& path, int64_t file_size);

    ~AsyncFileWriter();

    // Deleted copy constructors/assignment operators to prevent accidental copying
    AsyncFileWriter(const AsyncFileWriter&) = delete;
    AsyncFileWriter& operator=(const AsyncFileWriter&) = delete;

    AsyncFileWriter(AsyncFileWriter&&) noexcept;
    AsyncFileWriter& operator=(AsyncFileWriter&&) noexcept;

    std::expected<void, RangeErrorInfo> write_at(const void* data, size_t size, int64_t offset);

    // Consumes results until total_size bytes are written. Returns success
    // early, without writing everything, when ctx is done or the channel is
    // closed; callers decide whether that is a failure.
    std::expected<void, RangeErrorInfo> drain(Channel<ChunkResult>& results, const Context& ctx);

    std::expected<void, RangeErrorInfo> sync();
    std::expected<void, RangeErrorInfo> close();

    int64_t bytes_written() const { return bytes_written_; }

private:
    AsyncFileWriter(int fd, std::filesystem::path path, int64_t file_size)
        : fd_(fd), path_(std::move(path)), file_size_(file_size) {}

    RangeErrorInfo errno_error(const char* what) const;

    int fd_ = -1;
    std::filesystem::path path_;
    int64_t file_size_ = 0;
    int64_t bytes_written_ = 0;
};

} // namespace rangefetch
