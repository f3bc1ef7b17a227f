#include "async_file_writer.hpp"
#include "compact_log.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace rangefetch {

std::expected<AsyncFileWriter, RangeErrorInfo> AsyncFileWriter::create(
    const std::filesystem::path& path, int64_t file_size)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        int err = errno;
        return std::unexpected(RangeErrorInfo{RangeError::FileWriteError,
            "cannot create " + path.string() + ": " + std::strerror(err)});
    }

    if (file_size > 0) {
#ifdef __APPLE__
        fstore_t store;
        std::memset(&store, 0, sizeof(store));
        store.fst_flags = F_ALLOCATEALL;
        store.fst_posmode = F_PEOFPOSMODE;
        store.fst_offset = 0;
        store.fst_length = static_cast<off_t>(file_size);
        fcntl(fd, F_PREALLOCATE, &store);
#elif defined(__linux__)
        // Only a hint; filesystems without support still accept the writes.
        if (int rc = posix_fallocate(fd, 0, file_size); rc != 0) {
            compact::Log::debug("posix_fallocate " + path.string() + ": " + std::strerror(rc));
        }
#endif
    }
    return AsyncFileWriter(fd, path, file_size);
}

AsyncFileWriter::~AsyncFileWriter() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

AsyncFileWriter::AsyncFileWriter(AsyncFileWriter&& other) noexcept
    : fd_(other.fd_),
      path_(std::move(other.path_)),
      file_size_(other.file_size_),
      bytes_written_(other.bytes_written_)
{
    other.fd_ = -1;
}

AsyncFileWriter& AsyncFileWriter::operator=(AsyncFileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ != -1) ::close(fd_);
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        file_size_ = other.file_size_;
        bytes_written_ = other.bytes_written_;
        other.fd_ = -1;
    }
    return *this;
}

RangeErrorInfo AsyncFileWriter::errno_error(const char* what) const {
    int err = errno;
    return RangeErrorInfo{RangeError::FileWriteError,
        std::string(what) + " " + path_.string() + ": " + std::strerror(err)};
}

std::expected<void, RangeErrorInfo> AsyncFileWriter::write_at(const void* data, size_t size, int64_t offset) {
    if (fd_ == -1) {
        return std::unexpected(RangeErrorInfo{RangeError::FileWriteError, "File not open"});
    }
    const char* p = static_cast<const char*>(data);
    size_t done = 0;
    while (done < size) {
        ssize_t written = pwrite(fd_, p + done, size - done, static_cast<off_t>(offset + done));
        if (written == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error("pwrite"));
        }
        if (written == 0) {
            return std::unexpected(RangeErrorInfo{RangeError::FileWriteError, "Incomplete write to " + path_.string()});
        }
        done += static_cast<size_t>(written);
    }
    bytes_written_ += static_cast<int64_t>(size);
    return {};
}

std::expected<void, RangeErrorInfo> AsyncFileWriter::drain(Channel<ChunkResult>& results, const Context& ctx) {
    while (bytes_written_ < file_size_) {
        if (ctx.done()) return {};
        auto chunk = results.pop(ctx);
        if (!chunk) return {};
        if (auto res = write_at(chunk->content.data(), chunk->content.size(), chunk->offset); !res) {
            return res;
        }
    }
    compact::Log::debug("writer finished " + path_.string() + ": " + compact::num(bytes_written_) + " bytes");
    return {};
}

std::expected<void, RangeErrorInfo> AsyncFileWriter::sync() {
    if (fd_ == -1) return {};
#ifdef __APPLE__
    if (fcntl(fd_, F_FULLFSYNC) == -1) {
#else
    if (fdatasync(fd_) == -1) {
#endif
        return std::unexpected(errno_error("sync"));
    }
    return {};
}

std::expected<void, RangeErrorInfo> AsyncFileWriter::close() {
    if (fd_ == -1) return {};
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1) {
        return std::unexpected(errno_error("close"));
    }
    return {};
}

} // namespace rangefetch
