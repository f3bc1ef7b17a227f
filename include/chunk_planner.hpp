#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace rangefetch {

inline constexpr int64_t kDefaultChunkSize = 64 * 1024;

// Window into the destination buffer. Windows of one plan never overlap, so
// workers fill them without locking.
struct MemoryTask {
    int64_t offset;
    std::span<char> content;
};

struct FileTask {
    int64_t offset;
    int64_t size;
};

// floor(T / C) full chunks followed by one shorter chunk when C does not
// divide T. The tasks cover [0, T) exactly once. chunk_size <= 0 selects
// kDefaultChunkSize.
std::vector<MemoryTask> plan_memory_tasks(std::span<char> dest, int64_t chunk_size = kDefaultChunkSize);
std::vector<FileTask> plan_file_tasks(int64_t total_size, int64_t chunk_size = kDefaultChunkSize);

} // namespace rangefetch
