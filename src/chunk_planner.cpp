#include "chunk_planner.hpp"

namespace rangefetch {

std::vector<FileTask> plan_file_tasks(int64_t total_size, int64_t chunk_size) {
    if (chunk_size <= 0) chunk_size = kDefaultChunkSize;
    std::vector<FileTask> tasks;
    if (total_size <= 0) return tasks;

    int64_t task_count = total_size / chunk_size;
    tasks.reserve(static_cast<size_t>(task_count) + 1);
    int64_t offset = 0;
    for (int64_t i = 0; i < task_count; ++i) {
        tasks.push_back(FileTask{offset, chunk_size});
        offset += chunk_size;
    }
    if (offset < total_size) {
        tasks.push_back(FileTask{offset, total_size - offset});
    }
    return tasks;
}

std::vector<MemoryTask> plan_memory_tasks(std::span<char> dest, int64_t chunk_size) {
    auto ranges = plan_file_tasks(static_cast<int64_t>(dest.size()), chunk_size);
    std::vector<MemoryTask> tasks;
    tasks.reserve(ranges.size());
    for (const auto& r : ranges) {
        tasks.push_back(MemoryTask{r.offset, dest.subspan(static_cast<size_t>(r.offset), static_cast<size_t>(r.size))});
    }
    return tasks;
}

} // namespace rangefetch
