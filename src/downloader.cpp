#include "downloader.hpp"
#include "async_file_writer.hpp"
#include "channel.hpp"
#include "checksum.hpp"
#include "compact_log.hpp"
#include "error_group.hpp"
#include "range_reader.hpp"
#include <algorithm>
#include <atomic>
#include <new>
#include <stdexcept>

namespace rangefetch {

namespace {

std::expected<RangeReader, RangeErrorInfo> open_reader(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    const DownloadConfig& config
) {
    HttpRequest prototype;
    prototype.url = std::string(url);
    prototype.headers = config.headers;

    auto reader = RangeReader::create(std::move(executor), std::move(prototype), ctx);
    if (!reader) return std::unexpected(reader.error());
    if (reader->size() < 0) {
        return std::unexpected(RangeErrorInfo{RangeError::UnsupportedRange,
            "server did not report the size of " + std::string(url)});
    }
    return reader;
}

size_t worker_count_for(const DownloadConfig& config, size_t task_count) {
    return std::min(std::max<size_t>(config.worker_count, 1), std::max<size_t>(task_count, 1));
}

// Each chunk gets its own deadline, scoped under the group context.
std::expected<void, RangeErrorInfo> read_chunk(
    const RangeReader& reader,
    const Context& group_ctx,
    std::span<char> content,
    int64_t offset,
    const DownloadConfig& config
) {
    auto chunk_reader = reader.with_context(group_ctx.with_timeout(config.chunk_timeout));
    auto n = chunk_reader.read_at(content, offset);
    if (!n) return std::unexpected(n.error());
    if (n->bytes != content.size()) {
        return std::unexpected(RangeErrorInfo{RangeError::LengthMismatch,
            "download size " + compact::num(n->bytes) + " not equal with expect size " +
            compact::num(content.size()) + " for chunk at offset " + compact::num(offset)});
    }
    return {};
}

// Workers that stop early on a cancelled parent context report success, so
// an incomplete run without a recorded error is turned into the context's
// own error here.
RangeErrorInfo incomplete_error(const Context& ctx) {
    if (auto err = ctx.err()) return *err;
    return RangeErrorInfo{RangeError::Cancelled, "download stopped before completion"};
}

RangeErrorInfo too_large(int64_t total_size) {
    return RangeErrorInfo{RangeError::InvalidArgument,
        "resource of " + compact::num(total_size) + " bytes is too large to plan in memory"};
}

template<typename Task>
void fill_queue(Channel<Task>& queue, std::vector<Task> tasks) {
    for (auto& task : tasks) queue.push(std::move(task));
    queue.close();
}

} // namespace

std::expected<std::vector<char>, RangeErrorInfo> download(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    const DownloadConfig& config
) {
    auto reader = open_reader(ctx, std::move(executor), url, config);
    if (!reader) return std::unexpected(reader.error());

    const int64_t total_size = reader->size();
    std::vector<char> buf;
    std::vector<MemoryTask> tasks;
    try {
        buf.resize(static_cast<size_t>(total_size));
        tasks = plan_memory_tasks(buf, config.chunk_size);
    } catch (const std::bad_alloc&) {
        return std::unexpected(too_large(total_size));
    } catch (const std::length_error&) {
        return std::unexpected(too_large(total_size));
    }
    const size_t task_count = tasks.size();
    const size_t workers = worker_count_for(config, task_count);

    compact::Log::info("download " + std::string(url) + ": " + compact::num(total_size) + " bytes, " +
                       compact::num(task_count) + " chunks, " + compact::num(workers) + " workers");

    Channel<MemoryTask> queue(task_count);
    fill_queue(queue, std::move(tasks));

    std::atomic<size_t> completed{0};
    ErrorGroup group(ctx);
    for (size_t i = 0; i < workers; ++i) {
        group.go([&]() -> std::expected<void, RangeErrorInfo> {
            while (!group.context().done()) {
                auto task = queue.pop();
                if (!task) return {};
                if (auto res = read_chunk(*reader, group.context(), task->content, task->offset, config); !res) {
                    return res;
                }
                completed.fetch_add(1, std::memory_order_relaxed);
            }
            return {};
        });
    }

    if (auto res = group.wait(); !res) return std::unexpected(res.error());
    if (completed.load() != task_count) return std::unexpected(incomplete_error(ctx));

    compact::Log::info("download " + std::string(url) + " complete");
    return buf;
}

std::expected<std::vector<char>, RangeErrorInfo> download_with_checksum(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    std::string_view expected_sha256_hex,
    const DownloadConfig& config
) {
    auto result = download(ctx, std::move(executor), url, config);
    if (!result) return result;
    if (auto ok = verify_sha256(*result, expected_sha256_hex); !ok) {
        compact::Log::warn("checksum mismatch for " + std::string(url));
        return std::unexpected(ok.error());
    }
    return result;
}

std::expected<void, RangeErrorInfo> download_to_file(
    const Context& ctx,
    std::shared_ptr<IRequestExecutor> executor,
    std::string_view url,
    const std::filesystem::path& path,
    const DownloadConfig& config
) {
    auto reader = open_reader(ctx, std::move(executor), url, config);
    if (!reader) return std::unexpected(reader.error());

    const int64_t total_size = reader->size();
    std::vector<FileTask> tasks;
    try {
        tasks = plan_file_tasks(total_size, config.chunk_size);
    } catch (const std::bad_alloc&) {
        return std::unexpected(too_large(total_size));
    } catch (const std::length_error&) {
        return std::unexpected(too_large(total_size));
    }

    auto writer = AsyncFileWriter::create(path, total_size);
    if (!writer) return std::unexpected(writer.error());

    const size_t task_count = tasks.size();
    const size_t workers = worker_count_for(config, task_count);

    compact::Log::info("download " + std::string(url) + " -> " + path.string() + ": " +
                       compact::num(total_size) + " bytes, " + compact::num(task_count) + " chunks, " +
                       compact::num(workers) + " workers");

    Channel<FileTask> queue(task_count);
    fill_queue(queue, std::move(tasks));
    Channel<ChunkResult> results(workers);

    ErrorGroup group(ctx);
    if (task_count > 0) {
        for (size_t i = 0; i < workers; ++i) {
            group.go([&]() -> std::expected<void, RangeErrorInfo> {
                while (!group.context().done()) {
                    auto task = queue.pop();
                    if (!task) return {};
                    ChunkResult chunk{task->offset, std::vector<char>(static_cast<size_t>(task->size))};
                    if (auto res = read_chunk(*reader, group.context(), chunk.content, chunk.offset, config); !res) {
                        return res;
                    }
                    if (!results.push(std::move(chunk), group.context())) return {};
                }
                return {};
            });
        }

        // Single writer: all disk writes go through one descriptor owner.
        group.go([&]() { return writer->drain(results, group.context()); });
    }

    if (auto res = group.wait(); !res) return std::unexpected(res.error());
    if (writer->bytes_written() != total_size) return std::unexpected(incomplete_error(ctx));
    if (auto res = writer->sync(); !res) return res;
    if (auto res = writer->close(); !res) return res;

    compact::Log::info("download " + std::string(url) + " complete: " + path.string());
    return {};
}

} // namespace rangefetch
