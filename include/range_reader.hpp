#pragma once

#include "content_range.hpp"
#include "context.hpp"
#include "http_client.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <span>

namespace rangefetch {

struct ReadResult {
    size_t bytes = 0;
    bool eof = false;  // the read reached the last byte of the resource
};

// Random access over one HTTP resource using Range requests.
//
// create() issues a one byte probe (Range: bytes=0-0) and caches the
// resource metadata. Every later read_at() is checked against that
// snapshot, so a file replaced on the server mid-session is reported as
// RangeError::ValidationFailed instead of producing mixed content.
//
// A RangeReader is immutable after construction and safe for concurrent use.
class RangeReader {
public:
    static std::expected<RangeReader, RangeErrorInfo> create(
        std::shared_ptr<IRequestExecutor> executor,
        HttpRequest prototype,
        Context ctx = Context::background()
    );

    // Same resource, same cached metadata, different cancellation scope.
    // No probe is issued.
    RangeReader with_context(Context ctx) const;

    // Resource length, -1 if the server never sent one.
    int64_t size() const { return meta_.size; }
    const std::string& content_type() const { return meta_.content_type; }
    const std::string& last_modified() const { return meta_.last_modified; }
    const std::string& etag() const { return meta_.etag; }
    const ResourceMetadata& metadata() const { return meta_; }
    const Context& context() const { return ctx_; }

    // Reads up to buffer.size() bytes at offset. Reads that extend past the
    // end of the resource are clamped and return eof = true; reads starting
    // at or after the end return {0, true} without a request.
    std::expected<ReadResult, RangeErrorInfo> read_at(std::span<char> buffer, int64_t offset) const;

private:
    RangeReader(std::shared_ptr<IRequestExecutor> executor, HttpRequest prototype, Context ctx)
        : executor_(std::move(executor)), prototype_(std::move(prototype)), ctx_(std::move(ctx)) {}

    std::expected<void, RangeErrorInfo> probe();
    std::expected<HttpResponse, RangeErrorInfo> send_range(int64_t first, int64_t last) const;

    std::shared_ptr<IRequestExecutor> executor_;
    HttpRequest prototype_;
    ResourceMetadata meta_;
    Context ctx_;
};

} // namespace rangefetch
