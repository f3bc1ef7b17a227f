#include "range_reader.hpp"
#include "compact_log.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace rangefetch {

namespace {

RangeErrorInfo unexpected_status(const HttpResponse& resp) {
    std::string msg = "unexpected status ";
    msg += std::to_string(resp.status_code);
    if (!resp.status_message.empty()) {
        msg += ' ';
        msg += resp.status_message;
    }
    msg += ", expected 206";
    return RangeErrorInfo{RangeError::UnsupportedRange, std::move(msg), resp.status_code};
}

std::string range_text(int64_t first, int64_t last) {
    return std::to_string(first) + "-" + std::to_string(last);
}

} // namespace

std::expected<RangeReader, RangeErrorInfo> RangeReader::create(
    std::shared_ptr<IRequestExecutor> executor,
    HttpRequest prototype,
    Context ctx
) {
    if (!executor) {
        return std::unexpected(RangeErrorInfo{RangeError::InvalidArgument, "request executor is null"});
    }
    if (prototype.method != "GET") {
        return std::unexpected(RangeErrorInfo{RangeError::InvalidArgument,
            "invalid HTTP method " + prototype.method + ", must be GET"});
    }
    if (prototype.url.empty()) {
        return std::unexpected(RangeErrorInfo{RangeError::InvalidArgument, "request URL is empty"});
    }

    RangeReader reader(std::move(executor), std::move(prototype), std::move(ctx));
    if (auto res = reader.probe(); !res) return std::unexpected(res.error());
    return reader;
}

RangeReader RangeReader::with_context(Context ctx) const {
    RangeReader copy = *this;
    copy.ctx_ = std::move(ctx);
    return copy;
}

std::expected<void, RangeErrorInfo> RangeReader::probe() {
    auto resp = send_range(0, 0);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status_code != kStatusPartialContent) return std::unexpected(unexpected_status(*resp));

    auto meta = extract_metadata(*resp);
    if (!meta) return std::unexpected(meta.error());
    meta_ = std::move(*meta);

    compact::Log::debug("probe " + prototype_.url + ": size=" + compact::num(meta_.size) +
                        " etag=" + meta_.etag + " last-modified=" + meta_.last_modified);
    return {};
}

std::expected<HttpResponse, RangeErrorInfo> RangeReader::send_range(int64_t first, int64_t last) const {
    if (auto err = ctx_.err()) return std::unexpected(*err);

    HttpRequest req = prototype_;
    HttpProtocol::set_header(req, kHeaderRange, HttpProtocol::format_range(first, last));

    auto deadline = ctx_.deadline();
    if (deadline) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Context::Clock::now());
        if (remaining.count() <= 0) {
            return std::unexpected(RangeErrorInfo{RangeError::Timeout, "deadline exceeded"});
        }
        req.timeout = remaining;
    }

    auto resp = executor_->execute(req);
    if (deadline && Context::Clock::now() >= *deadline) {
        return std::unexpected(RangeErrorInfo{RangeError::Timeout,
            "range " + range_text(first, last) + " not completed before deadline"});
    }
    if (!resp) {
        auto err = resp.error();
        if (err.error != RangeError::Timeout) err.error = RangeError::TransportError;
        err.message = "http request error: " + err.message;
        return std::unexpected(std::move(err));
    }
    return resp;
}

std::expected<ReadResult, RangeErrorInfo> RangeReader::read_at(std::span<char> buffer, int64_t offset) const {
    if (buffer.empty()) return ReadResult{};
    if (offset < 0) {
        return std::unexpected(RangeErrorInfo{RangeError::InvalidArgument, "negative offset"});
    }

    int64_t first = offset;
    bool clamped = false;

    // Some servers answer 416 when the range runs past the end, so never ask.
    if (meta_.size != -1) {
        if (offset >= meta_.size) return ReadResult{0, true};
        auto remaining = static_cast<uint64_t>(meta_.size - offset);
        if (buffer.size() > remaining) {
            buffer = buffer.first(static_cast<size_t>(remaining));
            clamped = true;
        }
    } else if (buffer.size() - 1 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max() - offset)) {
        return std::unexpected(RangeErrorInfo{RangeError::InvalidArgument,
            "read at " + compact::num(offset) + " of " + compact::num(buffer.size()) +
            " bytes overflows the byte range"});
    }
    int64_t last = offset + static_cast<int64_t>(buffer.size()) - 1;

    auto resp = send_range(first, last);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status_code != kStatusPartialContent) return std::unexpected(unexpected_status(*resp));

    auto meta = extract_metadata(*resp);
    if (!meta) return std::unexpected(meta.error());
    if (!meta_.same_resource(*meta)) {
        return std::unexpected(RangeErrorInfo{RangeError::ValidationFailed,
            "resource changed since probe (etag \"" + meta_.etag + "\" -> \"" + meta->etag + "\")"});
    }
    if (meta->start != first || meta->end > last) {
        return std::unexpected(RangeErrorInfo{RangeError::RangeMismatch,
            "received different range than requested (req=" + range_text(first, last) +
            ", resp=" + range_text(meta->start, meta->end) + ")"});
    }
    int64_t declared = meta->end - meta->start + 1;
    if (resp->content_length != declared) {
        return std::unexpected(RangeErrorInfo{RangeError::LengthMismatch,
            "content-length " + compact::num(resp->content_length) +
            " does not match content-range length " + compact::num(declared)});
    }
    if (static_cast<int64_t>(resp->body.size()) > declared) {
        return std::unexpected(RangeErrorInfo{RangeError::LengthMismatch,
            "body size " + compact::num(resp->body.size()) +
            " exceeds content-length " + compact::num(declared)});
    }
    if (resp->body.size() < buffer.size()) {
        return std::unexpected(RangeErrorInfo{RangeError::TransportError,
            "truncated body for range " + range_text(first, last) + ": got " +
            compact::num(resp->body.size()) + " of " + compact::num(buffer.size()) + " bytes"});
    }

    std::memcpy(buffer.data(), resp->body.data(), buffer.size());
    return ReadResult{buffer.size(), clamped};
}

} // namespace rangefetch
