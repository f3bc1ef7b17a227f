#pragma once

#include "http_protocol.hpp"
#include "range_error.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace rangefetch {

// Content-Range: bytes 42-1233/1234
// Content-Range: bytes 42-1233/*
// Content-Range: bytes */1234
// Unknown fields are -1.
struct ContentRange {
    int64_t first = -1;
    int64_t last = -1;
    int64_t length = -1;
};

std::expected<ContentRange, RangeErrorInfo> parse_content_range(std::string_view value);

// Identity of a remote resource as seen in one response.
struct ResourceMetadata {
    int64_t start = -1;
    int64_t end = -1;
    int64_t size = -1;
    std::string last_modified;
    std::string etag;
    std::string content_type;

    // Same resource version: size, Last-Modified and ETag all agree.
    bool same_resource(const ResourceMetadata& other) const {
        return size == other.size && last_modified == other.last_modified && etag == other.etag;
    }
};

std::expected<ResourceMetadata, RangeErrorInfo> extract_metadata(const HttpResponse& resp);

} // namespace rangefetch
