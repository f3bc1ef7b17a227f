#include "content_range.hpp"
#include <charconv>
#include <optional>
#include <vector>

namespace rangefetch {

namespace {

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    while (true) {
        auto pos = s.find(sep);
        parts.push_back(s.substr(0, pos));
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return parts;
}

std::optional<int64_t> parse_non_negative(std::string_view s) {
    if (s.empty() || s.front() == '-') return std::nullopt;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::unexpected<RangeErrorInfo> parse_failure(std::string_view value) {
    std::string msg = "invalid Content-Range \"";
    msg += value;
    msg += '"';
    return std::unexpected(RangeErrorInfo{RangeError::ParseError, std::move(msg)});
}

} // namespace

std::expected<ContentRange, RangeErrorInfo> parse_content_range(std::string_view value) {
    ContentRange cr;

    auto tokens = split(value, ' ');
    if (tokens.size() != 2 || tokens[0] != "bytes") return parse_failure(value);

    auto halves = split(tokens[1], '/');
    if (halves.size() != 2) return parse_failure(value);

    if (halves[1] != "*") {
        auto length = parse_non_negative(halves[1]);
        if (!length) return parse_failure(value);
        cr.length = *length;
    }

    if (halves[0] != "*") {
        auto bounds = split(halves[0], '-');
        if (bounds.size() != 2) return parse_failure(value);
        auto first = parse_non_negative(bounds[0]);
        auto last = parse_non_negative(bounds[1]);
        if (!first || !last) return parse_failure(value);
        cr.first = *first;
        cr.last = *last;
    }

    if (cr.first == -1 && cr.last == -1 && cr.length == -1) return parse_failure(value);
    return cr;
}

std::expected<ResourceMetadata, RangeErrorInfo> extract_metadata(const HttpResponse& resp) {
    ResourceMetadata meta;
    meta.last_modified = HttpProtocol::get_header_or_empty(resp, kHeaderLastModified);
    meta.etag = HttpProtocol::get_header_or_empty(resp, kHeaderETag);
    meta.content_type = HttpProtocol::get_header_or_empty(resp, kHeaderContentType);

    if (resp.status_code == kStatusOk) {
        meta.size = resp.content_length;
    } else if (resp.status_code == kStatusPartialContent) {
        if (auto header = HttpProtocol::get_header(resp, kHeaderContentRange)) {
            auto cr = parse_content_range(*header);
            if (!cr) return std::unexpected(cr.error());
            meta.start = cr->first;
            meta.end = cr->last;
            meta.size = cr->length;
        }
    }
    return meta;
}

} // namespace rangefetch
