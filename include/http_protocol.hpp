#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rangefetch {

inline constexpr std::string_view kHeaderRange = "Range";
inline constexpr std::string_view kHeaderContentLength = "Content-Length";
inline constexpr std::string_view kHeaderContentRange = "Content-Range";
inline constexpr std::string_view kHeaderContentDisposition = "Content-Disposition";
inline constexpr std::string_view kHeaderContentType = "Content-Type";
inline constexpr std::string_view kHeaderLastModified = "Last-Modified";
inline constexpr std::string_view kHeaderETag = "ETag";

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusPartialContent = 206;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    // Zero means no per-request limit beyond the transport's own.
    std::chrono::milliseconds timeout{0};
};

struct HttpResponse {
    int status_code = 0;
    std::string status_message;
    std::map<std::string, std::string> headers;
    int64_t content_length = -1;  // -1 when the server sent none
    std::string body;
};

class HttpProtocol {
public:
    // "bytes=<first>-<last>", both bounds inclusive.
    static std::string format_range(int64_t first, int64_t last);

    // Replaces any existing header with the same name, ignoring case.
    static void set_header(HttpRequest& req, std::string_view name, std::string_view value);

    static bool has_header(const HttpRequest& req, std::string_view name);
    static std::optional<std::string> get_header(const HttpResponse& resp, std::string_view name);
    static std::string get_header_or_empty(const HttpResponse& resp, std::string_view name);

    // Parses a header block line by line ("Name: value\r\n"), keeping the
    // status line out. Later duplicates overwrite earlier ones.
    static void parse_header_block(std::string_view block, HttpResponse& resp);

    static bool iequals(std::string_view a, std::string_view b);
};

} // namespace rangefetch
