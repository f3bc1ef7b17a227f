#pragma once

#include "http_protocol.hpp"
#include "range_error.hpp"
#include <string>
#include <expected>
#include <memory>

namespace rangefetch {

// Synchronous "GET in, response out" capability. Implementations must be
// safe to call from several threads at once.
class IRequestExecutor {
public:
    virtual ~IRequestExecutor() = default;
    virtual std::expected<HttpResponse, RangeErrorInfo> execute(const HttpRequest& req) = 0;
};

struct HttpConfig {
    size_t buffer_size = 512 * 1024;        // 512KB default
    long connect_timeout_seconds = 30;
    long timeout_seconds = 0;               // whole request, 0 = none
    bool enable_http2 = true;
    bool enable_tcp_nodelay = true;
    bool enable_tcp_keepalive = true;
    bool follow_redirects = true;
    std::string user_agent = "rangefetch/1.0";
};

// libcurl backed executor. Every call uses its own easy handle, so one
// HttpClient can be shared by all download workers. For requests with a
// Range header the body of a non-206 answer is dropped unread, and bodies
// are never kept past one byte beyond the declared Content-Length.
class HttpClient : public IRequestExecutor {
public:
    HttpClient();
    explicit HttpClient(const HttpConfig& config);
    ~HttpClient() override;

    // Delete copy operations
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, RangeErrorInfo> execute(const HttpRequest& req) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace rangefetch
