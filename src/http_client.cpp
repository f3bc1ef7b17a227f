#include "http_client.hpp"
#include "compact_log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstdint>

namespace rangefetch {

namespace {

struct Transfer {
    CURL* curl = nullptr;
    bool ranged = false;        // request carried a Range header
    bool started = false;
    bool stopped = false;       // body deliberately cut short
    int64_t body_limit = -1;    // -1: keep everything
    std::string body;
    std::string header_block;
};

// Runs once the final response headers are in. A ranged request answered
// with anything but 206 keeps no body at all; otherwise at most one byte
// past the declared Content-Length is kept, enough to detect an overlong
// body without buffering it.
void start_body(Transfer& t) {
    t.started = true;
    long status = 0;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);
    if (t.ranged && status != kStatusPartialContent) {
        t.body_limit = 0;
        return;
    }
    curl_off_t declared = -1;
    if (curl_easy_getinfo(t.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &declared) == CURLE_OK && declared >= 0) {
        t.body_limit = static_cast<int64_t>(declared) + 1;
    }
}

size_t write_body_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* t = static_cast<Transfer*>(userp);
    if (!t->started) start_body(*t);

    size_t keep = realsize;
    if (t->body_limit >= 0) {
        keep = std::min(keep, static_cast<size_t>(t->body_limit) - t->body.size());
    }
    if (t->body.size() + keep > t->body.max_size()) return 0;
    t->body.append(static_cast<char*>(contents), keep);
    if (keep < realsize) {
        t->stopped = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    return realsize;
}

size_t header_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* block = static_cast<std::string*>(userp);
    block->append(static_cast<char*>(contents), realsize);
    return realsize;
}

void set_http_version(CURL* curl, const HttpConfig& config, std::string_view url) {
    if (config.enable_http2 && url.starts_with("https://")) {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    }
}

RangeErrorInfo curl_failure(CURLcode code) {
    auto kind = code == CURLE_OPERATION_TIMEDOUT ? RangeError::Timeout : RangeError::TransportError;
    return RangeErrorInfo{kind, curl_easy_strerror(code)};
}

} // namespace

class HttpClient::Impl {
public:
    HttpConfig config;
    Impl() { curl_global_init(CURL_GLOBAL_ALL); }
    ~Impl() { curl_global_cleanup(); }
};

HttpClient::HttpClient() : pImpl_(std::make_unique<Impl>()) {}

HttpClient::HttpClient(const HttpConfig& config) : HttpClient() {
    pImpl_->config = config;
}

HttpClient::~HttpClient() = default;

std::expected<HttpResponse, RangeErrorInfo> HttpClient::execute(const HttpRequest& req) {
    const HttpConfig& config = pImpl_->config;

    CURL* curl = curl_easy_init();
    if (!curl) return std::unexpected(RangeErrorInfo{RangeError::TransportError, "Failed to init CURL"});

    Transfer transfer;
    transfer.curl = curl;
    transfer.ranged = HttpProtocol::has_header(req, kHeaderRange);
    struct curl_slist* chunk = nullptr;
    for (const auto& [k, v] : req.headers) {
        std::string h = k; h += ": "; h += v;
        chunk = curl_slist_append(chunk, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, chunk);
    if (req.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
    if (req.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout.count()));
    } else if (config.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config.timeout_seconds);
    }
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, config.enable_tcp_nodelay ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, config.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer.header_block);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(config.buffer_size));
    set_http_version(curl, config, req.url);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(chunk);
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && transfer.stopped)) {
        curl_easy_cleanup(curl);
        compact::Log::debug("request failed: " + req.url + ": " + curl_easy_strerror(res));
        return std::unexpected(curl_failure(res));
    }

    if (transfer.stopped) {
        compact::Log::debug("body of " + req.url + " cut at " + compact::num(transfer.body.size()) + " bytes");
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    HttpProtocol::parse_header_block(transfer.header_block, response);
    response.body = std::move(transfer.body);
    return response;
}

} // namespace rangefetch
