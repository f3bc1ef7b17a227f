#include "http_protocol.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace rangefetch {

std::string HttpProtocol::format_range(int64_t first, int64_t last) {
    std::string out = "bytes=";
    out += std::to_string(first);
    out += '-';
    out += std::to_string(last);
    return out;
}

bool HttpProtocol::iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

void HttpProtocol::set_header(HttpRequest& req, std::string_view name, std::string_view value) {
    std::erase_if(req.headers, [&](const auto& kv) { return iequals(kv.first, name); });
    req.headers.emplace(std::string(name), std::string(value));
}

bool HttpProtocol::has_header(const HttpRequest& req, std::string_view name) {
    return std::any_of(req.headers.begin(), req.headers.end(),
                       [&](const auto& kv) { return iequals(kv.first, name); });
}

std::optional<std::string> HttpProtocol::get_header(const HttpResponse& resp, std::string_view name) {
    for (const auto& [key, value] : resp.headers) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

std::string HttpProtocol::get_header_or_empty(const HttpResponse& resp, std::string_view name) {
    return get_header(resp, name).value_or(std::string{});
}

void HttpProtocol::parse_header_block(std::string_view block, HttpResponse& resp) {
    while (!block.empty()) {
        auto eol = block.find('\n');
        auto line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view{} : block.substr(eol + 1);

        // A new status line starts a fresh header set (redirects, 100-continue).
        if (line.starts_with("HTTP/")) {
            resp.headers.clear();
            resp.status_message.clear();
            // "HTTP/1.1 206 Partial Content"
            if (auto sp = line.find(' '); sp != std::string_view::npos) {
                if (auto sp2 = line.find(' ', sp + 1); sp2 != std::string_view::npos) {
                    auto reason = line.substr(sp2 + 1);
                    resp.status_message = std::string(reason.substr(0, reason.find_last_not_of("\r") + 1));
                }
            }
            continue;
        }
        if (auto colon = line.find(':'); colon != std::string_view::npos) {
            auto key = line.substr(0, colon);
            auto value = line.substr(colon + 1);
            auto start = value.find_first_not_of(" \t");
            if (start == std::string_view::npos) {
                value = {};
            } else {
                value = value.substr(start);
                value = value.substr(0, value.find_last_not_of(" \t\r\n") + 1);
            }
            resp.headers[std::string(key)] = std::string(value);
        }
    }

    if (auto cl = get_header(resp, kHeaderContentLength)) {
        int64_t n = -1;
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), n);
        resp.content_length = (ec == std::errc() && ptr == cl->data() + cl->size() && n >= 0) ? n : -1;
    }
}

} // namespace rangefetch
