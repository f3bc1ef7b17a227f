#include "content_range.hpp"
#include <cassert>
#include <iostream>

using namespace rangefetch;

static void expect_ok(std::string_view value, int64_t first, int64_t last, int64_t length) {
    auto cr = parse_content_range(value);
    assert(cr && "expected Content-Range to parse");
    assert(cr->first == first);
    assert(cr->last == last);
    assert(cr->length == length);
}

static void expect_fail(std::string_view value) {
    auto cr = parse_content_range(value);
    assert(!cr && "expected Content-Range to be rejected");
    assert(cr.error().error == RangeError::ParseError);
}

static void test_valid_forms() {
    expect_ok("bytes 42-1233/1234", 42, 1233, 1234);
    expect_ok("bytes 42-1233/*", 42, 1233, -1);
    expect_ok("bytes */1234", -1, -1, 1234);
    expect_ok("bytes 0-0/1", 0, 0, 1);
    expect_ok("bytes 0-0/9223372036854775807", 0, 0, 9223372036854775807LL);
}

static void test_invalid_forms() {
    expect_fail("garbage");
    expect_fail("bytes 42-1233");
    expect_fail("bytes -/-");
    expect_fail("bytes */*");
    expect_fail("");
    expect_fail("bytes");
    expect_fail("Bytes 0-1/2");
    expect_fail("items 0-1/2");
    expect_fail("bytes 0-1/2 extra");
    expect_fail("bytes  0-1/2");
    expect_fail("bytes 0-1/2/3");
    expect_fail("bytes 0-1-2/3");
    expect_fail("bytes 0-/3");
    expect_fail("bytes -1/3");
    expect_fail("bytes 0-1/-3");
    expect_fail("bytes a-1/3");
    expect_fail("bytes 0-1/3x");
    expect_fail("bytes 0-1/99999999999999999999");
}

static void test_metadata_from_partial_response() {
    HttpResponse resp;
    resp.status_code = 206;
    resp.headers["content-range"] = "bytes 0-0/5000";
    resp.headers["ETag"] = "\"abc\"";
    resp.headers["last-modified"] = "Tue, 01 Jan 2030 00:00:00 GMT";
    resp.headers["Content-Type"] = "text/plain";
    resp.content_length = 1;

    auto meta = extract_metadata(resp);
    assert(meta);
    assert(meta->start == 0 && meta->end == 0 && meta->size == 5000);
    assert(meta->etag == "\"abc\"");
    assert(meta->last_modified == "Tue, 01 Jan 2030 00:00:00 GMT");
    assert(meta->content_type == "text/plain");
}

static void test_metadata_edge_cases() {
    HttpResponse full;
    full.status_code = 200;
    full.content_length = 77;
    auto meta = extract_metadata(full);
    assert(meta && meta->size == 77 && meta->start == -1 && meta->end == -1);

    HttpResponse no_range;
    no_range.status_code = 206;
    meta = extract_metadata(no_range);
    assert(meta && meta->size == -1 && meta->start == -1);

    HttpResponse bad_range;
    bad_range.status_code = 206;
    bad_range.headers["Content-Range"] = "bytes nonsense";
    meta = extract_metadata(bad_range);
    assert(!meta && meta.error().error == RangeError::ParseError);
}

int main() {
    test_valid_forms();
    test_invalid_forms();
    test_metadata_from_partial_response();
    test_metadata_edge_cases();
    std::cout << "✓ content range tests passed\n";
    return 0;
}
