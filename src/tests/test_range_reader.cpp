#include "range_reader.hpp"
#include "mock_range_server.hpp"
#include <cassert>
#include <cstring>
#include <iostream>
#include <limits>

using namespace rangefetch;
using rangefetch::testing::MockRangeServer;
using rangefetch::testing::make_payload;

static HttpRequest get_request(const std::string& url = "http://example.test/file.bin") {
    HttpRequest req;
    req.url = url;
    return req;
}

static void test_construction_arguments() {
    auto reader = RangeReader::create(nullptr, get_request());
    assert(!reader && reader.error().error == RangeError::InvalidArgument);

    auto server = std::make_shared<MockRangeServer>("hello");
    HttpRequest head = get_request();
    head.method = "HEAD";
    reader = RangeReader::create(server, head);
    assert(!reader && reader.error().error == RangeError::InvalidArgument);

    reader = RangeReader::create(server, get_request(""));
    assert(!reader && reader.error().error == RangeError::InvalidArgument);
    assert(server->request_count() == 0);
}

static void test_probe_reads_metadata() {
    auto server = std::make_shared<MockRangeServer>(make_payload(1234));
    server->content_type = "application/zip";
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    assert(reader->size() == 1234);
    assert(reader->etag() == "\"v1\"");
    assert(reader->content_type() == "application/zip");
    assert(reader->last_modified() == "Wed, 21 Oct 2015 07:28:00 GMT");
    assert(server->request_count() == 1);
    assert(server->ranges().front() == "bytes=0-0");
}

static void test_probe_rejects_full_response() {
    auto server = std::make_shared<MockRangeServer>("whole body");
    server->ignore_range = true;
    auto reader = RangeReader::create(server, get_request());
    assert(!reader);
    assert(reader.error().error == RangeError::UnsupportedRange);
    assert(reader.error().status_code == 200);
}

static void test_probe_transport_failure() {
    auto server = std::make_shared<MockRangeServer>("x");
    server->fail_after = 0;
    auto reader = RangeReader::create(server, get_request());
    assert(!reader && reader.error().error == RangeError::TransportError);
}

static void test_read_inside_resource() {
    auto payload = make_payload(1000);
    auto server = std::make_shared<MockRangeServer>(payload);
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    std::vector<char> buf(100);
    auto n = reader->read_at(buf, 250);
    assert(n && n->bytes == 100 && !n->eof);
    assert(std::memcmp(buf.data(), payload.data() + 250, 100) == 0);
    assert(server->ranges().back() == "bytes=250-349");

    // Ending exactly on the last byte is not clamped.
    n = reader->read_at(buf, 900);
    assert(n && n->bytes == 100 && !n->eof);
    assert(std::memcmp(buf.data(), payload.data() + 900, 100) == 0);
}

static void test_read_straddling_end() {
    auto payload = make_payload(1000);
    auto server = std::make_shared<MockRangeServer>(payload);
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    std::vector<char> buf(100, 0);
    auto n = reader->read_at(buf, 950);
    assert(n && n->bytes == 50 && n->eof);
    assert(std::memcmp(buf.data(), payload.data() + 950, 50) == 0);
    assert(server->ranges().back() == "bytes=950-999");
}

static void test_read_past_end() {
    auto server = std::make_shared<MockRangeServer>(make_payload(1000));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    int before = server->request_count();

    std::vector<char> buf(10);
    auto n = reader->read_at(buf, 1000);
    assert(n && n->bytes == 0 && n->eof);
    n = reader->read_at(buf, 5000);
    assert(n && n->bytes == 0 && n->eof);
    assert(server->request_count() == before);
}

static void test_offset_near_int64_max() {
    auto server = std::make_shared<MockRangeServer>(make_payload(1000));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    int before = server->request_count();

    std::vector<char> buf(100);
    const int64_t huge = std::numeric_limits<int64_t>::max() - 5;
    auto n = reader->read_at(buf, huge);
    assert(n && n->bytes == 0 && n->eof);
    n = reader->read_at(buf, std::numeric_limits<int64_t>::max());
    assert(n && n->bytes == 0 && n->eof);
    assert(server->request_count() == before);

    auto unsized = std::make_shared<MockRangeServer>(make_payload(1000));
    unsized->hide_total = true;
    auto open_ended = RangeReader::create(unsized, get_request());
    assert(open_ended && open_ended->size() == -1);
    before = unsized->request_count();
    n = open_ended->read_at(buf, huge);
    assert(!n && n.error().error == RangeError::InvalidArgument);
    assert(unsized->request_count() == before);
}

static void test_zero_length_and_negative_offset() {
    auto server = std::make_shared<MockRangeServer>(make_payload(10));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    int before = server->request_count();

    std::span<char> empty;
    auto n = reader->read_at(empty, 3);
    assert(n && n->bytes == 0 && !n->eof);
    assert(server->request_count() == before);

    std::vector<char> buf(4);
    n = reader->read_at(buf, -1);
    assert(!n && n.error().error == RangeError::InvalidArgument);
}

static void test_etag_change_is_detected() {
    auto server = std::make_shared<MockRangeServer>(make_payload(500));
    server->change_etag_after = 1;
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    std::vector<char> buf(10);
    auto n = reader->read_at(buf, 0);
    assert(!n && n.error().error == RangeError::ValidationFailed);
}

static void test_last_modified_and_size_changes_are_detected() {
    auto touched = std::make_shared<MockRangeServer>(make_payload(500));
    touched->change_last_modified_after = 1;
    auto reader = RangeReader::create(touched, get_request());
    assert(reader);

    std::vector<char> buf(10);
    auto n = reader->read_at(buf, 0);
    assert(!n && n.error().error == RangeError::ValidationFailed);

    auto grown = std::make_shared<MockRangeServer>(make_payload(500));
    grown->grow_size_after = 1;
    reader = RangeReader::create(grown, get_request());
    assert(reader && reader->size() == 500);
    n = reader->read_at(buf, 0);
    assert(!n && n.error().error == RangeError::ValidationFailed);
}

static void test_status_other_than_206() {
    auto server = std::make_shared<MockRangeServer>(make_payload(500));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    server->ignore_range = true;
    std::vector<char> buf(10);
    auto n = reader->read_at(buf, 10);
    assert(!n && n.error().error == RangeError::UnsupportedRange);
}

static void test_range_mismatch() {
    auto server = std::make_shared<MockRangeServer>(make_payload(500));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    std::vector<char> buf(10);
    server->shift_start = 1;
    auto n = reader->read_at(buf, 20);
    assert(!n && n.error().error == RangeError::RangeMismatch);

    server->shift_start = 0;
    server->extend_end = 5;
    n = reader->read_at(buf, 20);
    assert(!n && n.error().error == RangeError::RangeMismatch);
}

static void test_length_mismatch() {
    auto server = std::make_shared<MockRangeServer>(make_payload(500));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    std::vector<char> buf(10);
    server->omit_content_length = true;
    auto n = reader->read_at(buf, 0);
    assert(!n && n.error().error == RangeError::LengthMismatch);

    server->omit_content_length = false;
    server->pad_body = true;
    n = reader->read_at(buf, 0);
    assert(!n && n.error().error == RangeError::LengthMismatch);
}

static void test_truncated_body() {
    auto server = std::make_shared<MockRangeServer>(make_payload(500));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    server->truncate_body = true;
    std::vector<char> buf(10);
    auto n = reader->read_at(buf, 100);
    assert(!n && n.error().error == RangeError::TransportError);
}

static void test_unknown_size_is_not_clamped() {
    auto payload = make_payload(300);
    auto server = std::make_shared<MockRangeServer>(payload);
    server->hide_total = true;
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    assert(reader->size() == -1);

    std::vector<char> buf(50);
    auto n = reader->read_at(buf, 100);
    assert(n && n->bytes == 50 && !n->eof);
    assert(std::memcmp(buf.data(), payload.data() + 100, 50) == 0);
}

static void test_derived_reader_reuses_metadata() {
    auto payload = make_payload(4096);
    auto server = std::make_shared<MockRangeServer>(payload);
    auto reader = RangeReader::create(server, get_request());
    assert(reader);
    assert(server->request_count() == 1);

    auto scoped = reader->with_context(Context::background().with_timeout(std::chrono::seconds(30)));
    assert(server->request_count() == 1);
    assert(scoped.size() == 4096 && scoped.etag() == reader->etag());

    std::vector<char> buf(64);
    auto n = scoped.read_at(buf, 1024);
    assert(n && n->bytes == 64);
    assert(std::memcmp(buf.data(), payload.data() + 1024, 64) == 0);
    auto timeout = server->timeouts().back();
    assert(timeout.count() > 0 && timeout <= std::chrono::seconds(30));

    auto cancelled = Context::background().with_cancel();
    cancelled.cancel();
    n = reader->with_context(cancelled).read_at(buf, 0);
    assert(!n && n.error().error == RangeError::Cancelled);
}

static void test_deadline_exceeded_during_request() {
    auto server = std::make_shared<MockRangeServer>(make_payload(4096));
    auto reader = RangeReader::create(server, get_request());
    assert(reader);

    server->delay = std::chrono::milliseconds(150);
    auto scoped = reader->with_context(Context::background().with_timeout(std::chrono::milliseconds(20)));
    std::vector<char> buf(64);
    auto n = scoped.read_at(buf, 0);
    assert(!n && n.error().error == RangeError::Timeout);
}

int main() {
    test_construction_arguments();
    test_probe_reads_metadata();
    test_probe_rejects_full_response();
    test_probe_transport_failure();
    test_read_inside_resource();
    test_read_straddling_end();
    test_read_past_end();
    test_offset_near_int64_max();
    test_zero_length_and_negative_offset();
    test_etag_change_is_detected();
    test_last_modified_and_size_changes_are_detected();
    test_status_other_than_206();
    test_range_mismatch();
    test_length_mismatch();
    test_truncated_body();
    test_unknown_size_is_not_clamped();
    test_derived_reader_reuses_metadata();
    test_deadline_exceeded_during_request();
    std::cout << "✓ range reader tests passed\n";
    return 0;
}
