#include "channel.hpp"
#include "context.hpp"
#include "error_group.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace rangefetch;
using namespace std::chrono_literals;

static void test_context_chain() {
    auto root = Context::background();
    assert(!root.done());
    assert(!root.deadline());

    auto child = root.with_cancel();
    auto grandchild = child.with_timeout(1h);
    child.cancel();
    assert(child.done() && grandchild.done());
    assert(grandchild.err()->error == RangeError::Cancelled);
    assert(!root.done());

    auto expired = root.with_timeout(-1ms);
    assert(expired.err() && expired.err()->error == RangeError::Timeout);

    auto outer = root.with_timeout(10ms);
    auto inner = outer.with_timeout(1h);
    assert(inner.deadline() == outer.deadline());
}

static void test_first_error_wins() {
    ErrorGroup group(Context::background());
    std::atomic<int> quiet_exits{0};

    group.go([] () -> std::expected<void, RangeErrorInfo> {
        return std::unexpected(RangeErrorInfo{RangeError::ValidationFailed, "first"});
    });
    for (int i = 0; i < 4; ++i) {
        group.go([&] () -> std::expected<void, RangeErrorInfo> {
            while (!group.context().done()) std::this_thread::sleep_for(1ms);
            quiet_exits.fetch_add(1);
            return {};
        });
    }

    auto result = group.wait();
    assert(!result);
    assert(result.error().error == RangeError::ValidationFailed);
    assert(result.error().message == "first");
    assert(quiet_exits.load() == 4);
}

static void test_success_cancels_after_wait() {
    ErrorGroup group(Context::background());
    std::atomic<int> ran{0};
    for (int i = 0; i < 3; ++i) {
        group.go([&] () -> std::expected<void, RangeErrorInfo> { ran.fetch_add(1); return {}; });
    }
    assert(group.wait());
    assert(ran.load() == 3);
    assert(group.context().done());
}

static void test_channel_close_drains() {
    Channel<int> ch(4);
    assert(ch.push(1));
    assert(ch.push(2));
    ch.close();
    assert(!ch.push(3));
    assert(ch.pop() == 1);
    assert(ch.pop() == 2);
    assert(!ch.pop());
}

static void test_channel_respects_context() {
    Channel<int> ch(1);
    assert(ch.push(7));

    auto ctx = Context::background().with_cancel();
    std::jthread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });
    // Full channel: the push gives up once the context is cancelled.
    assert(!ch.push(8, ctx));
    canceller.join();

    assert(ch.pop(ctx) == 7);
    Channel<int> empty(1);
    assert(!empty.pop(ctx));
}

static void test_channel_bounded_handoff() {
    Channel<int> ch(2);
    std::atomic<long> sum{0};
    std::jthread consumer([&] {
        while (auto v = ch.pop()) sum.fetch_add(*v);
    });
    for (int i = 1; i <= 1000; ++i) assert(ch.push(i));
    ch.close();
    consumer.join();
    assert(sum.load() == 500500);
}

int main() {
    test_context_chain();
    test_first_error_wins();
    test_success_cancels_after_wait();
    test_channel_close_drains();
    test_channel_respects_context();
    test_channel_bounded_handoff();
    std::cout << "✓ error group tests passed\n";
    return 0;
}
