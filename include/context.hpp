#pragma once

#include "range_error.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace rangefetch {

// Cancellation scope with an optional deadline. Copies share state; children
// observe their parent's cancellation and deadline but cancelling a child
// never reaches the parent.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    static Context background();

    Context with_cancel() const;
    Context with_timeout(Clock::duration timeout) const;
    Context with_deadline(Clock::time_point deadline) const;

    void cancel() const;

    bool done() const { return err().has_value(); }

    // Cancelled when this scope or an ancestor was cancelled, Timeout when
    // the earliest deadline in the chain has passed.
    std::optional<RangeErrorInfo> err() const;

    // Earliest deadline in the chain.
    std::optional<Clock::time_point> deadline() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace rangefetch
