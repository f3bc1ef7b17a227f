#include "context.hpp"

namespace rangefetch {

Context Context::background() {
    return Context(std::make_shared<State>());
}

Context Context::with_cancel() const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    return Context(std::move(child));
}

Context Context::with_timeout(Clock::duration timeout) const {
    return with_deadline(Clock::now() + timeout);
}

Context Context::with_deadline(Clock::time_point deadline) const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    child->deadline = deadline;
    return Context(std::move(child));
}

void Context::cancel() const {
    state_->cancelled.store(true, std::memory_order_release);
}

std::optional<RangeErrorInfo> Context::err() const {
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) {
            return RangeErrorInfo{RangeError::Cancelled, "context cancelled"};
        }
    }
    if (auto dl = deadline(); dl && Clock::now() >= *dl) {
        return RangeErrorInfo{RangeError::Timeout, "deadline exceeded"};
    }
    return std::nullopt;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest)) earliest = s->deadline;
    }
    return earliest;
}

} // namespace rangefetch
