#include "error_group.hpp"
#include "compact_log.hpp"

namespace rangefetch {

ErrorGroup::ErrorGroup(const Context& parent) : ctx_(parent.with_cancel()) {}

ErrorGroup::~ErrorGroup() {
    ctx_.cancel();
    threads_.clear();
}

void ErrorGroup::go(Task task) {
    threads_.emplace_back([this, task = std::move(task)] {
        auto result = task();
        if (!result) fail(std::move(result.error()));
    });
}

void ErrorGroup::fail(RangeErrorInfo error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (first_error_) {
            compact::Log::debug("suppressed later error: " + describe(error));
            return;
        }
        compact::Log::info("first error, cancelling siblings: " + describe(error));
        first_error_ = std::move(error);
    }
    ctx_.cancel();
}

std::expected<void, RangeErrorInfo> ErrorGroup::wait() {
    threads_.clear();
    ctx_.cancel();
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (first_error_) return std::unexpected(*first_error_);
    return {};
}

} // namespace rangefetch
