#pragma once

#include "context.hpp"
#include "range_error.hpp"
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace rangefetch {

// Runs tasks on their own threads under a shared child context. The first
// task to fail has its error kept and cancels the context; the others are
// expected to notice and return success.
class ErrorGroup {
public:
    using Task = std::function<std::expected<void, RangeErrorInfo>()>;

    explicit ErrorGroup(const Context& parent);
    ~ErrorGroup();

    ErrorGroup(const ErrorGroup&) = delete;
    ErrorGroup& operator=(const ErrorGroup&) = delete;

    const Context& context() const { return ctx_; }

    void go(Task task);

    // Joins every task, cancels the context and returns the first error.
    std::expected<void, RangeErrorInfo> wait();

private:
    void fail(RangeErrorInfo error);

    Context ctx_;
    std::vector<std::jthread> threads_;
    std::mutex error_mutex_;
    std::optional<RangeErrorInfo> first_error_;
};

} // namespace rangefetch
