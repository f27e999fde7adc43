#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace toolbridge {

// ---------------------------------------------------------------------------
// RunWithDeadline: run `fn` on its own thread and wait at most `budget`.
//
// Returns the value when `fn` finishes in time, nullopt when the budget
// elapses first. An exception thrown by `fn` is rethrown to the caller.
//
// On timeout the worker is abandoned, not killed: it keeps running until
// `fn` returns, and everything `fn` captured stays alive until then.
// Capture shared ownership (shared_ptr) of anything the work touches.
// ---------------------------------------------------------------------------
template <typename Fn>
auto RunWithDeadline(Fn fn, std::chrono::milliseconds budget)
    -> std::optional<std::invoke_result_t<Fn>> {
    using T = std::invoke_result_t<Fn>;

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(budget) == std::future_status::timeout) {
        return std::nullopt;
    }
    return future.get();
}

} // namespace toolbridge
