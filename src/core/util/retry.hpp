/// @file retry.hpp
/// @brief Retry with exponential backoff for fallible operations
///
/// The engine never retries on its own. Callers that want to ride out
/// transient failures wrap an operation returning std::expected:
/// @code
/// auto result = laxy::retry(RetryPolicy{.max_retries = 2},
///                           [&] { return engine.copy(sources, dest); });
/// @endcode

#pragma once

#include <algorithm>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <type_traits>
#include <utility>

#include "logger.hpp"

namespace laxy {

/// @brief Retry schedule
struct RetryPolicy {
    int max_retries = 3;  // attempts after the first one
    std::chrono::milliseconds initial_delay{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_delay{5000};

    /// @brief Delay before retry number @p attempt (0-based)
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const {
        double delay = static_cast<double>(initial_delay.count());
        for (int i = 0; i < attempt; ++i) {
            delay *= backoff_multiplier;
        }
        auto capped = std::min(delay, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }
};

namespace detail {

template <typename R>
concept ExpectedLike = requires(R r) {
    { static_cast<bool>(r) };
    r.error();
};

// Sleep that wakes early when a stop is requested
inline bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop_token) {
    if (delay.count() <= 0) {
        return !stop_token.stop_requested();
    }
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop_token, delay, [] { return false; });
    return !stop_token.stop_requested();
}

}  // namespace detail

/// @brief Run @p operation until it succeeds or the policy is exhausted
/// @param policy Retry schedule
/// @param operation Callable returning an expected-like result
/// @param should_retry Predicate on the error; false stops retrying early
/// @param stop_token Aborts the backoff wait
/// @return The last result produced by @p operation
template <std::invocable F, typename Pred = std::nullptr_t>
    requires detail::ExpectedLike<std::invoke_result_t<F>>
[[nodiscard]] auto retry(const RetryPolicy& policy, F&& operation, Pred should_retry = nullptr,
                         std::stop_token stop_token = {}) -> std::invoke_result_t<F> {
    auto result = std::invoke(operation);
    for (int attempt = 0; !result && attempt < policy.max_retries; ++attempt) {
        if constexpr (!std::is_same_v<Pred, std::nullptr_t>) {
            if (!should_retry(result.error())) {
                break;
            }
        }

        auto delay = policy.delayFor(attempt);
        LOG_DEBUG("Attempt {} failed, retrying in {} ms", attempt + 1, delay.count());
        if (!detail::interruptibleSleep(delay, stop_token)) {
            break;
        }

        result = std::invoke(operation);
        if (result) {
            LOG_INFO("Operation succeeded on attempt {}", attempt + 2);
        }
    }
    return result;
}

/// @brief Like retry(), but substitutes @p fallback once attempts run out
template <std::invocable F, typename T>
    requires detail::ExpectedLike<std::invoke_result_t<F>>
[[nodiscard]] auto retryOr(const RetryPolicy& policy, F&& operation, T&& fallback) {
    auto result = retry(policy, std::forward<F>(operation));
    using Value = typename std::invoke_result_t<F>::value_type;
    if (result) {
        return Value(std::move(*result));
    }
    LOG_WARN("Operation failed after {} attempts, using fallback", policy.max_retries + 1);
    return Value(std::forward<T>(fallback));
}

}  // namespace laxy
