/**
 * @file retry.hpp
 * @brief Bounded retry combinator with fixed delay
 *
 * Applied explicitly at the call site:
 *
 * @code
 * RetryPolicy policy{90, std::chrono::milliseconds(750)};
 * auto info = Retry(policy,
 *     [&]() { return QueryOnce(); },
 *     [](const std::exception& e) { return IsTransient(e); });
 * @endcode
 *
 * The operation runs at most max_attempts times. A failure the predicate
 * rejects, or the failure of the last attempt, is rethrown unchanged.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <thread>

namespace runbox {
namespace core {

/**
 * @struct RetryPolicy
 * @brief Attempt cap and delay between attempts
 */
struct RetryPolicy {
    int max_attempts{90};                          ///< Total attempts, including the first
    std::chrono::milliseconds delay{750};          ///< Sleep between two attempts
};

/// Blocking sleep used between attempts; replaced in tests
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void ThreadSleep(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

template <typename Operation, typename ShouldRetry>
auto Retry(const RetryPolicy& policy,
           Operation&& operation,
           ShouldRetry&& should_retry,
           const Sleeper& sleeper = ThreadSleep) -> decltype(operation()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return operation();
        }
        catch (const std::exception& e) {
            if (attempt >= policy.max_attempts || !should_retry(e)) {
                throw;
            }
        }
        sleeper(policy.delay);
    }
}

} // namespace core
} // namespace runbox
