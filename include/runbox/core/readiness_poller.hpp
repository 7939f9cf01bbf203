/**
 * @file readiness_poller.hpp
 * @brief Blocks until a devbox reports the running state
 *
 * Devboxes boot asynchronously and the provider API is the only source of
 * truth about their state. The poller trusts a cached RUNNING status as a
 * fast path; any other cached status triggers real status queries, spaced
 * by a fixed delay and capped by the retry policy.
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/retry.hpp"
#include "runbox/core/sandbox_handle.hpp"
#include "runbox/provider/sandbox_provider.hpp"

#include <optional>
#include <string>

namespace runbox {
namespace core {

/**
 * @class ReadinessPoller
 * @brief Bounded-retry readiness check for a devbox handle
 *
 * **Thread Safety**: NOT thread-safe. The runtime facade serializes calls.
 */
class ReadinessPoller {
public:
    /**
     * @param provider Backend queried for status
     * @param policy Attempt cap and delay between status queries
     * @param working_directory Directory the shell session is moved to once
     *        the devbox is running (nothing is run when empty)
     * @param sleeper Sleep between attempts
     */
    ReadinessPoller(provider::SandboxProvider& provider,
                    RetryPolicy policy,
                    std::optional<std::string> working_directory = std::nullopt,
                    Sleeper sleeper = ThreadSleep);

    /**
     * @brief Return a handle known to be running
     *
     * Returns the given handle untouched when it already reports RUNNING
     * and force is not set.
     * Otherwise queries the provider until it answers RUNNING, initializes
     * the shell session and returns the refreshed handle.
     *
     * @param handle Last known state of the devbox
     * @param force Skip the cached fast path and always query the provider
     *
     * @throws SandboxUnavailableError if the devbox is not running after
     *         policy.max_attempts queries, or the provider reports it failed
     */
    SandboxHandle WaitUntilReady(const SandboxHandle& handle, bool force = false);

private:
    provider::SandboxProvider& provider_;
    RetryPolicy policy_;
    std::optional<std::string> working_directory_;
    Sleeper sleeper_;

    void InitializeSession(const SandboxHandle& handle);
};

} // namespace core
} // namespace runbox
