/**
 * @file readiness_poller.cpp
 * @brief Implementation of the devbox readiness poller
 *
 * Each attempt performs exactly one status query. A devbox that is still
 * pending raises SandboxNotReady, which the retry predicate accepts along
 * with transient provider errors. A devbox the provider reports as failed
 * ends the wait immediately.
 *
 * @date 2025
 */

#include "runbox/core/readiness_poller.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace runbox {
namespace core {

namespace {

class SandboxNotReady : public RunboxError {
public:
    explicit SandboxNotReady(const std::string& message)
        : RunboxError(message) {}
};

bool IsRetryable(const std::exception& e) {
    return dynamic_cast<const SandboxNotReady*>(&e) != nullptr
        || dynamic_cast<const ProviderStatusError*>(&e) != nullptr;
}

} // namespace

ReadinessPoller::ReadinessPoller(provider::SandboxProvider& provider,
                                 RetryPolicy policy,
                                 std::optional<std::string> working_directory,
                                 Sleeper sleeper)
    : provider_(provider)
    , policy_(policy)
    , working_directory_(std::move(working_directory))
    , sleeper_(std::move(sleeper)) {
}

SandboxHandle ReadinessPoller::WaitUntilReady(const SandboxHandle& handle, bool force) {
    if (handle.IsRunning() && !force) {
        return handle;
    }

    spdlog::info("Waiting for devbox {} to become ready...", handle.Id());

    int attempts = 0;
    try {
        return Retry(policy_, [&]() {
            ++attempts;
            auto info = provider_.Retrieve(handle.Id());
            spdlog::debug("Devbox {} status: {} (attempt {}/{})",
                handle.Id(), StatusToString(info.status), attempts, policy_.max_attempts);

            if (info.status == SandboxStatus::FAILED) {
                throw SandboxUnavailableError(
                    "Devbox " + handle.Id() + " failed to start", attempts);
            }
            if (info.status != SandboxStatus::RUNNING) {
                throw SandboxNotReady("Devbox " + handle.Id() + " is not running");
            }

            InitializeSession(handle);
            return handle.WithStatus(SandboxStatus::RUNNING);
        }, IsRetryable, sleeper_);
    }
    catch (const SandboxNotReady&) {
        spdlog::error("Devbox {} not ready after {} attempts", handle.Id(), attempts);
        throw SandboxUnavailableError(
            "Devbox " + handle.Id() + " did not become ready after "
            + std::to_string(attempts) + " attempts", attempts);
    }
    catch (const ProviderStatusError& e) {
        spdlog::error("Devbox {} status query failed after {} attempts: {}",
            handle.Id(), attempts, e.what());
        throw SandboxUnavailableError(
            "Devbox " + handle.Id() + " unreachable: " + e.Message(), attempts);
    }
}

void ReadinessPoller::InitializeSession(const SandboxHandle& handle) {
    if (!working_directory_ || working_directory_->empty()) {
        return;
    }

    auto quoted = utils::StringUtils::ShellQuote(*working_directory_);
    auto result = provider_.ExecuteSync(handle.Id(),
        "mkdir -p " + quoted + " && cd " + quoted, handle.ShellName());

    if (result.exit_code != 0) {
        spdlog::warn("Could not enter {} in shell '{}' (exit {})",
            *working_directory_, handle.ShellName(), result.exit_code);
    } else {
        spdlog::debug("Shell '{}' working directory: {}", handle.ShellName(), *working_directory_);
    }
}

} // namespace core
} // namespace runbox
