/**
 * @file command_executor.hpp
 * @brief Synchronous command dispatch to a devbox shell session
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/sandbox_handle.hpp"
#include "runbox/provider/sandbox_provider.hpp"

#include <optional>
#include <string>

namespace runbox {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One command bound to a shell session
 */
struct ExecutionRequest {
    std::string command;
    std::optional<std::string> working_directory;   ///< cd here first when set
    std::string session;                            ///< Shell session name (handle's when empty)
};

/**
 * @class CommandExecutor
 * @brief Runs commands in the named shell session of a running devbox
 *
 * Output and exit code are returned exactly as the provider reported them.
 * Provider failures surface as ProviderStatusError.
 */
class CommandExecutor {
public:
    explicit CommandExecutor(provider::SandboxProvider& provider);

    provider::ExecutionResult Execute(const SandboxHandle& handle,
                                      const ExecutionRequest& request);

    provider::ExecutionResult Execute(const SandboxHandle& handle,
                                      const std::string& command);

    /**
     * @brief Run an internal bookkeeping command that must succeed
     *
     * @throws RemoteCommandFailure on a nonzero exit code
     */
    provider::ExecutionResult ExecuteChecked(const SandboxHandle& handle,
                                             const std::string& command);

private:
    provider::SandboxProvider& provider_;
};

} // namespace core
} // namespace runbox
