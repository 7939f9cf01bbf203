/**
 * @file command_executor.cpp
 * @brief Implementation of shell-session command dispatch
 *
 * @date 2025
 */

#include "runbox/core/command_executor.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace runbox {
namespace core {

CommandExecutor::CommandExecutor(provider::SandboxProvider& provider)
    : provider_(provider) {
}

provider::ExecutionResult CommandExecutor::Execute(const SandboxHandle& handle,
                                                   const ExecutionRequest& request) {
    std::string command = request.command;
    if (request.working_directory && !request.working_directory->empty()) {
        command = "cd " + utils::StringUtils::ShellQuote(*request.working_directory)
                + " && " + command;
    }
    const std::string& session = request.session.empty() ? handle.ShellName() : request.session;

    spdlog::debug("[{}:{}] $ {}", handle.Id(), session, command);
    auto result = provider_.ExecuteSync(handle.Id(), command, session);
    spdlog::debug("[{}:{}] exit {} ({} bytes of output)",
        handle.Id(), session, result.exit_code, result.stdout_output.size());

    return result;
}

provider::ExecutionResult CommandExecutor::Execute(const SandboxHandle& handle,
                                                   const std::string& command) {
    ExecutionRequest request;
    request.command = command;
    return Execute(handle, request);
}

provider::ExecutionResult CommandExecutor::ExecuteChecked(const SandboxHandle& handle,
                                                          const std::string& command) {
    auto result = Execute(handle, command);
    if (result.exit_code != 0) {
        spdlog::error("Bookkeeping command failed on {} (exit {}): {}",
            handle.Id(), result.exit_code, command);
        throw RemoteCommandFailure(command, result.exit_code,
                                   utils::StringUtils::Trim(result.stdout_output));
    }
    return result;
}

} // namespace core
} // namespace runbox
