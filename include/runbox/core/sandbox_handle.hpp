/**
 * @file sandbox_handle.hpp
 * @brief Local knowledge about one remote devbox
 *
 * A SandboxHandle is a value object: the devbox id is fixed when the handle
 * is created and the status only changes by building a refreshed copy from
 * a provider answer. Nothing in runbox guesses a status locally.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace runbox {
namespace core {

/**
 * @enum SandboxStatus
 * @brief Lifecycle state of a remote devbox as reported by the provider
 */
enum class SandboxStatus {
    PENDING,   ///< Provisioning, booting, resuming or suspending
    RUNNING,   ///< Accepts command execution and file operations
    FAILED,    ///< Provider gave up on the devbox
    STOPPED    ///< Shut down or suspended
};

/**
 * @brief Convert status to its lowercase name ("pending", "running", ...)
 */
std::string StatusToString(SandboxStatus status);

/**
 * @class SandboxHandle
 * @brief Identity and last known status of a devbox
 */
class SandboxHandle {
public:
    SandboxHandle(std::string id, SandboxStatus status, std::string shell_name);

    const std::string& Id() const { return id_; }
    SandboxStatus Status() const { return status_; }
    const std::string& ShellName() const { return shell_name_; }

    bool IsRunning() const { return status_ == SandboxStatus::RUNNING; }

    /**
     * @brief Copy of this handle carrying a newer status
     *
     * The id and shell session are preserved; this is the only way a
     * handle's status changes.
     */
    SandboxHandle WithStatus(SandboxStatus status) const;

private:
    std::string id_;
    SandboxStatus status_;
    std::string shell_name_;
};

} // namespace core
} // namespace runbox
