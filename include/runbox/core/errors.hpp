/**
 * @file errors.hpp
 * @brief Exception taxonomy for devbox lifecycle and action failures
 *
 * Every error raised by runbox derives from RunboxError so callers can
 * catch the whole family at once. Which errors are fatal and which are
 * turned into observations is decided by the runtime facade:
 *
 * | Error                   | Raised by                    | Handling            |
 * |-------------------------|------------------------------|---------------------|
 * | ProvisioningError       | devbox creation              | fatal, no retry     |
 * | SandboxUnavailableError | readiness poller             | fatal after budget  |
 * | ProviderStatusError     | any provider call            | observation on run/read/write |
 * | ValidationError         | local argument checks        | fatal, no remote call |
 * | RemoteCommandFailure    | bookkeeping commands         | fatal               |
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace runbox {
namespace core {

/**
 * @class RunboxError
 * @brief Base class of all runbox exceptions
 */
class RunboxError : public std::runtime_error {
public:
    explicit RunboxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ProvisioningError
 * @brief The provider refused or failed to create (or attach to) a devbox
 */
class ProvisioningError : public RunboxError {
public:
    explicit ProvisioningError(const std::string& message)
        : RunboxError(message) {}
};

/**
 * @class SandboxUnavailableError
 * @brief The devbox never reached the running state within the attempt budget
 */
class SandboxUnavailableError : public RunboxError {
public:
    SandboxUnavailableError(const std::string& message, int attempts)
        : RunboxError(message), attempts_(attempts) {}

    /// Number of status queries performed before giving up
    int Attempts() const { return attempts_; }

private:
    int attempts_;
};

/**
 * @class ProviderStatusError
 * @brief The provider answered a request with an error status
 *
 * status_code is the HTTP status of the response, or 0 when the request
 * never produced a response (connection refused, timeout, TLS failure).
 */
class ProviderStatusError : public RunboxError {
public:
    ProviderStatusError(int status_code, const std::string& message)
        : RunboxError(message), status_code_(status_code) {}

    int StatusCode() const { return status_code_; }

    /// Human-readable provider message, surfaced verbatim in ErrorObservation
    std::string Message() const { return what(); }

private:
    int status_code_;
};

/**
 * @class ValidationError
 * @brief A request was rejected locally before any remote call
 */
class ValidationError : public RunboxError {
public:
    explicit ValidationError(const std::string& message)
        : RunboxError(message) {}
};

/**
 * @class RemoteCommandFailure
 * @brief An internal bookkeeping command exited with a nonzero status
 */
class RemoteCommandFailure : public RunboxError {
public:
    RemoteCommandFailure(const std::string& command, int exit_code, const std::string& output)
        : RunboxError("Remote command failed (exit " + std::to_string(exit_code) + "): "
                      + command + (output.empty() ? "" : ": " + output))
        , command_(command)
        , exit_code_(exit_code) {}

    const std::string& Command() const { return command_; }
    int ExitCode() const { return exit_code_; }

private:
    std::string command_;
    int exit_code_;
};

/**
 * @class RuntimeStateError
 * @brief An action was issued before the runtime became ready or after close
 */
class RuntimeStateError : public RunboxError {
public:
    explicit RuntimeStateError(const std::string& message)
        : RunboxError(message) {}
};

/**
 * @class UnsupportedActionError
 * @brief The action type has no implementation on a remote devbox
 */
class UnsupportedActionError : public RunboxError {
public:
    explicit UnsupportedActionError(const std::string& action)
        : RunboxError("Action not supported by the devbox runtime: " + action) {}
};

/**
 * @class ConfigError
 * @brief Configuration file could not be read or holds invalid values
 */
class ConfigError : public RunboxError {
public:
    explicit ConfigError(const std::string& message)
        : RunboxError(message) {}
};

/**
 * @class ArchiveError
 * @brief libarchive failed while building a transfer archive
 */
class ArchiveError : public RunboxError {
public:
    explicit ArchiveError(const std::string& message)
        : RunboxError(message) {}
};

} // namespace core
} // namespace runbox
