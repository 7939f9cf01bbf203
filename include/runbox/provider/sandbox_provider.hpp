/**
 * @file sandbox_provider.hpp
 * @brief Narrow capability interface to a cloud devbox backend
 *
 * The runtime facade and every core component talk to the backend only
 * through this interface. One concrete implementation exists per cloud
 * backend (see RunloopProvider); tests inject an in-memory fake.
 *
 * All methods throw core::ProviderStatusError when the backend rejects a
 * request or cannot be reached.
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/sandbox_handle.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox {
namespace provider {

/**
 * @struct CreateDevboxRequest
 * @brief Parameters of a devbox provisioning call
 */
struct CreateDevboxRequest {
    std::string name;                                    ///< Human-readable devbox name
    std::optional<std::string> entrypoint;               ///< Command the devbox runs at boot
    std::string prebuilt_image;                          ///< Prebuilt image identifier
    std::map<std::string, std::string> environment;      ///< Environment variables
    int keep_alive_seconds{0};                           ///< Idle lifetime, must be > 0
    std::vector<int> available_ports;                    ///< Ports that may be tunneled
};

/**
 * @struct DevboxInfo
 * @brief Provider view of a devbox
 */
struct DevboxInfo {
    std::string id;
    core::SandboxStatus status{core::SandboxStatus::PENDING};
    std::string name;
};

/**
 * @struct ExecutionResult
 * @brief Output of a synchronous command
 *
 * Only stdout is modeled. Backends that report stderr separately drop it.
 */
struct ExecutionResult {
    std::string stdout_output;
    int exit_code{0};
};

/**
 * @struct TunnelInfo
 * @brief Provider-assigned public endpoint (host part, no scheme)
 */
struct TunnelInfo {
    int port{0};
    std::string url;
};

/**
 * @class SandboxProvider
 * @brief Abstract devbox backend
 */
class SandboxProvider {
public:
    virtual ~SandboxProvider() = default;

    virtual DevboxInfo Create(const CreateDevboxRequest& request) = 0;

    virtual DevboxInfo Retrieve(const std::string& devbox_id) = 0;

    /**
     * @brief Run a command in the named shell session and wait for it
     *
     * The shell session keeps its working directory and environment
     * between calls.
     */
    virtual ExecutionResult ExecuteSync(const std::string& devbox_id,
                                        const std::string& command,
                                        const std::string& shell_name) = 0;

    virtual std::string ReadFileContents(const std::string& devbox_id,
                                         const std::string& file_path) = 0;

    virtual void WriteFileContents(const std::string& devbox_id,
                                   const std::string& file_path,
                                   const std::string& contents) = 0;

    /**
     * @brief Upload a local file to an exact remote path
     */
    virtual void UploadFile(const std::string& devbox_id,
                            const std::filesystem::path& local_path,
                            const std::string& remote_path) = 0;

    virtual TunnelInfo CreateTunnel(const std::string& devbox_id, int port) = 0;

    virtual void Shutdown(const std::string& devbox_id) = 0;
};

} // namespace provider
} // namespace runbox
