/**
 * @file runloop_provider.hpp
 * @brief Runloop devbox backend over its REST API
 *
 * **Endpoints**:
 * | Operation          | Request                                          |
 * |--------------------|--------------------------------------------------|
 * | Create             | POST /v1/devboxes                                |
 * | Retrieve           | GET  /v1/devboxes/{id}                           |
 * | ExecuteSync        | POST /v1/devboxes/{id}/execute_sync              |
 * | ReadFileContents   | POST /v1/devboxes/{id}/read_file_contents        |
 * | WriteFileContents  | POST /v1/devboxes/{id}/write_file_contents       |
 * | UploadFile         | POST /v1/devboxes/{id}/upload_file (multipart)   |
 * | CreateTunnel       | POST /v1/devboxes/{id}/create_tunnel             |
 * | Shutdown           | POST /v1/devboxes/{id}/shutdown                  |
 *
 * execute_sync reports stderr separately; it is logged at debug level and
 * not returned.
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/config.hpp"
#include "runbox/provider/sandbox_provider.hpp"
#include "runbox/utils/http_client.hpp"

#include <string>

namespace runbox {
namespace provider {

/**
 * @brief Map a Runloop devbox status string onto SandboxStatus
 *
 * provisioning, initializing, resuming, suspending -> PENDING;
 * running -> RUNNING; failure -> FAILED; shutdown, suspended -> STOPPED.
 * Unknown values count as PENDING so the poller keeps asking.
 */
core::SandboxStatus ParseDevboxStatus(const std::string& status);

/**
 * @brief Extract the provider message from an error response body
 *
 * Uses the "message" (or "detail") field of a JSON body, else the raw body,
 * else "HTTP <status>".
 */
std::string ExtractErrorMessage(long status_code, const std::string& body);

/**
 * @class RunloopProvider
 * @brief SandboxProvider for Runloop devboxes
 *
 * **Thread Safety**: Thread-safe (stateless apart from the HTTP client).
 */
class RunloopProvider : public SandboxProvider {
public:
    explicit RunloopProvider(const core::RuntimeConfig& config);

    DevboxInfo Create(const CreateDevboxRequest& request) override;

    DevboxInfo Retrieve(const std::string& devbox_id) override;

    ExecutionResult ExecuteSync(const std::string& devbox_id,
                                const std::string& command,
                                const std::string& shell_name) override;

    std::string ReadFileContents(const std::string& devbox_id,
                                 const std::string& file_path) override;

    void WriteFileContents(const std::string& devbox_id,
                           const std::string& file_path,
                           const std::string& contents) override;

    void UploadFile(const std::string& devbox_id,
                    const std::filesystem::path& local_path,
                    const std::string& remote_path) override;

    TunnelInfo CreateTunnel(const std::string& devbox_id, int port) override;

    void Shutdown(const std::string& devbox_id) override;

private:
    utils::HttpClient http_;

    static std::string DevboxPath(const std::string& devbox_id, const std::string& suffix = "");
};

} // namespace provider
} // namespace runbox
