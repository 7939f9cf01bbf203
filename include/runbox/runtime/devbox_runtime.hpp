/**
 * @file devbox_runtime.hpp
 * @brief Action/observation facade over one remote devbox
 *
 * Composes the readiness poller, command executor, file transfer engine and
 * tunnel provisioner behind the action interface the agent loop expects.
 *
 * **State machine**:
 * ```
 * UNINITIALIZED ─Connect()─> PROVISIONING ─> AWAITING_READY ─> READY
 *                                                              │  ▲
 *                                                   action()   ▼  │
 *                                                            EXECUTING
 * any state ─Close()─> CLOSED
 * ```
 *
 * **Thread Safety**: Thread-safe. At most one action runs against the
 * devbox at a time; concurrent callers block until the previous action
 * finishes, so actions issued by one caller run in order.
 *
 * **Usage Example**:
 * @code
 * auto provider = std::make_shared<provider::RunloopProvider>(config);
 * DevboxRuntime runtime(config, provider, "session-42");
 * runtime.Connect();
 *
 * auto observation = runtime.Run({"ls -la", 1});
 * runtime.CopyTo({"./project", "/workspace", true});
 * runtime.Close();
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/command_executor.hpp"
#include "runbox/core/config.hpp"
#include "runbox/core/file_transfer.hpp"
#include "runbox/core/readiness_poller.hpp"
#include "runbox/core/sandbox_handle.hpp"
#include "runbox/core/tunnel_provisioner.hpp"
#include "runbox/provider/sandbox_provider.hpp"
#include "runbox/runtime/events.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox {
namespace runtime {

/**
 * @enum RuntimeState
 * @brief Lifecycle of the facade (not of the remote devbox)
 */
enum class RuntimeState {
    UNINITIALIZED,
    PROVISIONING,
    AWAITING_READY,
    READY,
    EXECUTING,
    CLOSED
};

std::string RuntimeStateToString(RuntimeState state);

/// Receives STATUS$... progress messages during Connect(); runs with the
/// action lock held and must not call back into the runtime
using StatusCallback = std::function<void(const std::string&)>;

/**
 * @class DevboxRuntime
 * @brief Drives one devbox for one agent session
 */
class DevboxRuntime {
public:
    /**
     * @param config Runtime configuration (validated by Connect)
     * @param provider Devbox backend
     * @param session_id Stable agent session id, used in the devbox name
     * @param status_callback Optional progress sink
     * @param sleeper Sleep used between readiness attempts
     */
    DevboxRuntime(core::RuntimeConfig config,
                  std::shared_ptr<provider::SandboxProvider> provider,
                  std::string session_id = "default",
                  StatusCallback status_callback = nullptr,
                  core::Sleeper sleeper = core::ThreadSleep);

    /// Calls Close()
    ~DevboxRuntime();

    DevboxRuntime(const DevboxRuntime&) = delete;
    DevboxRuntime& operator=(const DevboxRuntime&) = delete;

    /**
     * @brief Create (or attach to) the devbox, wait for it and open the tunnel
     *
     * On failure the devbox is released and the runtime is closed.
     *
     * @throws ProvisioningError if the devbox cannot be created or attached
     * @throws SandboxUnavailableError if it never becomes ready
     * @throws ProviderStatusError if the tunnel cannot be created
     * @throws RuntimeStateError if called twice
     */
    void Connect();

    /**
     * @brief Run a shell command
     * @return CmdOutputObservation, or ErrorObservation on provider errors
     */
    Observation Run(const CmdRunAction& action);

    /**
     * @brief Read a line range of a remote file
     * @return FileReadObservation, or ErrorObservation on provider errors
     */
    Observation Read(const FileReadAction& action);

    /**
     * @brief Replace the contents of a remote file
     * @return FileWriteObservation, or ErrorObservation on provider errors
     */
    Observation Write(const FileWriteAction& action);

    /**
     * @brief Copy a local file or directory into the devbox
     * @throws ValidationError, RemoteCommandFailure, ProviderStatusError
     */
    void CopyTo(const CopyToAction& action);

    /**
     * @brief Entries printed by `ls` for a remote path
     * @throws ProviderStatusError
     */
    std::vector<std::string> ListFiles(const ListFilesAction& action = {});

    /// @throws UnsupportedActionError always
    Observation RunIPython(const IPythonRunCellAction& action);

    /// @throws UnsupportedActionError always
    Observation Browse(const BrowseURLAction& action);

    /// @throws UnsupportedActionError always
    Observation BrowseInteractive(const BrowseInteractiveAction& action);

    /**
     * @brief Release the devbox
     *
     * Shuts the devbox down when this runtime created it and
     * terminate_on_close is set; otherwise only forgets it. Idempotent,
     * never throws. Waits for an in-flight action to finish.
     */
    void Close();

    RuntimeState State() const { return state_.load(); }

    /// Last known handle, empty before provisioning and after close
    std::optional<core::SandboxHandle> Handle() const;

    /// Devbox id once provisioned
    std::optional<std::string> RuntimeId() const;

    /// Public URL of the action server once the tunnel exists
    std::optional<std::string> RuntimeUrl() const;

private:
    core::RuntimeConfig config_;
    std::shared_ptr<provider::SandboxProvider> provider_;
    std::string session_id_;
    StatusCallback status_callback_;

    core::CommandExecutor executor_;
    core::FileTransfer transfer_;
    core::ReadinessPoller poller_;
    core::TunnelProvisioner tunnels_;

    mutable std::mutex action_mutex_;
    std::atomic<RuntimeState> state_{RuntimeState::UNINITIALIZED};
    std::optional<core::SandboxHandle> handle_;
    std::optional<core::Tunnel> tunnel_;
    bool owns_devbox_{false};
    bool status_stale_{false};

    core::SandboxHandle ProvisionDevbox();
    void ReleaseDevbox();
    void SendStatus(const std::string& message);

    /**
     * @brief Run fn against a verified-ready handle while holding the action lock
     */
    template <typename Fn>
    auto WithReadyDevbox(const char* action, Fn&& fn) -> decltype(fn(std::declval<const core::SandboxHandle&>()));
};

} // namespace runtime
} // namespace runbox
