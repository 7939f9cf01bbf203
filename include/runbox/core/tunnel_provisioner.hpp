/**
 * @file tunnel_provisioner.hpp
 * @brief Public endpoint for a port inside a devbox
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/sandbox_handle.hpp"
#include "runbox/provider/sandbox_provider.hpp"

#include <string>

namespace runbox {
namespace core {

/**
 * @struct Tunnel
 * @brief A devbox port and the public URL forwarding to it
 */
struct Tunnel {
    int sandbox_port{0};
    std::string public_url;   ///< Always carries the https:// scheme
};

/**
 * @class TunnelProvisioner
 * @brief Requests a tunnel once the devbox is running
 *
 * No retry: a failure here is fatal to session startup.
 */
class TunnelProvisioner {
public:
    explicit TunnelProvisioner(provider::SandboxProvider& provider);

    /**
     * @throws ValidationError if port is outside 1..65535
     * @throws ProviderStatusError if the provider refuses the tunnel
     */
    Tunnel Expose(const SandboxHandle& handle, int port);

private:
    provider::SandboxProvider& provider_;
};

} // namespace core
} // namespace runbox
