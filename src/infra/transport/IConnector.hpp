#pragma once

#include <expected>
#include <string>

#include "ConnectionProfile.hpp"

namespace termroute {

// Opaque result of a successful connection attempt
struct ConnectionHandle {
    std::string connection_id;
    std::string remote_endpoint;
};

using ConnectionResult = std::expected<ConnectionHandle, TransportError>;

/**
 * @brief Transport collaborator boundary.
 *
 * @details
 * Implementations own socket setup, authentication and key parsing (including
 * any ordered fallback over key formats). They may block; callers await them
 * outside the routing core and hand the final ConnectionResult to
 * SessionRegistry::complete_start().
 */
struct IConnector {
    virtual ~IConnector() = default;

    virtual ConnectionResult establish(const ConnectionProfile& profile) = 0;
};

}  // namespace termroute
