#pragma once

#include <boost/json.hpp>
#include <string>

#include "ConnectionProfile.hpp"
#include "FocusEvent.hpp"
#include "SessionEvent.hpp"
#include "SessionInstance.hpp"
#include "SessionRegistry.hpp"

namespace termroute::models {
namespace json = boost::json;

/**
 * @brief Builds the JSON shapes consumed by diagnostics and UI layers.
 *
 * @section Session Shape
 * @code
 * {
 * "id": "7f0c...",
 * "type": "remoteShell",          // local | remoteShell | socket
 * "state": "running",
 * "createdAt": "2024-05-01T12:30:45.123Z",
 * "lastActivityAt": "2024-05-01T12:31:02.004Z",
 * "commandCount": 3,
 * "recentCommands": ["ls", "cd /tmp", "pwd"],
 * "currentWorkingDirectory": "/tmp",  // or null
 * "sessionStats": {"bytesReceived": 1024},
 * "profile": {...},                    // or null, never carries credentials
 * "websocketUrl": null
 * }
 * @endcode
 */
class JsonBuilder {
   public:
    static json::object session(const SessionSnapshot& snap);

    // Credential fields (password, private key, passphrase) are never emitted
    static json::object profile(const ConnectionProfile& profile);

    static json::object focus(const FocusSnapshot& snap);
    static json::object focus_event(const FocusEvent& event);
    static json::object session_event(const SessionEvent& event);
    static json::object registry_stats(const RegistryStats& stats);

    static json::value stat_value(const StatValue& value);

    static std::string serialize(const json::value& value) { return json::serialize(value); }
};

}  // namespace termroute::models
