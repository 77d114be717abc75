#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace termroute {

enum class SessionType {
    Local,
    RemoteShell,
    Socket,
};

enum class SessionState {
    Idle,
    Starting,
    Running,
    Stopping,
    Stopped,
    Error,
};

const char* to_string(SessionType type);
const char* to_string(SessionState state);

std::optional<SessionType> parse_session_type(std::string_view name);
std::optional<SessionState> parse_session_state(std::string_view name);

/**
 * @brief Allowed lifecycle graph: idle -> starting -> running -> stopping -> stopped,
 * plus any non-terminal state -> error. Nothing leaves stopped or error.
 */
bool is_valid_transition(SessionState from, SessionState to);

// Entering one of these removes the session from the registry
inline bool is_terminal(SessionState state) {
    return state == SessionState::Stopped || state == SessionState::Error;
}

}  // namespace termroute
