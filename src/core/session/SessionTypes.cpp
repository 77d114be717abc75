#include "SessionTypes.hpp"

#include <array>
#include <utility>

namespace termroute {

namespace {

constexpr std::array<std::pair<std::string_view, SessionType>, 3> kTypeNames{{
    {"local", SessionType::Local},
    {"remoteShell", SessionType::RemoteShell},
    {"socket", SessionType::Socket},
}};

constexpr std::array<std::pair<std::string_view, SessionState>, 6> kStateNames{{
    {"idle", SessionState::Idle},
    {"starting", SessionState::Starting},
    {"running", SessionState::Running},
    {"stopping", SessionState::Stopping},
    {"stopped", SessionState::Stopped},
    {"error", SessionState::Error},
}};

}  // namespace

const char* to_string(SessionType type) {
    for (const auto& [name, value] : kTypeNames) {
        if (value == type) return name.data();
    }
    return "unknown";
}

const char* to_string(SessionState state) {
    for (const auto& [name, value] : kStateNames) {
        if (value == state) return name.data();
    }
    return "unknown";
}

std::optional<SessionType> parse_session_type(std::string_view name) {
    for (const auto& [key, value] : kTypeNames) {
        if (key == name) return value;
    }
    return std::nullopt;
}

std::optional<SessionState> parse_session_state(std::string_view name) {
    for (const auto& [key, value] : kStateNames) {
        if (key == name) return value;
    }
    return std::nullopt;
}

bool is_valid_transition(SessionState from, SessionState to) {
    if (is_terminal(from)) {
        return false;
    }
    if (to == SessionState::Error) {
        return true;
    }
    switch (from) {
        case SessionState::Idle:
            return to == SessionState::Starting;
        case SessionState::Starting:
            return to == SessionState::Running;
        case SessionState::Running:
            return to == SessionState::Stopping;
        case SessionState::Stopping:
            return to == SessionState::Stopped;
        case SessionState::Stopped:
        case SessionState::Error:
            return false;
    }
    return false;
}

}  // namespace termroute
