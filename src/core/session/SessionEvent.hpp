#pragma once

#include <optional>
#include <string>

#include "FocusEvent.hpp"
#include "SessionTypes.hpp"

namespace termroute {

enum class SessionEventKind {
    Created,
    StateChanged,
    CommandRecorded,
    Removed,
    Error,
    Cleanup,
};

inline const char* to_string(SessionEventKind kind) {
    switch (kind) {
        case SessionEventKind::Created:
            return "created";
        case SessionEventKind::StateChanged:
            return "stateChanged";
        case SessionEventKind::CommandRecorded:
            return "commandRecorded";
        case SessionEventKind::Removed:
            return "removed";
        case SessionEventKind::Error:
            return "error";
        case SessionEventKind::Cleanup:
            return "cleanup";
    }
    return "unknown";
}

// Lifecycle notification published by SessionRegistry.
// Cleanup carries an empty session_id.
struct SessionEvent {
    SessionEventKind kind = SessionEventKind::Created;
    SessionId session_id;
    std::optional<SessionState> state;
    std::string message;
    Timestamp timestamp{};
};

}  // namespace termroute
