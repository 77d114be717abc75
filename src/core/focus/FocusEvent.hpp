#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "TimeFormat.hpp"

namespace termroute {

using SessionId = std::string;
using ContextId = std::string;

enum class FocusEventKind {
    FocusChanged,
    BlockDeactivated,
};

inline const char* to_string(FocusEventKind kind) {
    switch (kind) {
        case FocusEventKind::FocusChanged:
            return "focusChanged";
        case FocusEventKind::BlockDeactivated:
            return "blockDeactivated";
    }
    return "unknown";
}

/**
 * @brief One focus/lifecycle transition published by FocusRouter.
 * For a cleared focus, session_id carries the session that lost focus.
 */
struct FocusEvent {
    FocusEventKind kind = FocusEventKind::FocusChanged;
    SessionId session_id;
    std::optional<ContextId> context_id;
    std::string message;
    Timestamp timestamp{};
};

// Flags driving the auto-focus policy
struct FocusHint {
    bool requires_input = false;
    bool is_persistent = false;
};

/**
 * @brief Immutable copy of the router state, for diagnostics.
 */
struct FocusSnapshot {
    std::optional<SessionId> focused_session;
    std::unordered_map<ContextId, SessionId> context_bindings;
    std::size_t binding_count = 0;

    bool has_focus() const noexcept { return focused_session.has_value(); }
};

}  // namespace termroute
