#include "JsonBuilder.hpp"

#include <type_traits>
#include <variant>

namespace termroute::models {

namespace {

template <class T>
json::value optional_string(const std::optional<T>& value) {
    if (!value) return nullptr;
    return json::value(json::string(*value));
}

}  // namespace

json::value JsonBuilder::stat_value(const StatValue& value) {
    return std::visit(
        [](const auto& v) -> json::value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return json::string(v);
            } else {
                return json::value(v);
            }
        },
        value);
}

json::object JsonBuilder::profile(const ConnectionProfile& profile) {
    json::object j;
    j["id"] = profile.id;
    j["name"] = profile.name;
    j["host"] = profile.host;
    j["port"] = profile.port;
    j["username"] = profile.username;
    j["authType"] = to_string(profile.auth_type);
    j["connectionString"] = profile.connection_string();
    return j;
}

json::object JsonBuilder::session(const SessionSnapshot& snap) {
    json::object j;
    j["id"] = snap.id;
    j["type"] = to_string(snap.type);
    j["state"] = to_string(snap.state);
    j["createdAt"] = to_iso8601(snap.created_at);
    j["lastActivityAt"] = to_iso8601(snap.last_activity_at);
    j["commandCount"] = snap.command_count;

    json::array recent;
    for (const auto& cmd : snap.recent_commands) {
        recent.emplace_back(cmd);
    }
    j["recentCommands"] = std::move(recent);

    j["currentWorkingDirectory"] = optional_string(snap.current_working_directory);

    json::object stats;
    for (const auto& [key, value] : snap.session_stats) {
        stats[key] = stat_value(value);
    }
    j["sessionStats"] = std::move(stats);

    if (snap.profile) {
        j["profile"] = profile(*snap.profile);
    } else {
        j["profile"] = nullptr;
    }
    j["websocketUrl"] = optional_string(snap.websocket_url);
    return j;
}

json::object JsonBuilder::focus(const FocusSnapshot& snap) {
    json::object j;
    j["focusedSession"] = optional_string(snap.focused_session);

    json::object bindings;
    for (const auto& [context, session] : snap.context_bindings) {
        bindings[context] = session;
    }
    j["contextBindings"] = std::move(bindings);
    j["totalBindings"] = snap.binding_count;
    j["hasFocus"] = snap.has_focus();
    return j;
}

json::object JsonBuilder::focus_event(const FocusEvent& event) {
    json::object j;
    j["type"] = to_string(event.kind);
    j["sessionId"] = event.session_id;
    j["contextId"] = optional_string(event.context_id);
    j["message"] = event.message;
    j["timestamp"] = to_iso8601(event.timestamp);
    return j;
}

json::object JsonBuilder::session_event(const SessionEvent& event) {
    json::object j;
    j["type"] = to_string(event.kind);
    j["sessionId"] = event.session_id;
    if (event.state) {
        j["state"] = to_string(*event.state);
    } else {
        j["state"] = nullptr;
    }
    j["message"] = event.message;
    j["timestamp"] = to_iso8601(event.timestamp);
    return j;
}

json::object JsonBuilder::registry_stats(const RegistryStats& stats) {
    json::object j;
    j["totalSessions"] = stats.total;

    json::object by_state;
    for (const auto& [state, count] : stats.by_state) {
        by_state[to_string(state)] = count;
    }
    j["byState"] = std::move(by_state);

    json::object by_type;
    for (const auto& [type, count] : stats.by_type) {
        by_type[to_string(type)] = count;
    }
    j["byType"] = std::move(by_type);
    return j;
}

}  // namespace termroute::models
