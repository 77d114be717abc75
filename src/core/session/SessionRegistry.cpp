#include "SessionRegistry.hpp"

#include <spdlog/spdlog.h>

#include <boost/uuid/uuid.hpp>             // Core UUID class
#include <boost/uuid/uuid_io.hpp>          // Streaming operators (to_string)
#include <utility>

#include "SessionErrors.hpp"

namespace termroute {

SessionRegistry::SessionRegistry(FocusRouter& router, RegistryConfig config, EventsConfig events)
    : router_(router), config_(config), events_(events.queue_capacity) {}

SessionId SessionRegistry::create_session(SessionType type, SessionConfig config) {
    // 1. Remote shells need a usable profile before anything is allocated
    if (type == SessionType::RemoteShell) {
        if (!config.profile) {
            throw TransportError(TransportErrorKind::Config,
                                 "Remote shell session requires a connection profile");
        }
        if (auto reason = validate_profile(*config.profile)) {
            spdlog::warn("Rejecting remote shell session for '{}': {}", config.profile->name,
                         *reason);
            throw TransportError(TransportErrorKind::Config, *reason);
        }
    }

    // 2. Build the instance
    FocusHint hint = derive_focus_hint(type, config);
    const SessionState initial = config.start_idle ? SessionState::Idle : SessionState::Starting;
    SessionId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = generate_id();
        auto session = std::make_unique<SessionInstance>(id, type, std::move(config), hint,
                                                         config_.recent_command_capacity);
        sessions_[id] = std::move(session);
    }

    spdlog::info("Session {} created ({}), requires_input={} persistent={}", id,
                 to_string(type), hint.requires_input, hint.is_persistent);
    emit(SessionEventKind::Created, id, initial,
         std::string(to_string(type)) + " session created");
    return id;
}

void SessionRegistry::transition(const SessionId& id, SessionState new_state) {
    FocusHint hint;
    std::optional<ContextId> context;
    // Terminal sessions leave the map under the same lock that sets their state
    std::unique_ptr<SessionInstance> detached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            throw UnknownSessionError(id);
        }

        SessionInstance& session = *it->second;
        const SessionState from = session.state();
        if (!is_valid_transition(from, new_state)) {
            spdlog::warn("Session {}: rejected transition {} -> {}", id, to_string(from),
                         to_string(new_state));
            throw InvalidTransitionError(id, from, new_state);
        }

        session.set_state(new_state);
        hint = session.focus_hint();
        context = session.context_id();
        spdlog::debug("Session {}: {} -> {}", id, to_string(from), to_string(new_state));

        if (is_terminal(new_state)) {
            detached = std::move(it->second);
            sessions_.erase(it);
        }
    }

    emit(SessionEventKind::StateChanged, id, new_state,
         std::string("State changed to ") + to_string(new_state));

    if (new_state == SessionState::Running) {
        if (context) {
            router_.bind_context(*context, id);
        }
        if (config_.auto_focus) {
            router_.apply_auto_focus(id, hint, context);
        }
        return;
    }

    if (detached) {
        router_.handle_deactivation(id);
        spdlog::info("Session {} removed ({})", id, to_string(new_state));
        emit(SessionEventKind::Removed, id, new_state, "Session removed");
    }
}

void SessionRegistry::complete_start(const SessionId& id, const ConnectionResult& result) {
    if (result) {
        spdlog::info("Session {} connected to {}", id, result->remote_endpoint);
        transition(id, SessionState::Running);
        return;
    }

    const TransportError& error = result.error();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            throw UnknownSessionError(id);
        }
        it->second->set_last_error(error.what());
    }

    spdlog::error("[{}] Connection failed ({}): {}", id, to_string(error.kind()), error.what());
    emit(SessionEventKind::Error, id, std::nullopt,
         std::string(to_string(error.kind())) + " error: " + error.what());
    transition(id, SessionState::Error);
    throw error;
}

void SessionRegistry::record_command(const SessionId& id, const std::string& command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            throw UnknownSessionError(id);
        }
        it->second->add_command(command);
    }
    emit(SessionEventKind::CommandRecorded, id, std::nullopt, command);
}

void SessionRegistry::set_working_directory(const SessionId& id, std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw UnknownSessionError(id);
    }
    it->second->set_working_directory(std::move(path));
}

void SessionRegistry::set_stat(const SessionId& id, const std::string& key, StatValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        throw UnknownSessionError(id);
    }
    it->second->set_stat(key, std::move(value));
}

std::optional<SessionSnapshot> SessionRegistry::get(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

std::vector<SessionId> SessionRegistry::list_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionId> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

RegistryStats SessionRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats out;
    out.total = sessions_.size();
    for (const auto& [_, session] : sessions_) {
        ++out.by_state[session->state()];
        ++out.by_type[session->type()];
    }
    return out;
}

void SessionRegistry::stop_all() {
    auto ids = list_ids();
    spdlog::info("Stopping {} session(s)", ids.size());

    for (const auto& id : ids) {
        auto snap = get(id);
        if (!snap) {
            continue;  // removed concurrently
        }

        try {
            switch (snap->state) {
                case SessionState::Running:
                    transition(id, SessionState::Stopping);
                    transition(id, SessionState::Stopped);
                    break;
                case SessionState::Stopping:
                    transition(id, SessionState::Stopped);
                    break;
                case SessionState::Idle:
                case SessionState::Starting:
                    transition(id, SessionState::Error);
                    break;
                case SessionState::Stopped:
                case SessionState::Error:
                    break;
            }
        } catch (const SessionError& e) {
            // Another caller moved or removed it first
            spdlog::debug("stop_all: skipping {}: {}", id, e.what());
        }
    }

    emit(SessionEventKind::Cleanup, SessionId{}, std::nullopt, "All sessions cleaned up");
}

FocusHint SessionRegistry::derive_focus_hint(SessionType type, const SessionConfig& config) {
    if (config.focus_hint) {
        return *config.focus_hint;
    }
    if (config.command && !config.command->empty()) {
        return classifier_.classify(*config.command).focus_hint();
    }

    switch (type) {
        case SessionType::Local:
        case SessionType::RemoteShell:
            // Interactive shell
            return FocusHint{true, true};
        case SessionType::Socket:
            return FocusHint{false, true};
    }
    return FocusHint{};
}

SessionId SessionRegistry::generate_id() {
    return boost::uuids::to_string(uuid_gen_());
}

void SessionRegistry::emit(SessionEventKind kind,
                           const SessionId& id,
                           std::optional<SessionState> state,
                           std::string message) {
    SessionEvent event;
    event.kind = kind;
    event.session_id = id;
    event.state = state;
    event.message = std::move(message);
    event.timestamp = Clock::now();
    events_.publish(event);
}

}  // namespace termroute
