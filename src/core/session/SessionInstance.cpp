#include "SessionInstance.hpp"

#include <utility>

namespace termroute {

SessionInstance::SessionInstance(SessionId id,
                                 SessionType type,
                                 SessionConfig config,
                                 FocusHint hint,
                                 std::size_t recent_command_capacity)
    : id_(std::move(id)),
      type_(type),
      state_(config.start_idle ? SessionState::Idle : SessionState::Starting),
      config_(std::move(config)),
      focus_hint_(hint),
      created_at_(Clock::now()),
      last_activity_at_(created_at_),
      recent_capacity_(recent_command_capacity == 0 ? 1 : recent_command_capacity) {}

void SessionInstance::set_state(SessionState state) {
    state_ = state;
    update_activity();
}

void SessionInstance::update_activity() {
    last_activity_at_ = Clock::now();
}

void SessionInstance::add_command(const std::string& command) {
    ++command_count_;
    recent_commands_.push_back(command);
    while (recent_commands_.size() > recent_capacity_) {
        recent_commands_.pop_front();
    }
    update_activity();
}

void SessionInstance::set_working_directory(std::string path) {
    config_.working_directory = std::move(path);
    update_activity();
}

void SessionInstance::set_stat(const std::string& key, StatValue value) {
    stats_[key] = std::move(value);
    update_activity();
}

void SessionInstance::set_last_error(std::string message) {
    last_error_ = std::move(message);
}

SessionSnapshot SessionInstance::snapshot() const {
    SessionSnapshot snap;
    snap.id = id_;
    snap.type = type_;
    snap.state = state_;
    snap.created_at = created_at_;
    snap.last_activity_at = last_activity_at_;
    snap.command_count = command_count_;
    snap.recent_commands.assign(recent_commands_.begin(), recent_commands_.end());
    snap.current_working_directory = config_.working_directory;
    snap.session_stats = stats_;
    snap.profile = config_.profile;
    snap.websocket_url = config_.websocket_url;
    snap.command = config_.command;
    snap.context_id = config_.context_id;
    snap.last_error = last_error_;
    snap.focus_hint = focus_hint_;
    return snap;
}

}  // namespace termroute
