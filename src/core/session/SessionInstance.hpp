#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ConnectionProfile.hpp"
#include "config.hpp"
#include "FocusEvent.hpp"
#include "SessionTypes.hpp"
#include "TimeFormat.hpp"

namespace termroute {

// Closed set of value kinds for free-form session statistics
using StatValue = std::variant<std::int64_t, double, bool, std::string>;
using SessionStats = std::map<std::string, StatValue>;

/**
 * @brief Creation parameters for a session.
 * focus_hint overrides whatever would be derived from the command or the type.
 */
struct SessionConfig {
    std::optional<std::string> command;
    std::optional<std::string> working_directory;
    std::optional<ConnectionProfile> profile;
    std::optional<std::string> websocket_url;
    std::optional<ContextId> context_id;
    std::optional<FocusHint> focus_hint;
    // Create in `idle` instead of `starting`; the caller moves it on
    bool start_idle = false;
};

// Read-only copy handed out by the registry
struct SessionSnapshot {
    SessionId id;
    SessionType type = SessionType::Local;
    SessionState state = SessionState::Idle;
    Timestamp created_at{};
    Timestamp last_activity_at{};
    std::uint64_t command_count = 0;
    std::vector<std::string> recent_commands;
    std::optional<std::string> current_working_directory;
    SessionStats session_stats;
    std::optional<ConnectionProfile> profile;
    std::optional<std::string> websocket_url;
    std::optional<std::string> command;
    std::optional<ContextId> context_id;
    std::optional<std::string> last_error;
    FocusHint focus_hint;
};

/**
 * @brief Mutable per-session record. Owned exclusively by SessionRegistry.
 */
class SessionInstance {
   public:
    SessionInstance(SessionId id,
                    SessionType type,
                    SessionConfig config,
                    FocusHint hint,
                    std::size_t recent_command_capacity = DEFAULT_RECENT_COMMANDS);

    const SessionId& id() const noexcept { return id_; }
    SessionType type() const noexcept { return type_; }
    SessionState state() const noexcept { return state_; }
    FocusHint focus_hint() const noexcept { return focus_hint_; }
    const std::optional<ContextId>& context_id() const noexcept { return config_.context_id; }
    const std::optional<ConnectionProfile>& profile() const noexcept { return config_.profile; }

    void set_state(SessionState state);
    void update_activity();

    // Appends to the bounded log, evicting the oldest entry past capacity
    void add_command(const std::string& command);

    void set_working_directory(std::string path);
    void set_stat(const std::string& key, StatValue value);
    void set_last_error(std::string message);

    std::uint64_t command_count() const noexcept { return command_count_; }
    const std::deque<std::string>& recent_commands() const noexcept { return recent_commands_; }

    SessionSnapshot snapshot() const;

   private:
    SessionId id_;
    SessionType type_;
    SessionState state_;
    SessionConfig config_;
    FocusHint focus_hint_;

    Timestamp created_at_;
    Timestamp last_activity_at_;

    std::size_t recent_capacity_;
    std::uint64_t command_count_ = 0;
    std::deque<std::string> recent_commands_;
    SessionStats stats_;
    std::optional<std::string> last_error_;
};

}  // namespace termroute
