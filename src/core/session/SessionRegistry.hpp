#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/uuid/uuid_generators.hpp>

#include "BroadcastChannel.hpp"
#include "FocusRouter.hpp"
#include "IConnector.hpp"
#include "ProcessClassifier.hpp"
#include "SessionEvent.hpp"
#include "SessionInstance.hpp"
#include "config.hpp"

namespace termroute {

struct RegistryStats {
    std::size_t total = 0;
    std::map<SessionState, std::size_t> by_state;
    std::map<SessionType, std::size_t> by_type;
};

/**
 * @brief Authoritative owner of every live SessionInstance.
 *
 * @details
 * Validates lifecycle transitions and drives the FocusRouter: entering
 * `running` applies the auto-focus policy, entering `stopped`/`error`
 * deactivates the session in the router and removes it. The registry lock is
 * never held while calling into the router or publishing events.
 */
class SessionRegistry {
   public:
    explicit SessionRegistry(FocusRouter& router,
                             RegistryConfig config = {},
                             EventsConfig events = {});

    // Disable copy
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Allocates a session in `starting` (or `idle` with start_idle) and returns its id.
     * @throws TransportError (Config) if a remote-shell profile is missing or invalid.
     */
    SessionId create_session(SessionType type, SessionConfig config = {});

    /**
     * @brief Moves a session along the lifecycle graph.
     * @throws UnknownSessionError, InvalidTransitionError (state left unchanged).
     */
    void transition(const SessionId& id, SessionState new_state);

    /**
     * @brief Consumes the transport collaborator's final signal for a starting session.
     * Success moves it to `running`; failure records the message, moves it to
     * `error` (deactivated and removed) and rethrows the TransportError.
     */
    void complete_start(const SessionId& id, const ConnectionResult& result);

    void record_command(const SessionId& id, const std::string& command);
    void set_working_directory(const SessionId& id, std::string path);
    void set_stat(const SessionId& id, const std::string& key, StatValue value);

    // Lookups
    std::optional<SessionSnapshot> get(const SessionId& id) const;
    std::vector<SessionId> list_ids() const;
    std::size_t size() const;
    RegistryStats stats() const;

    // Walks every live session to `stopped` (or `error` if it never started),
    // then publishes a single Cleanup event
    void stop_all();

    BroadcastChannel<SessionEvent>& events() noexcept { return events_; }

   private:
    FocusHint derive_focus_hint(SessionType type, const SessionConfig& config);
    SessionId generate_id();
    void emit(SessionEventKind kind,
              const SessionId& id,
              std::optional<SessionState> state,
              std::string message);

    FocusRouter& router_;
    RegistryConfig config_;
    ProcessClassifier classifier_;

    // mutable allows locking in const methods (like get/size)
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, std::unique_ptr<SessionInstance>> sessions_;
    boost::uuids::random_generator uuid_gen_;

    BroadcastChannel<SessionEvent> events_;
};

}  // namespace termroute
