#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "BroadcastChannel.hpp"
#include "FocusEvent.hpp"

namespace termroute {

/**
 * @brief Sole authority on which session receives keyboard input.
 *
 * @details
 * Owns the focused session id and the context → session bindings. Every
 * observable change is published on events(). Routing is advisory: no method
 * validates that a session exists, and none throws for a missing id.
 *
 * **Thread Safety:** each call takes the internal lock for its whole update
 * and publishes the resulting events after releasing it. Publishing calls
 * additionally hold publish_mutex_ from before the update until their events
 * are delivered, so subscribers see events in the order the state changed.
 * It is recursive: an observer may call back into the router.
 */
class FocusRouter {
   public:
    explicit FocusRouter(std::size_t event_queue_capacity = 256);

    FocusRouter(const FocusRouter&) = delete;
    FocusRouter& operator=(const FocusRouter&) = delete;

    // Focus
    void focus(const SessionId& session_id, const std::optional<ContextId>& context_id = {});
    void clear_focus();
    bool is_focused(const SessionId& session_id) const;
    std::optional<SessionId> focused_session() const;

    // Context bindings
    void bind_context(const ContextId& context_id, const SessionId& session_id);
    void unbind_context(const ContextId& context_id);
    void unbind_session(const SessionId& session_id);
    std::optional<SessionId> bound_session(const ContextId& context_id) const;

    /**
     * @brief Auto-focus policy for a session that just became runnable.
     * Interactive work always takes focus; persistent work only fills an
     * empty slot; anything else is left alone.
     */
    void apply_auto_focus(const SessionId& session_id,
                          FocusHint hint,
                          const std::optional<ContextId>& context_id = {});

    /**
     * @brief Purges every binding to the session, clears focus if it held it,
     * then always emits one BlockDeactivated event for it.
     */
    void handle_deactivation(const SessionId& session_id);

    /**
     * @brief Removes the context's binding and clears focus only if the
     * focused session is the one that context was bound to.
     */
    void cleanup_context(const ContextId& context_id);

    FocusSnapshot snapshot() const;

    // Hard reinitialization. Emits nothing.
    void reset();

    BroadcastChannel<FocusEvent>& events() noexcept { return events_; }

   private:
    using PendingEvents = std::vector<FocusEvent>;

    // The *_locked helpers require mutex_ held and append to `out`
    void focus_locked(const SessionId& session_id,
                      const std::optional<ContextId>& context_id,
                      PendingEvents& out);
    void clear_focus_locked(PendingEvents& out);
    std::size_t unbind_session_locked(const SessionId& session_id);

    void publish(const PendingEvents& pending);

    std::recursive_mutex publish_mutex_;
    mutable std::mutex mutex_;
    std::optional<SessionId> focused_;
    std::unordered_map<ContextId, SessionId> bindings_;

    BroadcastChannel<FocusEvent> events_;
};

}  // namespace termroute
