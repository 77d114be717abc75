#include "FocusRouter.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace termroute {

namespace {

FocusEvent make_event(FocusEventKind kind,
                      SessionId session_id,
                      std::optional<ContextId> context_id,
                      std::string message) {
    FocusEvent e;
    e.kind = kind;
    e.session_id = std::move(session_id);
    e.context_id = std::move(context_id);
    e.message = std::move(message);
    e.timestamp = Clock::now();
    return e;
}

}  // namespace

FocusRouter::FocusRouter(std::size_t event_queue_capacity) : events_(event_queue_capacity) {}

void FocusRouter::focus(const SessionId& session_id, const std::optional<ContextId>& context_id) {
    std::lock_guard<std::recursive_mutex> order(publish_mutex_);
    PendingEvents pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        focus_locked(session_id, context_id, pending);
    }
    publish(pending);
}

void FocusRouter::clear_focus() {
    std::lock_guard<std::recursive_mutex> order(publish_mutex_);
    PendingEvents pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clear_focus_locked(pending);
    }
    publish(pending);
}

bool FocusRouter::is_focused(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_ && *focused_ == session_id;
}

std::optional<SessionId> FocusRouter::focused_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_;
}

void FocusRouter::bind_context(const ContextId& context_id, const SessionId& session_id) {
    if (session_id.empty()) {
        spdlog::warn("FocusRouter: refusing to bind context {} to an empty session id",
                     context_id);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_[context_id] = session_id;
    spdlog::debug("FocusRouter: context {} -> session {}", context_id, session_id);
}

void FocusRouter::unbind_context(const ContextId& context_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_.erase(context_id);
}

void FocusRouter::unbind_session(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    unbind_session_locked(session_id);
}

std::optional<SessionId> FocusRouter::bound_session(const ContextId& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bindings_.find(context_id);
    if (it == bindings_.end()) return std::nullopt;
    return it->second;
}

void FocusRouter::apply_auto_focus(const SessionId& session_id,
                                   FocusHint hint,
                                   const std::optional<ContextId>& context_id) {
    std::lock_guard<std::recursive_mutex> order(publish_mutex_);
    PendingEvents pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (hint.requires_input) {
            focus_locked(session_id, context_id, pending);
        } else if (hint.is_persistent && !focused_) {
            focus_locked(session_id, context_id, pending);
        } else {
            spdlog::debug("FocusRouter: no auto-focus applied for session {}", session_id);
        }
    }
    publish(pending);
}

void FocusRouter::handle_deactivation(const SessionId& session_id) {
    std::lock_guard<std::recursive_mutex> order(publish_mutex_);
    PendingEvents pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t removed = unbind_session_locked(session_id);
        if (focused_ && *focused_ == session_id) {
            clear_focus_locked(pending);
        }

        pending.push_back(make_event(FocusEventKind::BlockDeactivated, session_id, std::nullopt,
                                     "Session deactivated (" + std::to_string(removed) +
                                         " binding(s) released)"));
    }
    publish(pending);
}

void FocusRouter::cleanup_context(const ContextId& context_id) {
    std::lock_guard<std::recursive_mutex> order(publish_mutex_);
    PendingEvents pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = bindings_.find(context_id);
        if (it == bindings_.end()) {
            return;
        }
        SessionId bound = std::move(it->second);
        bindings_.erase(it);

        if (focused_ && *focused_ == bound) {
            clear_focus_locked(pending);
        }
        spdlog::debug("FocusRouter: cleaned up context {} (was -> {})", context_id, bound);
    }
    publish(pending);
}

FocusSnapshot FocusRouter::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    FocusSnapshot snap;
    snap.focused_session = focused_;
    snap.context_bindings = bindings_;
    snap.binding_count = bindings_.size();
    return snap;
}

void FocusRouter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    focused_.reset();
    bindings_.clear();
    spdlog::debug("FocusRouter: all focus state reset");
}

void FocusRouter::focus_locked(const SessionId& session_id,
                               const std::optional<ContextId>& context_id,
                               PendingEvents& out) {
    std::string previous = focused_ ? *focused_ : "none";
    focused_ = session_id;

    out.push_back(make_event(FocusEventKind::FocusChanged, session_id, context_id,
                             "Session focused (previous: " + previous + ")"));
    spdlog::debug("FocusRouter: focus {} -> {}", previous, session_id);
}

void FocusRouter::clear_focus_locked(PendingEvents& out) {
    if (!focused_) {
        return;
    }
    SessionId previous = std::move(*focused_);
    focused_.reset();

    spdlog::debug("FocusRouter: focus cleared (was {})", previous);
    out.push_back(
        make_event(FocusEventKind::FocusChanged, std::move(previous), std::nullopt, "Focus cleared"));
}

std::size_t FocusRouter::unbind_session_locked(const SessionId& session_id) {
    return std::erase_if(bindings_,
                         [&session_id](const auto& entry) { return entry.second == session_id; });
}

void FocusRouter::publish(const PendingEvents& pending) {
    for (const auto& event : pending) {
        events_.publish(event);
    }
}

}  // namespace termroute
