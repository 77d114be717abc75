#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "FocusRouter.hpp"
#include "IChannelObserver.hpp"
#include "SessionErrors.hpp"
#include "SessionRegistry.hpp"

using namespace termroute;

namespace {

ConnectionProfile make_profile() {
    ConnectionProfile p;
    p.id = "p1";
    p.name = "staging";
    p.host = "staging.example.com";
    p.username = "ops";
    p.password = "hunter2";
    return p;
}

SessionId start_running(SessionRegistry& registry, SessionType type, SessionConfig config = {}) {
    auto id = registry.create_session(type, std::move(config));
    registry.transition(id, SessionState::Running);
    return id;
}

template <class Event, class Kind>
std::size_t count_for(const std::vector<Event>& events, Kind kind, const SessionId& id) {
    return std::count_if(events.begin(), events.end(), [&](const Event& e) {
        return e.kind == kind && e.session_id == id;
    });
}

// Drives the registry from inside a focus callback, the way a UI layer might
class ReentrantStopper : public IChannelObserver<FocusEvent> {
   public:
    explicit ReentrantStopper(SessionRegistry& registry) : registry_(registry) {}

    void OnEvent(const FocusEvent& event) override {
        if (event.kind != FocusEventKind::BlockDeactivated || event.session_id != target) {
            return;
        }
        visible_during_callback = registry_.get(target).has_value();
        try {
            registry_.transition(target, SessionState::Error);
        } catch (const SessionError&) {
            ++rejected;
        }
    }

    SessionId target;
    bool visible_during_callback = true;
    int rejected = 0;

   private:
    SessionRegistry& registry_;
};

}  // namespace

// --- Creation ---

TEST(SessionRegistry, CreateStartsInStarting) {
    FocusRouter router;
    SessionRegistry registry(router);

    auto id = registry.create_session(SessionType::Local);
    auto snap = registry.get(id);

    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->state, SessionState::Starting);
    EXPECT_EQ(snap->type, SessionType::Local);
    EXPECT_EQ(snap->command_count, 0u);
    EXPECT_TRUE(snap->recent_commands.empty());
    EXPECT_EQ(snap->created_at, snap->last_activity_at);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, IdsAreUnique) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto a = registry.create_session(SessionType::Local);
    auto b = registry.create_session(SessionType::Local);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 36u);
}

TEST(SessionRegistry, CreateDoesNotFocusBeforeRunning) {
    FocusRouter router;
    SessionRegistry registry(router);
    registry.create_session(SessionType::Local);
    EXPECT_FALSE(router.focused_session().has_value());
}

TEST(SessionRegistry, RemoteShellRequiresProfile) {
    FocusRouter router;
    SessionRegistry registry(router);

    try {
        registry.create_session(SessionType::RemoteShell);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportErrorKind::Config);
    }
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, RemoteShellRejectsInvalidProfile) {
    FocusRouter router;
    SessionRegistry registry(router);

    SessionConfig config;
    config.profile = make_profile();
    config.profile->port = 70000;

    EXPECT_THROW(registry.create_session(SessionType::RemoteShell, config), TransportError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, CreatedEventPublished) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();

    auto id = registry.create_session(SessionType::Socket);

    auto events = sub->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, SessionEventKind::Created);
    EXPECT_EQ(events[0].session_id, id);
    ASSERT_TRUE(events[0].state.has_value());
    EXPECT_EQ(*events[0].state, SessionState::Starting);
}

// --- Commands ---

TEST(SessionRegistry, RecentCommandsBoundedAtFifty) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = start_running(registry, SessionType::Local);

    for (int i = 1; i <= 51; ++i) {
        registry.record_command(id, "cmd" + std::to_string(i));
    }

    auto snap = registry.get(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->command_count, 51u);
    ASSERT_EQ(snap->recent_commands.size(), 50u);
    EXPECT_EQ(snap->recent_commands.front(), "cmd2");
    EXPECT_EQ(snap->recent_commands.back(), "cmd51");
    EXPECT_EQ(std::count(snap->recent_commands.begin(), snap->recent_commands.end(), "cmd1"), 0);
}

TEST(SessionRegistry, RecentCommandCapacityIsConfigurable) {
    FocusRouter router;
    RegistryConfig config;
    config.recent_command_capacity = 3;
    SessionRegistry registry(router, config);
    auto id = registry.create_session(SessionType::Local);

    for (const char* cmd : {"a", "b", "c", "d"}) {
        registry.record_command(id, cmd);
    }

    auto snap = registry.get(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->recent_commands, (std::vector<std::string>{"b", "c", "d"}));
}

TEST(SessionRegistry, RecordCommandUpdatesActivity) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = registry.create_session(SessionType::Local);
    auto before = registry.get(id)->last_activity_at;

    registry.record_command(id, "ls");

    EXPECT_GE(registry.get(id)->last_activity_at, before);
}

TEST(SessionRegistry, RecordCommandUnknownSession) {
    FocusRouter router;
    SessionRegistry registry(router);
    try {
        registry.record_command("missing", "ls");
        FAIL() << "expected UnknownSessionError";
    } catch (const UnknownSessionError& e) {
        EXPECT_EQ(e.session_id(), "missing");
    }
}

TEST(SessionRegistry, WorkingDirectoryAndStats) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = registry.create_session(SessionType::Local);

    registry.set_working_directory(id, "/tmp");
    registry.set_stat(id, "bytesReceived", std::int64_t{1024});
    registry.set_stat(id, "compressed", true);

    auto snap = registry.get(id);
    ASSERT_TRUE(snap.has_value());
    ASSERT_TRUE(snap->current_working_directory.has_value());
    EXPECT_EQ(*snap->current_working_directory, "/tmp");
    EXPECT_EQ(std::get<std::int64_t>(snap->session_stats.at("bytesReceived")), 1024);
    EXPECT_TRUE(std::get<bool>(snap->session_stats.at("compressed")));

    EXPECT_THROW(registry.set_stat("missing", "k", 1.0), UnknownSessionError);
}

// --- Lifecycle ---

TEST(SessionRegistry, InvalidTransitionLeavesStateUnchanged) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = registry.create_session(SessionType::Local);

    try {
        registry.transition(id, SessionState::Stopped);
        FAIL() << "expected InvalidTransitionError";
    } catch (const InvalidTransitionError& e) {
        EXPECT_EQ(e.from(), SessionState::Starting);
        EXPECT_EQ(e.to(), SessionState::Stopped);
    }
    EXPECT_EQ(registry.get(id)->state, SessionState::Starting);

    registry.transition(id, SessionState::Running);
    EXPECT_THROW(registry.transition(id, SessionState::Idle), InvalidTransitionError);
    EXPECT_EQ(registry.get(id)->state, SessionState::Running);
}

TEST(SessionRegistry, TransitionUnknownSession) {
    FocusRouter router;
    SessionRegistry registry(router);
    EXPECT_THROW(registry.transition("missing", SessionState::Running), UnknownSessionError);
}

TEST(SessionRegistry, StoppedSessionIsRemoved) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = start_running(registry, SessionType::Local);

    registry.transition(id, SessionState::Stopping);
    registry.transition(id, SessionState::Stopped);

    EXPECT_FALSE(registry.get(id).has_value());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_THROW(registry.record_command(id, "ls"), UnknownSessionError);
}

TEST(SessionRegistry, ErrorReachableFromAnyState) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto id = registry.create_session(SessionType::Local);
    registry.transition(id, SessionState::Error);
    EXPECT_FALSE(registry.get(id).has_value());
}

TEST(SessionRegistry, RunningBindsContext) {
    FocusRouter router;
    SessionRegistry registry(router);

    SessionConfig config;
    config.context_id = "conv-1";
    auto id = start_running(registry, SessionType::Local, config);

    ASSERT_TRUE(router.bound_session("conv-1").has_value());
    EXPECT_EQ(*router.bound_session("conv-1"), id);
}

TEST(SessionRegistry, AutoFocusCanBeDisabled) {
    FocusRouter router;
    RegistryConfig config;
    config.auto_focus = false;
    SessionRegistry registry(router, config);

    start_running(registry, SessionType::Local);
    EXPECT_FALSE(router.focused_session().has_value());
}

TEST(SessionRegistry, ExplicitHintOverridesDerivation) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto a = start_running(registry, SessionType::Local);

    SessionConfig config;
    config.command = "ls -la";
    config.focus_hint = FocusHint{true, false};
    auto b = start_running(registry, SessionType::Local, config);

    EXPECT_TRUE(router.is_focused(b));
    EXPECT_FALSE(router.is_focused(a));
}

TEST(SessionRegistry, CommandClassificationDrivesFocus) {
    FocusRouter router;
    SessionRegistry registry(router);

    SessionConfig editor;
    editor.command = "vim main.cpp";
    auto a = start_running(registry, SessionType::Local, editor);

    SessionConfig watcher;
    watcher.command = "tail -f app.log";
    start_running(registry, SessionType::Local, watcher);

    SessionConfig oneshot;
    oneshot.command = "ls";
    start_running(registry, SessionType::Local, oneshot);

    EXPECT_TRUE(router.is_focused(a));
}

TEST(SessionRegistry, FocusScenario) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto focus_events = router.events().subscribe();

    // Interactive shell takes focus
    SessionConfig shell;
    shell.context_id = "main";
    auto a = start_running(registry, SessionType::Local, shell);
    EXPECT_TRUE(router.is_focused(a));

    // Persistent, non-interactive monitor does not steal it
    SessionConfig monitor;
    monitor.context_id = "monitor";
    auto b = start_running(registry, SessionType::Socket, monitor);
    EXPECT_TRUE(router.is_focused(a));

    focus_events->drain();

    registry.transition(a, SessionState::Stopping);
    registry.transition(a, SessionState::Stopped);

    EXPECT_FALSE(router.focused_session().has_value());
    auto snap = router.snapshot();
    for (const auto& [context, session] : snap.context_bindings) {
        EXPECT_NE(session, a) << "residual binding " << context;
    }
    EXPECT_EQ(*router.bound_session("monitor"), b);
    EXPECT_EQ(count_for(focus_events->drain(), FocusEventKind::BlockDeactivated, a), 1u);
}

TEST(SessionRegistry, SessionEventsFollowLifecycle) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();

    auto id = start_running(registry, SessionType::Local);
    registry.record_command(id, "pwd");
    registry.transition(id, SessionState::Error);

    std::vector<SessionEventKind> kinds;
    for (const auto& e : sub->drain()) {
        kinds.push_back(e.kind);
    }
    EXPECT_EQ(kinds, (std::vector<SessionEventKind>{
                         SessionEventKind::Created, SessionEventKind::StateChanged,
                         SessionEventKind::CommandRecorded, SessionEventKind::StateChanged,
                         SessionEventKind::Removed}));
}

// --- Transport signal ---

TEST(SessionRegistry, CompleteStartSuccessRuns) {
    FocusRouter router;
    SessionRegistry registry(router);

    SessionConfig config;
    config.profile = make_profile();
    auto id = registry.create_session(SessionType::RemoteShell, config);

    registry.complete_start(id, ConnectionHandle{"c1", "ops@staging.example.com"});

    EXPECT_EQ(registry.get(id)->state, SessionState::Running);
    EXPECT_TRUE(router.is_focused(id));
}

TEST(SessionRegistry, CompleteStartFailureRemovesAndRethrows) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();

    SessionConfig config;
    config.profile = make_profile();
    auto id = registry.create_session(SessionType::RemoteShell, config);

    ConnectionResult failure =
        std::unexpected(TransportError(TransportErrorKind::Auth, "Authentication failed"));
    try {
        registry.complete_start(id, failure);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportErrorKind::Auth);
        EXPECT_STREQ(e.what(), "Authentication failed");
    }

    EXPECT_FALSE(registry.get(id).has_value());
    EXPECT_FALSE(router.focused_session().has_value());
    EXPECT_EQ(count_for(sub->drain(), SessionEventKind::Error, id), 1u);
}

TEST(SessionRegistry, CompleteStartUnknownSession) {
    FocusRouter router;
    SessionRegistry registry(router);
    ConnectionResult ok = ConnectionHandle{"c", "e"};
    EXPECT_THROW(registry.complete_start("missing", ok), UnknownSessionError);
}

// --- Aggregates ---

TEST(SessionRegistry, StatsCountByStateAndType) {
    FocusRouter router;
    SessionRegistry registry(router);
    start_running(registry, SessionType::Local);
    start_running(registry, SessionType::Socket);
    registry.create_session(SessionType::Local);

    auto stats = registry.stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.by_state[SessionState::Running], 2u);
    EXPECT_EQ(stats.by_state[SessionState::Starting], 1u);
    EXPECT_EQ(stats.by_type[SessionType::Local], 2u);
    EXPECT_EQ(stats.by_type[SessionType::Socket], 1u);
    EXPECT_EQ(registry.list_ids().size(), 3u);
}

TEST(SessionRegistry, StopAllEmptiesRegistryAndFocus) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();
    start_running(registry, SessionType::Local);
    auto stopping = start_running(registry, SessionType::Socket);
    registry.transition(stopping, SessionState::Stopping);
    registry.create_session(SessionType::Local);

    registry.stop_all();

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(router.focused_session().has_value());
    EXPECT_EQ(router.snapshot().binding_count, 0u);

    auto events = sub->drain();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, SessionEventKind::Cleanup);
    EXPECT_EQ(events.back().message, "All sessions cleaned up");
    EXPECT_EQ(count_for(events, SessionEventKind::Cleanup, SessionId{}), 1u);
}

TEST(SessionRegistry, StopAllOnEmptyRegistryStillSignalsCleanup) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();

    registry.stop_all();

    auto events = sub->drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, SessionEventKind::Cleanup);
}

// --- Terminal states and re-entry ---

TEST(SessionRegistry, NoTransitionOutOfTerminalState) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto focus_events = router.events().subscribe();
    auto id = start_running(registry, SessionType::Local);

    registry.transition(id, SessionState::Error);

    // The session is gone, so a second terminal transition cannot deactivate it again
    EXPECT_THROW(registry.transition(id, SessionState::Error), UnknownSessionError);
    EXPECT_EQ(count_for(focus_events->drain(), FocusEventKind::BlockDeactivated, id), 1u);
}

TEST(SessionRegistry, ObserverReentryDuringDeactivation) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto stopper = std::make_shared<ReentrantStopper>(registry);
    router.events().attach_observer(stopper);
    auto focus_events = router.events().subscribe();
    auto session_events = registry.events().subscribe();

    auto id = start_running(registry, SessionType::Local);
    registry.transition(id, SessionState::Stopping);
    stopper->target = id;

    registry.transition(id, SessionState::Stopped);

    EXPECT_FALSE(stopper->visible_during_callback);
    EXPECT_EQ(stopper->rejected, 1);
    EXPECT_FALSE(registry.get(id).has_value());
    EXPECT_EQ(count_for(focus_events->drain(), FocusEventKind::BlockDeactivated, id), 1u);
    EXPECT_EQ(count_for(session_events->drain(), SessionEventKind::Removed, id), 1u);
}

TEST(SessionRegistry, ConcurrentTerminalTransitionsRemoveOnce) {
    for (int round = 0; round < 50; ++round) {
        FocusRouter router(1024);
        SessionRegistry registry(router);
        auto focus_events = router.events().subscribe();
        auto id = start_running(registry, SessionType::Local);
        registry.transition(id, SessionState::Stopping);

        std::atomic<int> succeeded{0};
        std::atomic<int> rejected{0};
        auto worker = [&](SessionState target) {
            try {
                registry.transition(id, target);
                ++succeeded;
            } catch (const SessionError&) {
                ++rejected;
            }
        };
        std::thread a(worker, SessionState::Stopped);
        std::thread b(worker, SessionState::Error);
        a.join();
        b.join();

        EXPECT_EQ(succeeded.load(), 1) << "round " << round;
        EXPECT_EQ(rejected.load(), 1) << "round " << round;
        EXPECT_EQ(registry.size(), 0u);
        EXPECT_EQ(count_for(focus_events->drain(), FocusEventKind::BlockDeactivated, id), 1u)
            << "round " << round;
    }
}

// --- Shells and idle sessions ---

TEST(SessionRegistry, LocalLoginShellTakesFocus) {
    FocusRouter router;
    SessionRegistry registry(router);

    SessionConfig monitor;
    monitor.command = "tail -f app.log";
    start_running(registry, SessionType::Local, monitor);

    SessionConfig shell;
    shell.command = "bash";
    auto id = start_running(registry, SessionType::Local, shell);

    auto snap = registry.get(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_TRUE(snap->focus_hint.requires_input);
    EXPECT_TRUE(router.is_focused(id));
}

TEST(SessionRegistry, StartIdleWalksFullGraph) {
    FocusRouter router;
    SessionRegistry registry(router);
    auto sub = registry.events().subscribe();

    SessionConfig config;
    config.start_idle = true;
    auto id = registry.create_session(SessionType::Local, config);

    EXPECT_EQ(registry.get(id)->state, SessionState::Idle);
    auto created = sub->drain();
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(*created[0].state, SessionState::Idle);

    EXPECT_THROW(registry.transition(id, SessionState::Running), InvalidTransitionError);
    registry.transition(id, SessionState::Starting);
    registry.transition(id, SessionState::Running);
    EXPECT_TRUE(router.is_focused(id));
}
