// 1. Standard Library
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "FocusRouter.hpp"
#include "IChannelObserver.hpp"
#include "IConnector.hpp"
#include "JsonBuilder.hpp"
#include "Logging.hpp"
#include "SessionErrors.hpp"
#include "SessionRegistry.hpp"
#include "config.hpp"

namespace asio = boost::asio;
using namespace termroute;
using models::JsonBuilder;

namespace {

class FocusLogObserver : public IChannelObserver<FocusEvent> {
   public:
    void OnEvent(const FocusEvent& event) override {
        spdlog::info("[focus] {}", JsonBuilder::serialize(JsonBuilder::focus_event(event)));
    }
    void OnChannelClosed() override { spdlog::debug("[focus] channel closed"); }
};

// Stand-in transport: blocks briefly, hosts named "unreachable" fail at the socket level
class LoopbackConnector : public IConnector {
   public:
    ConnectionResult establish(const ConnectionProfile& profile) override {
        if (auto reason = validate_profile(profile)) {
            return std::unexpected(TransportError(TransportErrorKind::Config, *reason));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (profile.host == "unreachable") {
            return std::unexpected(
                TransportError(TransportErrorKind::Network, "Connection refused: " + profile.host));
        }
        return ConnectionHandle{"loopback-" + profile.id, profile.connection_string()};
    }
};

/**
 * @brief Drives a scripted set of sessions through the registry.
 *
 * @details
 * Registry and router are only touched from the coordinating io_context.
 * Connection attempts run on the transport pool and post their result back.
 */
class DemoShell : public std::enable_shared_from_this<DemoShell> {
   public:
    DemoShell(asio::io_context& ioc,
              asio::thread_pool& transport_pool,
              SessionRegistry& registry,
              FocusRouter& router,
              IConnector& connector)
        : ioc_(ioc),
          transport_pool_(transport_pool),
          registry_(registry),
          router_(router),
          connector_(connector) {}

    void Start() {
        // A. Interactive editor in the "main" conversation takes focus
        SessionConfig editor;
        editor.command = "vim notes.txt";
        editor.context_id = "main";
        editor_id_ = registry_.create_session(SessionType::Local, editor);
        registry_.transition(editor_id_, SessionState::Running);
        registry_.record_command(editor_id_, ":w");

        // B. Long-lived log follower does not steal it
        SessionConfig follower;
        follower.command = "tail -f /var/log/syslog";
        follower.context_id = "logs";
        auto follower_id = registry_.create_session(SessionType::Local, follower);
        registry_.transition(follower_id, SessionState::Running);
        registry_.set_working_directory(follower_id, "/var/log");

        // C. Remote shells connect off-thread
        ConnectionProfile prod;
        prod.id = "prod";
        prod.name = "Production";
        prod.host = "prod.example.com";
        prod.username = "deploy";
        prod.password = "secret";
        Connect(prod, "ops");

        ConnectionProfile lab = prod;
        lab.id = "lab";
        lab.name = "Lab";
        lab.host = "unreachable";
        Connect(lab, "lab");
    }

    void Shutdown() {
        registry_.stop_all();
        spdlog::info("Focus at shutdown: {}",
                     JsonBuilder::serialize(JsonBuilder::focus(router_.snapshot())));
    }

   private:
    void Connect(const ConnectionProfile& profile, const std::string& context) {
        SessionConfig remote;
        remote.profile = profile;
        remote.context_id = context;
        auto id = registry_.create_session(SessionType::RemoteShell, remote);
        ++pending_connects_;

        asio::post(transport_pool_, [self = shared_from_this(), id, profile]() {
            auto result = self->connector_.establish(profile);
            asio::post(self->ioc_, [self, id, result]() { self->OnConnected(id, result); });
        });
    }

    void OnConnected(const SessionId& id, const ConnectionResult& result) {
        try {
            registry_.complete_start(id, result);
        } catch (const TransportError& e) {
            spdlog::warn("Remote session {} failed: {}", id, e.what());
        } catch (const SessionError& e) {
            spdlog::warn("Remote session {} gone before connect finished: {}", id, e.what());
        }

        if (--pending_connects_ == 0) {
            Report();
        }
    }

    void Report() {
        spdlog::info("Focus: {}", JsonBuilder::serialize(JsonBuilder::focus(router_.snapshot())));
        for (const auto& id : registry_.list_ids()) {
            if (auto snap = registry_.get(id)) {
                spdlog::info("Session: {}", JsonBuilder::serialize(JsonBuilder::session(*snap)));
            }
        }
        spdlog::info("Stats: {}",
                     JsonBuilder::serialize(JsonBuilder::registry_stats(registry_.stats())));

        // D. Closing the editor releases focus and its "main" binding
        registry_.transition(editor_id_, SessionState::Stopping);
        registry_.transition(editor_id_, SessionState::Stopped);
        spdlog::info("Focus after editor exit: {}",
                     JsonBuilder::serialize(JsonBuilder::focus(router_.snapshot())));

        ioc_.stop();
    }

    asio::io_context& ioc_;
    asio::thread_pool& transport_pool_;
    SessionRegistry& registry_;
    FocusRouter& router_;
    IConnector& connector_;

    SessionId editor_id_;
    int pending_connects_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
    try {
        // 1. Configuration
        const std::string config_path = argc > 1 ? argv[1] : "termroute.toml";
        AppConfig config = LoadConfig(config_path);

        SetupLogging(config.logging);

        // 2. Core Components
        FocusRouter router(config.events.queue_capacity);
        SessionRegistry registry(router, config.registry, config.events);

        auto observer = std::make_shared<FocusLogObserver>();
        router.events().attach_observer(observer);

        asio::io_context main_ioc;
        asio::thread_pool transport_pool(2);
        LoopbackConnector connector;

        auto shell =
            std::make_shared<DemoShell>(main_ioc, transport_pool, registry, router, connector);

        // 3. Graceful Shutdown Signal
        asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        signals.async_wait([&main_ioc](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_number);
            main_ioc.stop();
        });

        spdlog::info("termroute demo starting");

        // 4. Run
        asio::post(main_ioc, [shell]() { shell->Start(); });
        main_ioc.run();

        transport_pool.join();
        shell->Shutdown();

        router.events().close();
        registry.events().close();
        spdlog::info("termroute demo complete.");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
