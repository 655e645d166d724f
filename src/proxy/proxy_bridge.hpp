#pragma once

#include "../daemon/registry.hpp"
#include "../ipc/event_loop.hpp"
#include "../ipc/line_channel.hpp"
#include "../ipc/transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpmux::proxy
{

class ProxyError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// "Start a daemon for this configuration". Must return without waiting for
// the daemon; success is observed through the registry. Receives the shared
// secret the daemon should require, if any.
using SpawnDaemonFn = std::function<void(const std::optional<std::string>& shared_secret)>;

struct ProxyOptions
{
    std::string                endpoint;      // explicit endpoint, skips discovery
    std::string                config_hash;
    std::optional<std::string> shared_secret;
    std::optional<std::string> launcher_hint;   // else from the environment

    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds startup_timeout{5000};
    std::chrono::milliseconds heartbeat_interval{5000};
    std::chrono::milliseconds poll_interval{100};

    bool          no_spawn = false;
    SpawnDaemonFn spawn_daemon;
    bool          debug = false;

    // Called once both the daemon transport and the local channel are closed.
    std::function<void()> on_finished;
};

// ─── ProxyBridge ─────────────────────────────────────────────────────────────
// Client side of the multiplexer. Finds (or spawns) the daemon for a
// configuration, connects to it, says hello, keeps the session alive with
// heartbeats and forwards JSON-RPC messages verbatim between the local
// channel and the daemon, in order, in both directions.

class ProxyBridge : private ipc::TransportObserver, private ipc::ChannelObserver
{
   public:
    ProxyBridge(ipc::EventLoop&         loop,
                ipc::Channel&           local,
                daemon::DaemonRegistry& registry,
                ProxyOptions            options = {});
    ~ProxyBridge() override;

    ProxyBridge(const ProxyBridge&)            = delete;
    ProxyBridge& operator=(const ProxyBridge&) = delete;

    // Resolve the endpoint, connect and start forwarding. Throws ProxyError
    // when no endpoint can be found or the daemon never registers, and
    // ipc::TransportError when the connect fails or times out.
    void start();

    // Idempotent. Sends at most one goodbye and closes both sides.
    void stop();

    const std::string&                   endpoint() const { return endpoint_; }
    const std::optional<ipc::SessionId>& session_id() const { return session_id_; }
    bool                                 is_owner() const { return is_owner_; }
    bool                                 finished() const { return finished_; }

    // The daemon's error message when it refused the hello (for example a
    // wrong shared secret). Unset once a session was established.
    const std::optional<std::string>& rejection() const { return rejection_; }

    // Number of times the spawn operation ran (0 or 1).
    int spawn_count() const { return spawn_count_; }

    // "<hint>-<pid>" with the hint from `hint`, MCPMUX_LAUNCHER,
    // MCP_CLIENT_NAME or MCPMUX_AGENT; "proxy-<pid>" without one.
    static std::string make_client_id(const std::optional<std::string>& hint);

   private:
    std::string resolve_endpoint();
    std::string wait_for_daemon();

    // ipc::TransportObserver (daemon side)
    void on_message(ipc::Transport& transport, const nlohmann::json& payload) override;
    void on_control(ipc::Transport& transport, const ipc::Envelope& envelope) override;
    void on_closed(ipc::Transport& transport) override;
    void on_error(ipc::Transport& transport, const std::string& message) override;

    // ipc::ChannelObserver (local side)
    void on_message(const nlohmann::json& message) override;
    void on_closed() override;

    void send_heartbeat();
    void cancel_heartbeat();
    void close_daemon(bool send_goodbye);
    void check_finished();

    ipc::EventLoop&         loop_;
    ipc::Channel&           local_;
    daemon::DaemonRegistry& registry_;
    ProxyOptions            options_;

    std::string                             endpoint_;
    std::optional<std::string>              shared_secret_;
    std::unique_ptr<ipc::OutboundTransport> daemon_;
    ipc::EventLoop::TimerId                 heartbeat_timer_ = 0;

    std::optional<ipc::SessionId> session_id_;
    std::optional<std::string>    rejection_;
    bool                          is_owner_       = false;
    bool                          started_        = false;
    bool                          stopped_        = false;
    bool                          daemon_closing_ = false;
    bool                          daemon_closed_  = false;
    bool                          local_closed_   = false;
    bool                          finished_       = false;
    int                           spawn_count_    = 0;
};

}   // namespace mcpmux::proxy
