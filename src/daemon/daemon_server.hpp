#pragma once

#include "backend.hpp"
#include "registry.hpp"
#include "request_router.hpp"
#include "session_table.hpp"

#include "../ipc/event_loop.hpp"
#include "../ipc/transport.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace mcpmux::daemon
{

class DaemonError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

struct DaemonOptions
{
    // Unix socket path or tcp://host:port. Empty: the registry's default
    // endpoint for `config_hash`.
    std::string                endpoint;
    std::string                config_hash;
    std::optional<std::string> shared_secret;

    std::chrono::milliseconds idle_timeout{5000};
    std::chrono::milliseconds heartbeat_timeout{15000};
    std::chrono::milliseconds sweep_interval{0};   // 0: heartbeat_timeout

    bool publish_registry = true;

    // Called after the daemon stopped itself (idle timeout or backend exit).
    std::function<void()> on_shutdown;
};

// One row of client_info().
struct ClientInfo
{
    ipc::SessionId             session_id;
    std::optional<std::string> client_id;
    int64_t                    connected_at = 0;   // ms since epoch
    int64_t                    last_seen    = 0;
    bool                       is_owner     = false;
};

// ─── DaemonServer ────────────────────────────────────────────────────────────
// Accepts framed connections, runs the hello / heartbeat / goodbye session
// protocol, keeps exactly one owner among live sessions, and multiplexes all
// sessions onto one shared Backend. Everything runs on the given loop.

class DaemonServer : private ipc::TransportObserver, private BackendSink
{
   public:
    DaemonServer(ipc::EventLoop& loop,
                 Backend&        backend,
                 DaemonRegistry& registry,
                 DaemonOptions   options = {});
    ~DaemonServer() override;

    DaemonServer(const DaemonServer&)            = delete;
    DaemonServer& operator=(const DaemonServer&) = delete;

    // Listen, start the backend, publish the registry entry and start the
    // heartbeat sweep and idle timer. Throws DaemonError (another daemon is
    // reachable or registered, listen failed, backend failed) or
    // RegistryError.
    void start();

    // Idempotent. Closes every connection, the listener, the socket file and
    // this daemon's registry entry, and stops the backend.
    void stop();

    bool running() const { return running_; }

    // Bound endpoint ("tcp://host:port" with the real port for TCP).
    const std::string& endpoint() const { return endpoint_; }
    const std::string& daemon_id() const { return daemon_id_; }

    size_t                        session_count() const { return sessions_.size(); }
    std::optional<ipc::SessionId> owner_session_id() const { return sessions_.owner_id(); }
    std::vector<ClientInfo>       client_info() const;

    // Accepted connections that have not completed the handshake.
    size_t pending_connection_count() const;

   private:
    struct Connection
    {
        std::shared_ptr<ipc::InboundTransport> transport;
        std::optional<ipc::SessionId>          session;
        std::chrono::steady_clock::time_point  accepted_at;
    };

    // ipc::TransportObserver
    void on_message(ipc::Transport& transport, const nlohmann::json& payload) override;
    void on_control(ipc::Transport& transport, const ipc::Envelope& envelope) override;
    void on_closed(ipc::Transport& transport) override;
    void on_error(ipc::Transport& transport, const std::string& message) override;

    // BackendSink
    void on_backend_message(const nlohmann::json& message) override;
    void on_backend_closed() override;

    void        prepare_endpoint(const std::string& endpoint);
    void        publish_registry();
    void        accept_pending();
    void        handle_hello(Connection& conn, const ipc::HelloPayload& hello);
    void        end_session(Connection& conn);
    void        deliver(Route route);
    void        sweep();
    void        arm_idle_timer();
    void        idle_timeout();
    void        shutdown_self(const char* reason);
    void        close_listener();
    Connection* find(const ipc::Transport& transport);

    void send_control(ipc::Transport& transport, const ipc::Envelope& envelope);
    void send_payload(ipc::Transport& transport, const nlohmann::json& payload);

    ipc::EventLoop& loop_;
    Backend&        backend_;
    DaemonRegistry& registry_;
    DaemonOptions   options_;

    std::string endpoint_;
    std::string socket_path_;   // unix endpoints only
    dev_t       socket_dev_ = 0;
    ino_t       socket_ino_ = 0;
    std::string daemon_id_;
    bool        running_         = false;
    bool        backend_started_ = false;

    int                listen_fd_    = -1;
    ipc::EventLoop::WatchId listen_watch_ = 0;
    ipc::EventLoop::TimerId sweep_timer_  = 0;
    ipc::EventLoop::TimerId idle_timer_   = 0;

    std::unordered_map<const ipc::Transport*, Connection> connections_;
    SessionTable                                          sessions_;
    RequestRouter                                         router_;
};

}   // namespace mcpmux::daemon
