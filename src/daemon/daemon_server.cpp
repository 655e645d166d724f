#include "daemon_server.hpp"

#include "core/paths.hpp"
#include "core/uuid.hpp"
#include "ipc/endpoint.hpp"

#include <mcpmux/logger.hpp>
#include <mcpmux/version.hpp>

#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

namespace mcpmux::daemon
{

namespace
{
std::string parent_dir(const std::string& path)
{
    auto slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0)
        return {};
    return path.substr(0, slash);
}
}   // namespace

DaemonServer::DaemonServer(ipc::EventLoop& loop,
                           Backend&        backend,
                           DaemonRegistry& registry,
                           DaemonOptions   options)
    : loop_(loop), backend_(backend), registry_(registry), options_(std::move(options))
{
    if (options_.sweep_interval.count() <= 0)
        options_.sweep_interval = options_.heartbeat_timeout;
}

DaemonServer::~DaemonServer()
{
    stop();
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

void DaemonServer::start()
{
    if (running_)
        return;

    std::string requested = options_.endpoint.empty()
                                ? registry_.default_endpoint(options_.config_hash)
                                : options_.endpoint;
    prepare_endpoint(requested);

    auto ep = ipc::parse_endpoint(requested);
    listen_fd_ = ipc::listen_endpoint(*ep, endpoint_);
    if (listen_fd_ < 0)
        throw DaemonError("Failed to listen on " + requested + ": " + std::strerror(errno));
    if (!ep->is_tcp())
    {
        socket_path_ = ep->path;
        struct stat st
        {
        };
        if (::lstat(socket_path_.c_str(), &st) == 0)
        {
            socket_dev_ = st.st_dev;
            socket_ino_ = st.st_ino;
        }
    }

    try
    {
        backend_.start(loop_, *this);
        backend_started_ = true;
    }
    catch (const std::exception& e)
    {
        close_listener();
        throw DaemonError(std::string("Backend failed to start: ") + e.what());
    }

    daemon_id_ = random_uuid();
    if (options_.publish_registry)
    {
        try
        {
            publish_registry();
        }
        catch (...)
        {
            close_listener();
            backend_.stop();
            backend_started_ = false;
            throw;
        }
    }

    listen_watch_ = loop_.add(listen_fd_,
                              ipc::EventLoop::EVENT_READABLE,
                              [this](uint32_t) { accept_pending(); });
    sweep_timer_  = loop_.add_timer(options_.sweep_interval, [this]() { sweep(); }, true);
    running_      = true;
    arm_idle_timer();

    MCPMUX_LOG_INFO("daemon", "daemon {} listening on {}", daemon_id_, endpoint_);
}

void DaemonServer::prepare_endpoint(const std::string& endpoint)
{
    auto ep = ipc::parse_endpoint(endpoint);
    if (!ep)
        throw DaemonError("Invalid endpoint: " + endpoint);

    if (ep->is_tcp())
    {
        if (ep->port > 0 && ipc::can_connect(endpoint))
            throw DaemonError("Daemon already running at " + endpoint
                              + ". Refusing to start another.");
        return;
    }

    std::string dir = parent_dir(ep->path);
    if (!dir.empty() && !ensure_directory(dir, 0700))
        throw DaemonError("Failed to create " + dir + ": " + std::strerror(errno));

    struct stat st
    {
    };
    if (::lstat(ep->path.c_str(), &st) == 0)
    {
        if (ipc::can_connect(endpoint))
            throw DaemonError("Daemon already running at " + endpoint
                              + ". Refusing to start another.");
        // Not accepting yet, but a running daemon may still be between bind()
        // and listen() on it.
        auto existing = registry_.read(options_.config_hash);
        if (existing && existing->endpoint == endpoint
            && DaemonRegistry::is_process_running(existing->pid))
        {
            throw DaemonError("Daemon " + existing->daemon_id + " (pid "
                              + std::to_string(existing->pid) + ") still owns " + endpoint);
        }
        MCPMUX_LOG_DEBUG("daemon", "removing stale socket {}", ep->path);
        ::unlink(ep->path.c_str());
    }
}

void DaemonServer::publish_registry()
{
    RegistryEntry entry;
    entry.daemon_id     = daemon_id_;
    entry.endpoint      = endpoint_;
    entry.pid           = ::getpid();
    entry.started_at    = now_ms();
    entry.version       = VERSION;
    entry.shared_secret = options_.shared_secret;
    if (!options_.config_hash.empty())
        entry.config_hash = options_.config_hash;

    if (registry_.create(entry))
        return;

    // An entry exists. One naming our endpoint was unreachable before we bound
    // it, so only its process decides: if that still runs we lost a race for
    // the socket path.
    auto existing = registry_.read(options_.config_hash);
    if (existing)
    {
        bool live = existing->endpoint == endpoint_
                        ? DaemonRegistry::is_process_running(existing->pid)
                        : DaemonRegistry::is_alive(*existing);
        if (live)
            throw DaemonError("Daemon " + existing->daemon_id + " already registered at "
                              + existing->endpoint);
    }
    registry_.write(entry);
}

void DaemonServer::stop()
{
    if (!running_)
        return;
    running_ = false;

    if (sweep_timer_ != 0)
    {
        loop_.cancel_timer(sweep_timer_);
        sweep_timer_ = 0;
    }
    if (idle_timer_ != 0)
    {
        loop_.cancel_timer(idle_timer_);
        idle_timer_ = 0;
    }

    // Detach the table first so on_closed() sees no connection and nothing
    // is broadcast while tearing down.
    auto conns = std::move(connections_);
    connections_.clear();
    sessions_ = SessionTable{};
    router_   = RequestRouter{};
    for (auto& [ptr, conn] : conns)
    {
        auto transport = conn.transport;
        transport->destroy();
        loop_.defer([transport]() {});
    }

    close_listener();
    if (options_.publish_registry && !daemon_id_.empty())
        registry_.remove_if_owned(options_.config_hash, daemon_id_);

    if (backend_started_)
    {
        backend_started_ = false;
        backend_.stop();
    }
    MCPMUX_LOG_INFO("daemon", "daemon {} stopped", daemon_id_);
}

void DaemonServer::close_listener()
{
    if (listen_watch_ != 0)
    {
        loop_.remove(listen_watch_);
        listen_watch_ = 0;
    }
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!socket_path_.empty())
    {
        // Leave the path alone if another daemon has bound it since.
        struct stat st
        {
        };
        if (::lstat(socket_path_.c_str(), &st) == 0 && st.st_dev == socket_dev_
            && st.st_ino == socket_ino_)
            ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

void DaemonServer::shutdown_self(const char* reason)
{
    MCPMUX_LOG_INFO("daemon", "shutting down: {}", reason);
    stop();
    if (options_.on_shutdown)
        options_.on_shutdown();
}

// ─── Connections ─────────────────────────────────────────────────────────────

void DaemonServer::accept_pending()
{
    for (;;)
    {
        int fd = ipc::accept_connection(listen_fd_);
        if (fd < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                MCPMUX_LOG_WARN("daemon", "accept failed: {}", std::strerror(errno));
            return;
        }

        auto transport = std::make_shared<ipc::InboundTransport>(
            loop_, fd, static_cast<ipc::TransportObserver&>(*this));
        MCPMUX_LOG_DEBUG("daemon", "accepted connection #{}", transport->id());

        Connection conn;
        conn.transport   = transport;
        conn.accepted_at = std::chrono::steady_clock::now();
        connections_.emplace(transport.get(), std::move(conn));
    }
}

DaemonServer::Connection* DaemonServer::find(const ipc::Transport& transport)
{
    auto it = connections_.find(&transport);
    return it == connections_.end() ? nullptr : &it->second;
}

size_t DaemonServer::pending_connection_count() const
{
    size_t n = 0;
    for (const auto& [ptr, conn] : connections_)
    {
        if (!conn.session)
            ++n;
    }
    return n;
}

void DaemonServer::on_closed(ipc::Transport& transport)
{
    auto it = connections_.find(&transport);
    if (it == connections_.end())
        return;

    MCPMUX_LOG_DEBUG("daemon", "connection #{} closed", transport.id());
    end_session(it->second);

    // The transport is on the call stack; release it on the next pass.
    auto keep = it->second.transport;
    connections_.erase(it);
    loop_.defer([keep]() {});

    arm_idle_timer();
}

void DaemonServer::on_error(ipc::Transport& transport, const std::string& message)
{
    MCPMUX_LOG_DEBUG("daemon", "connection #{}: {}", transport.id(), message);
}

// ─── Session protocol ────────────────────────────────────────────────────────

void DaemonServer::on_control(ipc::Transport& transport, const ipc::Envelope& envelope)
{
    Connection* conn = find(transport);
    if (!conn)
        return;

    if (conn->session)
        sessions_.touch(*conn->session);

    switch (ipc::envelope_type(envelope))
    {
        case ipc::EnvelopeType::HELLO:
            handle_hello(*conn, std::get<ipc::HelloPayload>(envelope));
            break;

        case ipc::EnvelopeType::HEARTBEAT:
            break;

        case ipc::EnvelopeType::GOODBYE:
            MCPMUX_LOG_DEBUG("daemon",
                             "goodbye from {}",
                             conn->session ? *conn->session : std::string("(no session)"));
            end_session(*conn);
            arm_idle_timer();
            transport.close();
            break;

        default:
            MCPMUX_LOG_DEBUG("daemon",
                             "ignoring {} from client",
                             ipc::envelope_type_name(ipc::envelope_type(envelope)));
            break;
    }
}

void DaemonServer::handle_hello(Connection& conn, const ipc::HelloPayload& hello)
{
    if (conn.session)
    {
        // Repeated hello: same session, current ownership.
        if (auto* s = sessions_.find(*conn.session); s && hello.client_id)
            s->client_id = hello.client_id;
        send_control(*conn.transport,
                     ipc::HelloAckPayload{*conn.session, sessions_.is_owner(*conn.session)});
        return;
    }

    if (options_.shared_secret && hello.shared_secret != options_.shared_secret)
    {
        MCPMUX_LOG_WARN("daemon", "rejecting connection #{}: bad shared secret", conn.transport->id());
        send_control(*conn.transport, ipc::ErrorPayload{"Invalid shared secret"});
        conn.transport->close();
        return;
    }

    SessionEntry& session = sessions_.add(conn.transport.get(), hello.client_id);
    conn.session          = session.id;

    if (idle_timer_ != 0)
    {
        loop_.cancel_timer(idle_timer_);
        idle_timer_ = 0;
    }

    MCPMUX_LOG_INFO("daemon",
                    "session {} opened (client {}, owner {})",
                    session.id,
                    session.client_id.value_or("-"),
                    sessions_.is_owner(session.id));

    send_control(*conn.transport, ipc::HelloAckPayload{session.id, sessions_.is_owner(session.id)});
}

void DaemonServer::end_session(Connection& conn)
{
    if (!conn.session)
        return;

    ipc::SessionId id = *conn.session;
    conn.session.reset();

    auto removal = sessions_.remove(id);
    for (auto& reply : router_.drop_session(id))
        backend_.send(reply);

    MCPMUX_LOG_INFO("daemon", "session {} closed ({} remaining)", id, sessions_.size());

    if (removal && removal->new_owner)
    {
        MCPMUX_LOG_INFO("daemon", "ownership moved to {}", *removal->new_owner);
        for (const auto* s : sessions_.all())
            send_control(*s->transport, ipc::OwnerChangedPayload{*removal->new_owner});
    }
}

void DaemonServer::sweep()
{
    auto now = std::chrono::steady_clock::now();

    std::vector<std::shared_ptr<ipc::InboundTransport>> expired;
    for (const auto& id : sessions_.stale(options_.heartbeat_timeout))
    {
        if (const auto* s = sessions_.find(id))
        {
            MCPMUX_LOG_INFO("daemon", "evicting session {}: heartbeat timeout", id);
            if (auto* conn = find(*s->transport))
                expired.push_back(conn->transport);
        }
    }
    for (const auto& [ptr, conn] : connections_)
    {
        if (!conn.session && now - conn.accepted_at > options_.heartbeat_timeout)
        {
            MCPMUX_LOG_DEBUG("daemon", "closing connection #{}: no hello", ptr->id());
            expired.push_back(conn.transport);
        }
    }

    // destroy() re-enters on_closed(), which does the bookkeeping.
    for (auto& transport : expired)
        transport->destroy();
}

// ─── Idle shutdown ───────────────────────────────────────────────────────────

// Only established sessions hold the daemon open. Connections that never say
// hello (liveness checks, status polls) neither stop nor restart the timer.
void DaemonServer::arm_idle_timer()
{
    if (!running_ || idle_timer_ != 0 || !sessions_.empty())
        return;
    idle_timer_ = loop_.add_timer(options_.idle_timeout, [this]() { idle_timeout(); });
}

void DaemonServer::idle_timeout()
{
    idle_timer_ = 0;
    if (!running_ || !sessions_.empty())
        return;
    shutdown_self("idle timeout");
}

// ─── Routing ─────────────────────────────────────────────────────────────────

void DaemonServer::on_message(ipc::Transport& transport, const nlohmann::json& payload)
{
    Connection* conn = find(transport);
    if (!conn)
        return;

    if (!conn->session)
    {
        send_control(transport, ipc::ErrorPayload{"session not established"});
        return;
    }
    sessions_.touch(*conn->session);

    if (!payload.is_object())
    {
        send_control(transport, ipc::ErrorPayload{"batch messages are not supported"});
        return;
    }
    deliver(router_.from_session(*conn->session, payload));
}

void DaemonServer::on_backend_message(const nlohmann::json& message)
{
    deliver(router_.from_backend(message, sessions_.owner_id()));
}

void DaemonServer::on_backend_closed()
{
    MCPMUX_LOG_ERROR("daemon", "backend exited");
    backend_started_ = false;
    shutdown_self("backend exited");
}

void DaemonServer::deliver(Route route)
{
    switch (route.target)
    {
        case Route::Target::NONE:
            break;

        case Route::Target::BACKEND:
            backend_.send(route.message);
            break;

        case Route::Target::SESSION:
            if (const auto* s = sessions_.find(route.session))
                send_payload(*s->transport, route.message);
            break;

        case Route::Target::ALL_SESSIONS:
            for (const auto* s : sessions_.all())
                send_payload(*s->transport, route.message);
            break;
    }
}

void DaemonServer::send_control(ipc::Transport& transport, const ipc::Envelope& envelope)
{
    try
    {
        transport.send_control(envelope);
    }
    catch (const ipc::TransportError& e)
    {
        MCPMUX_LOG_DEBUG("daemon", "send to #{} failed: {}", transport.id(), e.what());
    }
}

void DaemonServer::send_payload(ipc::Transport& transport, const nlohmann::json& payload)
{
    try
    {
        transport.send(payload);
    }
    catch (const ipc::TransportError& e)
    {
        MCPMUX_LOG_DEBUG("daemon", "send to #{} failed: {}", transport.id(), e.what());
    }
}

// ─── Observers ───────────────────────────────────────────────────────────────

std::vector<ClientInfo> DaemonServer::client_info() const
{
    std::vector<ClientInfo> out;
    for (const auto* s : sessions_.all())
    {
        out.push_back(ClientInfo{s->id,
                                 s->client_id,
                                 s->connected_at_ms,
                                 s->last_seen_ms,
                                 sessions_.is_owner(s->id)});
    }
    return out;
}

}   // namespace mcpmux::daemon
