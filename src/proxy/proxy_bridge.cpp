#include "proxy_bridge.hpp"

#include "core/paths.hpp"

#include <mcpmux/logger.hpp>

#include <unistd.h>

namespace mcpmux::proxy
{

ProxyBridge::ProxyBridge(ipc::EventLoop&         loop,
                         ipc::Channel&           local,
                         daemon::DaemonRegistry& registry,
                         ProxyOptions            options)
    : loop_(loop),
      local_(local),
      registry_(registry),
      options_(std::move(options)),
      shared_secret_(options_.shared_secret)
{
}

ProxyBridge::~ProxyBridge()
{
    stop();
}

std::string ProxyBridge::make_client_id(const std::optional<std::string>& hint)
{
    std::optional<std::string> name = hint;
    if (!name || name->empty())
        name = env_value("MCPMUX_LAUNCHER");
    if (!name)
        name = env_value("MCP_CLIENT_NAME");
    if (!name)
        name = env_value("MCPMUX_AGENT");

    std::string pid = std::to_string(::getpid());
    return name ? *name + "-" + pid : "proxy-" + pid;
}

// ─── Endpoint resolution ─────────────────────────────────────────────────────

std::string ProxyBridge::resolve_endpoint()
{
    if (!options_.endpoint.empty())
        return options_.endpoint;

    if (auto entry = registry_.load_live(options_.config_hash))
    {
        if (!shared_secret_ && entry->shared_secret)
            shared_secret_ = entry->shared_secret;
        return entry->endpoint;
    }

    if (!options_.no_spawn)
    {
        if (!options_.spawn_daemon)
            throw ProxyError("No way to start a daemon");

        ++spawn_count_;
        MCPMUX_LOG_INFO("proxy", "no live daemon, starting one");
        try
        {
            options_.spawn_daemon(shared_secret_);
        }
        catch (const std::exception& e)
        {
            throw ProxyError(std::string("Failed to start daemon: ") + e.what());
        }
        return wait_for_daemon();
    }

    if (!options_.config_hash.empty())
        return registry_.default_endpoint(options_.config_hash);

    throw ProxyError("Daemon endpoint not available");
}

std::string ProxyBridge::wait_for_daemon()
{
    auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
    for (;;)
    {
        if (auto entry = registry_.load_live(options_.config_hash))
        {
            if (!shared_secret_ && entry->shared_secret)
                shared_secret_ = entry->shared_secret;
            return entry->endpoint;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        // Keep the loop turning while we wait.
        loop_.run_for(options_.poll_interval);
    }
    throw ProxyError("Timed out waiting for daemon to start");
}

// ─── Lifecycle ───────────────────────────────────────────────────────────────

void ProxyBridge::start()
{
    if (started_)
        throw std::logic_error("ProxyBridge already started");
    started_ = true;

    endpoint_ = resolve_endpoint();
    MCPMUX_LOG_DEBUG("proxy", "connecting to {}", endpoint_);

    daemon_ = std::make_unique<ipc::OutboundTransport>(
        loop_, endpoint_, static_cast<ipc::TransportObserver&>(*this));
    daemon_->start(options_.connect_timeout);

    ipc::HelloPayload hello;
    hello.client_id     = make_client_id(options_.launcher_hint);
    hello.shared_secret = shared_secret_;
    daemon_->send_control(hello);

    heartbeat_timer_ =
        loop_.add_timer(options_.heartbeat_interval, [this]() { send_heartbeat(); }, true);

    local_.start(*this);
}

void ProxyBridge::stop()
{
    if (stopped_)
        return;
    stopped_ = true;

    cancel_heartbeat();
    close_daemon(true);
    if (local_.is_open())
        local_.close();
}

void ProxyBridge::cancel_heartbeat()
{
    if (heartbeat_timer_ != 0)
    {
        loop_.cancel_timer(heartbeat_timer_);
        heartbeat_timer_ = 0;
    }
}

void ProxyBridge::send_heartbeat()
{
    // Nothing to say until the daemon assigned a session.
    if (!session_id_ || !daemon_ || !daemon_->is_open())
        return;
    try
    {
        daemon_->send_control(ipc::HeartbeatPayload{session_id_});
    }
    catch (const ipc::TransportError& e)
    {
        MCPMUX_LOG_DEBUG("proxy", "heartbeat failed: {}", e.what());
    }
}

void ProxyBridge::close_daemon(bool send_goodbye)
{
    if (daemon_closing_ || !daemon_)
        return;
    daemon_closing_ = true;

    if (send_goodbye && session_id_ && daemon_->is_open())
    {
        try
        {
            daemon_->send_control(ipc::GoodbyePayload{session_id_});
        }
        catch (const ipc::TransportError& e)
        {
            MCPMUX_LOG_DEBUG("proxy", "goodbye failed: {}", e.what());
        }
    }
    daemon_->close();
}

void ProxyBridge::check_finished()
{
    bool daemon_done = !daemon_ || daemon_closed_;
    if (finished_ || !daemon_done || !local_closed_)
        return;
    finished_ = true;
    if (options_.on_finished)
        options_.on_finished();
}

// ─── Daemon side ─────────────────────────────────────────────────────────────

void ProxyBridge::on_message(ipc::Transport& /*transport*/, const nlohmann::json& payload)
{
    local_.send(payload);
}

void ProxyBridge::on_control(ipc::Transport& /*transport*/, const ipc::Envelope& envelope)
{
    const auto level = options_.debug ? LogLevel::Info : LogLevel::Debug;

    if (const auto* ack = std::get_if<ipc::HelloAckPayload>(&envelope))
    {
        session_id_ = ack->session_id;
        is_owner_   = ack->is_owner;
        Logger::instance().log_formatted(level,
                                         "proxy",
                                         "session {} owner={}",
                                         ack->session_id,
                                         ack->is_owner);
    }
    else if (const auto* changed = std::get_if<ipc::OwnerChangedPayload>(&envelope))
    {
        is_owner_ = session_id_ && changed->owner_session_id == *session_id_;
        Logger::instance().log_formatted(level,
                                         "proxy",
                                         "owner changed: {} (isOwner={})",
                                         changed->owner_session_id,
                                         is_owner_);
    }
    else if (const auto* err = std::get_if<ipc::ErrorPayload>(&envelope))
    {
        MCPMUX_LOG_WARN("proxy", "daemon reported: {}", err->message);
        if (!session_id_ && !rejection_)
            rejection_ = err->message;
    }
}

void ProxyBridge::on_closed(ipc::Transport& /*transport*/)
{
    MCPMUX_LOG_DEBUG("proxy", "daemon connection closed");
    daemon_closed_  = true;
    daemon_closing_ = true;
    cancel_heartbeat();
    if (local_.is_open())
        local_.close();
    check_finished();
}

void ProxyBridge::on_error(ipc::Transport& /*transport*/, const std::string& message)
{
    MCPMUX_LOG_ERROR("proxy", "Daemon transport error: {}", message);
}

// ─── Local side ──────────────────────────────────────────────────────────────

void ProxyBridge::on_message(const nlohmann::json& message)
{
    if (!daemon_ || !daemon_->is_open())
        return;
    try
    {
        daemon_->send(message);
    }
    catch (const ipc::TransportError& e)
    {
        MCPMUX_LOG_DEBUG("proxy", "forward to daemon failed: {}", e.what());
    }
}

void ProxyBridge::on_closed()
{
    local_closed_ = true;
    cancel_heartbeat();
    close_daemon(true);
    check_finished();
}

}   // namespace mcpmux::proxy
