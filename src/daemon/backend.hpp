#pragma once

#include "../ipc/event_loop.hpp"

#include <nlohmann/json.hpp>

namespace mcpmux::daemon
{

// Receives what the backend produces. Called on the loop thread.
class BackendSink
{
   public:
    virtual ~BackendSink() = default;

    // A JSON-RPC response, request or notification from the backend.
    virtual void on_backend_message(const nlohmann::json& message) = 0;

    // The backend went away on its own (not via stop()).
    virtual void on_backend_closed() = 0;
};

// The tool-serving process the daemon multiplexes. One per daemon.
class Backend
{
   public:
    virtual ~Backend() = default;

    // Begin serving. Throws std::runtime_error if the backend cannot start.
    virtual void start(ipc::EventLoop& loop, BackendSink& sink) = 0;

    // Deliver one JSON-RPC message. Dropped if the backend is not running.
    virtual void send(const nlohmann::json& message) = 0;

    // Shut down. Idempotent. No sink callbacks after this returns.
    virtual void stop() = 0;
};

}   // namespace mcpmux::daemon
