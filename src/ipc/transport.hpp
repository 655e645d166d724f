#pragma once

#include "codec.hpp"
#include "envelope.hpp"
#include "event_loop.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpmux::ipc
{

class TransportError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

class Transport;

// ─── TransportObserver ───────────────────────────────────────────────────────
// Bound once, at transport construction. on_closed() fires exactly once per
// transport that reached the open state; on_error() precedes it when the
// close was caused by a socket error.

class TransportObserver
{
   public:
    virtual ~TransportObserver() = default;

    // An `mcp` envelope arrived. `payload` is the opaque JSON-RPC message.
    virtual void on_message(Transport& transport, const nlohmann::json& payload) = 0;

    // Any non-`mcp` envelope arrived.
    virtual void on_control(Transport& transport, const Envelope& envelope) = 0;

    virtual void on_closed(Transport& transport) = 0;

    virtual void on_error(Transport& /*transport*/, const std::string& /*message*/) {}
};

// ─── Transport ───────────────────────────────────────────────────────────────
// Framed, bidirectional, non-blocking socket channel driven by an EventLoop.
// Writes are buffered and flushed when the socket becomes writable.

class Transport
{
   public:
    enum class State : uint8_t
    {
        CONNECTING,
        OPEN,
        CLOSING,   // write side shut down, waiting for the peer
        CLOSED,
    };

    static constexpr std::chrono::milliseconds CLOSE_LINGER{1000};

    virtual ~Transport();

    Transport(const Transport&)            = delete;
    Transport& operator=(const Transport&) = delete;

    // Send a JSON-RPC payload wrapped in an `mcp` envelope.
    // Throws TransportError if the transport is not open.
    void send(const nlohmann::json& payload);

    // Send a control envelope. Throws std::invalid_argument for `mcp`
    // envelopes and TransportError if the transport is not open.
    void send_control(const Envelope& envelope);

    // Graceful close: flush pending output, shut down the write half, and
    // finish when the peer closes or after CLOSE_LINGER.
    void close();

    // Immediate close. Pending output is discarded.
    void destroy();

    State  state() const { return state_; }
    bool   is_open() const { return state_ == State::OPEN; }
    bool   is_closed() const { return state_ == State::CLOSED; }
    int    fd() const { return fd_; }
    size_t pending_output() const { return out_.size() - out_pos_; }

    // Process-unique number, for logs.
    uint64_t id() const { return id_; }

   protected:
    Transport(EventLoop& loop, TransportObserver& observer);

    // Take ownership of `fd` and start watching it.
    void attach(int fd, State initial);

    // Tear down without notifying the observer (failed connect).
    void abandon();

    EventLoop&         loop_;
    TransportObserver& observer_;
    State              state_ = State::CONNECTING;
    int                connect_error_ = 0;

   private:
    void write_frame(const Envelope& envelope);
    void on_io(uint32_t events);
    void handle_connected();
    void handle_readable();
    bool flush();   // false on a hard write error
    void update_interest();
    void fail(const std::string& message);
    void finish_close();

    int                  fd_       = -1;
    EventLoop::WatchId   watch_id_ = 0;
    EventLoop::TimerId   linger_timer_ = 0;
    FrameDecoder         decoder_;
    std::vector<uint8_t> out_;
    size_t               out_pos_         = 0;
    bool                 write_shut_      = false;
    bool                 closed_notified_ = false;
    std::string          pending_error_;
    uint64_t             id_ = 0;
};

// ─── InboundTransport ────────────────────────────────────────────────────────
// Wraps a socket accepted by a listener. Open from construction.

class InboundTransport : public Transport
{
   public:
    InboundTransport(EventLoop& loop, int fd, TransportObserver& observer);
};

// ─── OutboundTransport ───────────────────────────────────────────────────────
// Client-initiated connection to a unix path or tcp://host:port.

class OutboundTransport : public Transport
{
   public:
    static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{5000};

    OutboundTransport(EventLoop& loop, std::string endpoint, TransportObserver& observer);

    // Connect, running the loop while the connect is in flight. Throws
    // TransportError on an invalid endpoint, a refused connection, or
    // "Connection timeout after <N>ms".
    void start(std::chrono::milliseconds timeout = DEFAULT_CONNECT_TIMEOUT);

    const std::string& endpoint() const { return endpoint_; }

   private:
    std::string endpoint_;
    bool        started_ = false;
};

}   // namespace mcpmux::ipc
