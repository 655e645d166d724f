#include "transport.hpp"

#include "endpoint.hpp"

#include <mcpmux/logger.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <unistd.h>

namespace mcpmux::ipc
{

namespace
{
constexpr size_t READ_CHUNK       = 64 * 1024;
constexpr int    MAX_READS_PER_IO = 16;

std::atomic<uint64_t> g_next_transport_id{1};
}   // namespace

// ─── Transport ───────────────────────────────────────────────────────────────

Transport::Transport(EventLoop& loop, TransportObserver& observer)
    : loop_(loop), observer_(observer), id_(g_next_transport_id++)
{
}

Transport::~Transport()
{
    if (linger_timer_ != 0)
        loop_.cancel_timer(linger_timer_);
    if (watch_id_ != 0)
        loop_.remove(watch_id_);
    if (fd_ >= 0)
        ::close(fd_);
}

void Transport::attach(int fd, State initial)
{
    fd_       = fd;
    state_    = initial;
    watch_id_ = loop_.add(fd_,
                          initial == State::CONNECTING ? EventLoop::EVENT_WRITABLE
                                                       : EventLoop::EVENT_READABLE,
                          [this](uint32_t events) { on_io(events); });
}

void Transport::abandon()
{
    closed_notified_ = true;
    finish_close();
}

// ─── Sending ─────────────────────────────────────────────────────────────────

void Transport::send(const nlohmann::json& payload)
{
    write_frame(McpPayload{payload});
}

void Transport::send_control(const Envelope& envelope)
{
    if (!is_control(envelope))
        throw std::invalid_argument("Use send() for MCP messages");
    write_frame(envelope);
}

void Transport::write_frame(const Envelope& envelope)
{
    if (state_ != State::OPEN)
        throw TransportError("Transport socket not connected");

    if (out_pos_ == out_.size())
    {
        out_.clear();
        out_pos_ = 0;
    }
    encode_frame(envelope, out_);

    if (!flush())
    {
        // Report from the loop, never from inside the caller's send().
        ::shutdown(fd_, SHUT_RDWR);
        return;
    }
    update_interest();
}

bool Transport::flush()
{
    while (out_pos_ < out_.size())
    {
        ssize_t n = ::send(fd_, out_.data() + out_pos_, out_.size() - out_pos_, MSG_NOSIGNAL);
        if (n > 0)
        {
            out_pos_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return true;

        pending_error_ = std::string("write failed: ") + std::strerror(errno);
        out_.clear();
        out_pos_ = 0;
        return false;
    }

    out_.clear();
    out_pos_ = 0;
    if (state_ == State::CLOSING && !write_shut_)
    {
        ::shutdown(fd_, SHUT_WR);
        write_shut_ = true;
    }
    return true;
}

void Transport::update_interest()
{
    if (watch_id_ == 0)
        return;
    uint32_t events = EventLoop::EVENT_READABLE;
    if (pending_output() > 0)
        events |= EventLoop::EVENT_WRITABLE;
    loop_.update(watch_id_, events);
}

// ─── Closing ─────────────────────────────────────────────────────────────────

void Transport::close()
{
    if (state_ == State::CLOSED || state_ == State::CLOSING)
        return;

    if (state_ == State::CONNECTING)
    {
        finish_close();
        return;
    }

    state_ = State::CLOSING;
    if (pending_output() == 0)
    {
        ::shutdown(fd_, SHUT_WR);
        write_shut_ = true;
    }
    linger_timer_ = loop_.add_timer(CLOSE_LINGER,
                                    [this]()
                                    {
                                        linger_timer_ = 0;
                                        finish_close();
                                    });
}

void Transport::destroy()
{
    if (state_ == State::CLOSED)
        return;
    finish_close();
}

void Transport::fail(const std::string& message)
{
    MCPMUX_LOG_DEBUG("transport", "transport #{} error: {}", id_, message);
    if (!closed_notified_)
        observer_.on_error(*this, message);
    finish_close();
}

void Transport::finish_close()
{
    if (linger_timer_ != 0)
    {
        loop_.cancel_timer(linger_timer_);
        linger_timer_ = 0;
    }
    if (watch_id_ != 0)
    {
        loop_.remove(watch_id_);
        watch_id_ = 0;
    }
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    out_.clear();
    out_pos_ = 0;
    state_   = State::CLOSED;

    if (!closed_notified_)
    {
        closed_notified_ = true;
        observer_.on_closed(*this);
    }
}

// ─── I/O dispatch ────────────────────────────────────────────────────────────

void Transport::on_io(uint32_t events)
{
    if (state_ == State::CONNECTING)
    {
        handle_connected();
        return;
    }

    if (events & EventLoop::EVENT_WRITABLE)
    {
        if (!flush())
        {
            fail(pending_error_);
            return;
        }
        update_interest();
    }

    if (events & (EventLoop::EVENT_READABLE | EventLoop::EVENT_ERROR))
        handle_readable();
}

void Transport::handle_connected()
{
    int err = connect_result(fd_);
    if (err != 0)
    {
        connect_error_ = err;
        abandon();
        return;
    }
    state_ = State::OPEN;
    update_interest();
}

void Transport::handle_readable()
{
    uint8_t buf[READ_CHUNK];
    for (int i = 0; i < MAX_READS_PER_IO && state_ != State::CLOSED; ++i)
    {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return;
            fail(pending_error_.empty() ? std::string("read failed: ") + std::strerror(errno)
                                        : pending_error_);
            return;
        }
        if (n == 0)
        {
            if (!pending_error_.empty())
                fail(pending_error_);
            else
                finish_close();
            return;
        }

        auto envelopes = decoder_.push(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
        if (decoder_.failed())
        {
            fail("frame exceeds maximum size");
            return;
        }

        for (const auto& env : envelopes)
        {
            // Envelopes arriving after close() are dropped.
            if (state_ != State::OPEN)
                break;
            if (const auto* mcp = std::get_if<McpPayload>(&env))
                observer_.on_message(*this, mcp->message);
            else
                observer_.on_control(*this, env);
        }
    }
}

// ─── InboundTransport ────────────────────────────────────────────────────────

InboundTransport::InboundTransport(EventLoop& loop, int fd, TransportObserver& observer)
    : Transport(loop, observer)
{
    set_nonblocking(fd);
    attach(fd, State::OPEN);
}

// ─── OutboundTransport ───────────────────────────────────────────────────────

OutboundTransport::OutboundTransport(EventLoop&         loop,
                                     std::string        endpoint,
                                     TransportObserver& observer)
    : Transport(loop, observer), endpoint_(std::move(endpoint))
{
}

void OutboundTransport::start(std::chrono::milliseconds timeout)
{
    if (started_)
    {
        if (state_ == State::OPEN)
            return;
        throw TransportError("Transport already started");
    }
    started_ = true;

    auto ep = parse_endpoint(endpoint_);
    if (!ep)
        throw TransportError("Invalid endpoint: " + endpoint_);

    bool in_progress = false;
    int  fd          = start_connect(*ep, in_progress);
    if (fd < 0)
    {
        state_ = State::CLOSED;
        throw TransportError("Failed to connect to " + endpoint_ + ": " + std::strerror(errno));
    }

    attach(fd, in_progress ? State::CONNECTING : State::OPEN);
    if (state_ == State::OPEN)
        return;

    loop_.run_until([this]() { return state_ != State::CONNECTING; }, timeout);

    if (state_ == State::OPEN)
        return;

    if (state_ == State::CONNECTING)
    {
        abandon();
        throw TransportError("Connection timeout after " + std::to_string(timeout.count()) + "ms");
    }

    throw TransportError("Failed to connect to " + endpoint_ + ": "
                         + std::strerror(connect_error_ != 0 ? connect_error_ : ECONNREFUSED));
}

}   // namespace mcpmux::ipc
