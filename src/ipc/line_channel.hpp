#pragma once

#include "event_loop.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mcpmux::ipc
{

// ─── Channel ─────────────────────────────────────────────────────────────────
// A local, unframed JSON-RPC channel (the proxy's client-facing side).

class ChannelObserver
{
   public:
    virtual ~ChannelObserver() = default;

    virtual void on_message(const nlohmann::json& message) = 0;

    // Fires exactly once: on end of input, on a read error, or on close().
    virtual void on_closed() = 0;
};

class Channel
{
   public:
    virtual ~Channel() = default;

    // Register the observer and begin reading. A second call throws
    // std::logic_error.
    virtual void start(ChannelObserver& observer) = 0;

    // Queue one message. Messages sent on a closed channel are discarded.
    virtual void send(const nlohmann::json& message) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

// ─── LineChannel ─────────────────────────────────────────────────────────────
// Newline-delimited JSON over a pair of descriptors (stdin/stdout, or the
// pipes of a child process). Blank lines are skipped; lines that are not
// valid JSON are logged and dropped.

class LineChannel : public Channel
{
   public:
    static constexpr size_t MAX_LINE = 16 * 1024 * 1024;

    // With `owns_fds` the descriptors are closed when the channel closes.
    LineChannel(EventLoop& loop, int in_fd, int out_fd, bool owns_fds = true);
    ~LineChannel() override;

    LineChannel(const LineChannel&)            = delete;
    LineChannel& operator=(const LineChannel&) = delete;

    void start(ChannelObserver& observer) override;
    void send(const nlohmann::json& message) override;

    // Stops reading and notifies the observer. Queued output keeps draining
    // in the background until written.
    void close() override;

    bool is_open() const override { return started_ && !closed_; }

    size_t pending_output() const { return out_.size() - out_pos_; }

   private:
    void on_readable(uint32_t events);
    void on_writable(uint32_t events);
    void flush();
    void update_write_watch();
    void finish_output();
    void handle_line(std::string_view line);

    EventLoop&       loop_;
    int              in_fd_;
    int              out_fd_;
    bool             owns_fds_;
    ChannelObserver* observer_ = nullptr;
    bool             started_  = false;
    bool             closed_   = false;

    EventLoop::WatchId read_watch_  = 0;
    EventLoop::WatchId write_watch_ = 0;

    std::string          in_buf_;
    std::vector<uint8_t> out_;
    size_t               out_pos_ = 0;
};

}   // namespace mcpmux::ipc
