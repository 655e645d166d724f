#include "line_channel.hpp"

#include "endpoint.hpp"

#include <mcpmux/logger.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <unistd.h>

namespace mcpmux::ipc
{

LineChannel::LineChannel(EventLoop& loop, int in_fd, int out_fd, bool owns_fds)
    : loop_(loop), in_fd_(in_fd), out_fd_(out_fd), owns_fds_(owns_fds)
{
}

LineChannel::~LineChannel()
{
    if (read_watch_ != 0)
        loop_.remove(read_watch_);
    if (write_watch_ != 0)
        loop_.remove(write_watch_);
    if (owns_fds_)
    {
        if (in_fd_ >= 0)
            ::close(in_fd_);
        if (out_fd_ >= 0)
            ::close(out_fd_);
    }
}

void LineChannel::start(ChannelObserver& observer)
{
    if (started_)
        throw std::logic_error("LineChannel already started");
    started_  = true;
    observer_ = &observer;

    set_nonblocking(in_fd_);
    set_nonblocking(out_fd_);
    read_watch_ = loop_.add(in_fd_,
                            EventLoop::EVENT_READABLE,
                            [this](uint32_t events) { on_readable(events); });
}

// ─── Output ──────────────────────────────────────────────────────────────────

void LineChannel::send(const nlohmann::json& message)
{
    if (closed_ || out_fd_ < 0)
        return;

    std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    out_.insert(out_.end(), line.begin(), line.end());
    flush();
}

void LineChannel::flush()
{
    while (out_pos_ < out_.size())
    {
        ssize_t n = ::write(out_fd_, out_.data() + out_pos_, out_.size() - out_pos_);
        if (n > 0)
        {
            out_pos_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;

        MCPMUX_LOG_DEBUG("transport", "line channel write failed: {}", std::strerror(errno));
        out_.clear();
        out_pos_ = 0;
        break;
    }

    if (out_pos_ == out_.size())
    {
        out_.clear();
        out_pos_ = 0;
    }
    update_write_watch();
}

void LineChannel::update_write_watch()
{
    bool want = pending_output() > 0;
    if (want && write_watch_ == 0)
    {
        write_watch_ = loop_.add(out_fd_,
                                 EventLoop::EVENT_WRITABLE,
                                 [this](uint32_t events) { on_writable(events); });
    }
    else if (!want && write_watch_ != 0)
    {
        loop_.remove(write_watch_);
        write_watch_ = 0;
        if (closed_)
            finish_output();
    }
}

void LineChannel::on_writable(uint32_t events)
{
    if (events & EventLoop::EVENT_ERROR)
    {
        out_.clear();
        out_pos_ = 0;
    }
    flush();
}

void LineChannel::finish_output()
{
    if (owns_fds_ && out_fd_ >= 0)
    {
        ::close(out_fd_);
        out_fd_ = -1;
    }
}

// ─── Input ───────────────────────────────────────────────────────────────────

void LineChannel::on_readable(uint32_t /*events*/)
{
    char    buf[64 * 1024];
    ssize_t n = ::read(in_fd_, buf, sizeof(buf));
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            return;
        MCPMUX_LOG_DEBUG("transport", "line channel read failed: {}", std::strerror(errno));
        close();
        return;
    }
    if (n == 0)
    {
        // A trailing line without newline still counts.
        if (!in_buf_.empty())
        {
            std::string rest;
            rest.swap(in_buf_);
            handle_line(rest);
        }
        close();
        return;
    }

    in_buf_.append(buf, static_cast<size_t>(n));

    size_t start = 0;
    for (;;)
    {
        if (closed_)
            return;
        auto nl = in_buf_.find('\n', start);
        if (nl == std::string::npos)
            break;
        std::string line = in_buf_.substr(start, nl - start);
        start            = nl + 1;
        handle_line(line);
    }
    in_buf_.erase(0, start);

    if (in_buf_.size() > MAX_LINE)
    {
        MCPMUX_LOG_WARN("transport", "line exceeds {} bytes, closing channel", MAX_LINE);
        close();
    }
}

void LineChannel::handle_line(std::string_view line)
{
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    if (line.find_first_not_of(" \t") == std::string_view::npos)
        return;

    auto message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded())
    {
        MCPMUX_LOG_DEBUG("transport", "dropping non-JSON line ({} bytes)", line.size());
        return;
    }
    observer_->on_message(message);
}

// ─── Close ───────────────────────────────────────────────────────────────────

void LineChannel::close()
{
    if (closed_)
        return;
    closed_ = true;

    if (read_watch_ != 0)
    {
        loop_.remove(read_watch_);
        read_watch_ = 0;
    }
    if (owns_fds_ && in_fd_ >= 0)
    {
        ::close(in_fd_);
        in_fd_ = -1;
    }
    if (pending_output() == 0)
        finish_output();

    if (observer_)
        observer_->on_closed();
}

}   // namespace mcpmux::ipc
