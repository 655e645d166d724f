#include "stdio_backend.hpp"

#include <mcpmux/logger.hpp>

#include <stdexcept>

namespace mcpmux::daemon
{

StdioBackend::StdioBackend(std::vector<std::string> command) : command_(std::move(command)) {}

StdioBackend::~StdioBackend()
{
    stop();
}

void StdioBackend::start(ipc::EventLoop& loop, BackendSink& sink)
{
    if (channel_)
        throw std::logic_error("StdioBackend already started");
    if (command_.empty())
        throw std::runtime_error("No backend command given");

    auto child = processes_.spawn_piped(command_);
    if (!child)
        throw std::runtime_error("Failed to start backend: " + join_command(command_));

    sink_     = &sink;
    child_    = *child;
    channel_  = std::make_unique<ipc::LineChannel>(loop, child_.stdout_fd, child_.stdin_fd);
    channel_->start(*this);
}

void StdioBackend::send(const nlohmann::json& message)
{
    if (!running())
    {
        MCPMUX_LOG_DEBUG("backend", "backend not running, dropping message");
        return;
    }
    channel_->send(message);
}

void StdioBackend::stop()
{
    if (stopping_ || !channel_)
        return;
    stopping_ = true;

    channel_->close();
    if (child_.pid > 0)
        processes_.terminate(child_.pid);
    child_.pid = -1;
}

void StdioBackend::on_message(const nlohmann::json& message)
{
    if (sink_)
        sink_->on_backend_message(message);
}

void StdioBackend::on_closed()
{
    if (stopping_)
        return;

    MCPMUX_LOG_WARN("backend", "backend output closed ({})", join_command(command_));
    processes_.reap_finished();
    if (sink_)
        sink_->on_backend_closed();
}

}   // namespace mcpmux::daemon
