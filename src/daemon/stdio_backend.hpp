#pragma once

#include "backend.hpp"
#include "process_manager.hpp"
#include "../ipc/line_channel.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mcpmux::daemon
{

// Backend that runs one upstream MCP server command and speaks
// newline-delimited JSON-RPC with it over its stdin/stdout.
class StdioBackend : public Backend, private ipc::ChannelObserver
{
   public:
    explicit StdioBackend(std::vector<std::string> command);
    ~StdioBackend() override;

    void start(ipc::EventLoop& loop, BackendSink& sink) override;
    void send(const nlohmann::json& message) override;
    void stop() override;

    bool  running() const { return channel_ && channel_->is_open(); }
    pid_t pid() const { return child_.pid; }

   private:
    void on_message(const nlohmann::json& message) override;
    void on_closed() override;

    std::vector<std::string>          command_;
    ProcessManager                    processes_;
    PipedChild                        child_;
    std::unique_ptr<ipc::LineChannel> channel_;
    BackendSink*                      sink_     = nullptr;
    bool                              stopping_ = false;
};

}   // namespace mcpmux::daemon
