#pragma once

// Channel backed by vectors, standing in for the proxy's stdin/stdout.

#include "ipc/line_channel.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

namespace mcpmux::test
{

class MemoryChannel : public ipc::Channel
{
   public:
    std::vector<nlohmann::json> sent;
    int                         closed_calls = 0;

    void start(ipc::ChannelObserver& observer) override
    {
        if (observer_)
            throw std::logic_error("MemoryChannel already started");
        observer_ = &observer;
    }

    void send(const nlohmann::json& message) override
    {
        if (is_open())
            sent.push_back(message);
    }

    void close() override
    {
        if (closed_)
            return;
        closed_ = true;
        ++closed_calls;
        if (observer_)
            observer_->on_closed();
    }

    bool is_open() const override { return observer_ && !closed_; }
    bool started() const { return observer_ != nullptr; }

    // A line arrived on "stdin".
    void input(const nlohmann::json& message)
    {
        if (is_open())
            observer_->on_message(message);
    }

    // "stdin" reached end of file.
    void end_input() { close(); }

   private:
    ipc::ChannelObserver* observer_ = nullptr;
    bool                  closed_   = false;
};

}   // namespace mcpmux::test
