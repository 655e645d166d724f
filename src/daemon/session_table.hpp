#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../ipc/envelope.hpp"

namespace mcpmux::ipc
{
class Transport;
}

namespace mcpmux::daemon
{

// One client session that completed the hello handshake.
struct SessionEntry
{
    ipc::SessionId             id;
    std::optional<std::string> client_id;
    ipc::Transport*            transport = nullptr;

    int64_t connected_at_ms = 0;   // wall clock, for status output
    int64_t last_seen_ms    = 0;

    std::chrono::steady_clock::time_point last_heartbeat;
    uint64_t                              order = 0;   // join order, oldest first
};

struct SessionRemoval
{
    SessionEntry entry;
    bool         was_owner = false;

    // Set when ownership moved to a remaining session.
    std::optional<ipc::SessionId> new_owner;
};

// Session table of one daemon. Maintains the single-owner invariant: with at
// least one session there is exactly one owner, and when the owner leaves
// ownership passes to the oldest remaining session.
// Not thread-safe; owned and mutated by the daemon's loop only.
class SessionTable
{
   public:
    SessionTable() = default;

    // Register a session with a fresh id. The first session becomes owner.
    SessionEntry& add(ipc::Transport* transport, std::optional<std::string> client_id);

    std::optional<SessionRemoval> remove(const ipc::SessionId& id);

    // Record liveness for a session.
    void touch(const ipc::SessionId& id);

    // Ids of sessions whose last heartbeat is older than `timeout`, oldest first.
    std::vector<ipc::SessionId> stale(std::chrono::milliseconds timeout) const;

    SessionEntry*       find(const ipc::SessionId& id);
    const SessionEntry* find(const ipc::SessionId& id) const;

    const std::optional<ipc::SessionId>& owner_id() const { return owner_; }
    bool is_owner(const ipc::SessionId& id) const { return owner_ && *owner_ == id; }

    // All sessions, oldest first.
    std::vector<const SessionEntry*> all() const;

    size_t size() const { return sessions_.size(); }
    bool   empty() const { return sessions_.empty(); }

   private:
    const SessionEntry* oldest() const;

    std::unordered_map<ipc::SessionId, SessionEntry> sessions_;
    std::optional<ipc::SessionId>                    owner_;
    uint64_t                                         next_order_ = 1;
};

}   // namespace mcpmux::daemon
