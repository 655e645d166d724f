#include "session_table.hpp"

#include "core/uuid.hpp"
#include "registry.hpp"

#include <algorithm>

namespace mcpmux::daemon
{

SessionEntry& SessionTable::add(ipc::Transport* transport, std::optional<std::string> client_id)
{
    SessionEntry entry;
    entry.id              = random_uuid();
    entry.client_id       = std::move(client_id);
    entry.transport       = transport;
    entry.connected_at_ms = now_ms();
    entry.last_seen_ms    = entry.connected_at_ms;
    entry.last_heartbeat  = std::chrono::steady_clock::now();
    entry.order           = next_order_++;

    auto id     = entry.id;
    auto [it, inserted] = sessions_.emplace(id, std::move(entry));
    (void)inserted;

    if (!owner_)
        owner_ = id;
    return it->second;
}

std::optional<SessionRemoval> SessionTable::remove(const ipc::SessionId& id)
{
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return std::nullopt;

    SessionRemoval removal;
    removal.entry     = std::move(it->second);
    removal.was_owner = is_owner(id);
    sessions_.erase(it);

    if (removal.was_owner)
    {
        owner_.reset();
        if (const auto* next = oldest())
        {
            owner_            = next->id;
            removal.new_owner = next->id;
        }
    }
    return removal;
}

void SessionTable::touch(const ipc::SessionId& id)
{
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return;
    it->second.last_heartbeat = std::chrono::steady_clock::now();
    it->second.last_seen_ms   = now_ms();
}

std::vector<ipc::SessionId> SessionTable::stale(std::chrono::milliseconds timeout) const
{
    auto now = std::chrono::steady_clock::now();
    std::vector<ipc::SessionId> result;
    for (const auto* s : all())
    {
        if ((now - s->last_heartbeat) > timeout)
            result.push_back(s->id);
    }
    return result;
}

SessionEntry* SessionTable::find(const ipc::SessionId& id)
{
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : &it->second;
}

const SessionEntry* SessionTable::find(const ipc::SessionId& id) const
{
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : &it->second;
}

std::vector<const SessionEntry*> SessionTable::all() const
{
    std::vector<const SessionEntry*> result;
    result.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_)
        result.push_back(&s);
    std::sort(result.begin(),
              result.end(),
              [](const SessionEntry* a, const SessionEntry* b) { return a->order < b->order; });
    return result;
}

const SessionEntry* SessionTable::oldest() const
{
    const SessionEntry* best = nullptr;
    for (const auto& [id, s] : sessions_)
    {
        if (!best || s.order < best->order)
            best = &s;
    }
    return best;
}

}   // namespace mcpmux::daemon
