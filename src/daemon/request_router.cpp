#include "request_router.hpp"

#include <mcpmux/logger.hpp>

#include <utility>

namespace mcpmux::daemon
{

namespace
{

bool has_method(const nlohmann::json& m)
{
    auto it = m.find("method");
    return it != m.end() && it->is_string();
}

bool has_id(const nlohmann::json& m)
{
    return m.contains("id");
}

std::optional<int64_t> as_key(const nlohmann::json& v)
{
    if (v.is_number_integer())
        return v.get<int64_t>();
    return std::nullopt;
}

// Pointer to params._meta.progressToken, or nullptr.
nlohmann::json* progress_token(nlohmann::json& message)
{
    auto params = message.find("params");
    if (params == message.end() || !params->is_object())
        return nullptr;
    auto meta = params->find("_meta");
    if (meta == params->end() || !meta->is_object())
        return nullptr;
    auto token = meta->find("progressToken");
    if (token == meta->end())
        return nullptr;
    return &*token;
}

}   // namespace

nlohmann::json RequestRouter::error_response(const nlohmann::json& id,
                                             int                   code,
                                             const std::string&    message)
{
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

// ─── Session -> backend ──────────────────────────────────────────────────────

Route RequestRouter::from_session(const ipc::SessionId& session, const nlohmann::json& message)
{
    if (!message.is_object())
        return Route::drop();

    if (has_method(message))
    {
        if (has_id(message))
            return session_request(session, message);
        return session_notification(session, message);
    }
    if (has_id(message))
        return session_response(session, message);
    return Route::drop();
}

Route RequestRouter::session_request(const ipc::SessionId& session, nlohmann::json message)
{
    const bool initialize = message["method"] == "initialize";
    if (initialize && initialize_result_)
    {
        MCPMUX_LOG_DEBUG("daemon", "answering initialize from {} with the cached result", session);
        nlohmann::json reply = {
            {"jsonrpc", "2.0"},
            {"id", message["id"]},
            {"result", *initialize_result_},
        };
        return Route{Route::Target::SESSION, session, std::move(reply)};
    }

    int64_t       n = next_id_++;
    ClientRequest req{session, message["id"], std::nullopt, initialize};

    if (auto* token = progress_token(message))
    {
        int64_t key       = next_id_++;
        progress_[key]    = Progress{session, *token};
        req.progress_key  = key;
        *token            = key;
    }

    message["id"]       = n;
    client_requests_[n] = std::move(req);
    return Route{Route::Target::BACKEND, {}, std::move(message)};
}

Route RequestRouter::session_notification(const ipc::SessionId& session, nlohmann::json message)
{
    if (message["method"] == "notifications/initialized")
    {
        if (initialized_sent_)
            return Route::drop();
        initialized_sent_ = true;
    }
    if (message["method"] == "notifications/cancelled")
    {
        auto params = message.find("params");
        if (params != message.end() && params->is_object() && params->contains("requestId"))
        {
            auto n = find_client_request(session, (*params)["requestId"]);
            if (!n)
            {
                MCPMUX_LOG_DEBUG("daemon", "dropping cancel for unknown request from {}", session);
                return Route::drop();
            }
            (*params)["requestId"] = *n;
        }
    }
    return Route{Route::Target::BACKEND, {}, std::move(message)};
}

Route RequestRouter::session_response(const ipc::SessionId& session, nlohmann::json message)
{
    auto key = as_key(message["id"]);
    if (!key)
        return Route::drop();

    auto it = backend_requests_.find(*key);
    if (it == backend_requests_.end() || it->second.session != session)
    {
        MCPMUX_LOG_DEBUG("daemon", "dropping unmatched response from {}", session);
        return Route::drop();
    }

    message["id"] = it->second.original_id;
    backend_requests_.erase(it);
    return Route{Route::Target::BACKEND, {}, std::move(message)};
}

std::optional<int64_t> RequestRouter::find_client_request(const ipc::SessionId& session,
                                                          const nlohmann::json& original_id) const
{
    for (const auto& [n, req] : client_requests_)
    {
        if (req.session == session && req.original_id == original_id)
            return n;
    }
    return std::nullopt;
}

// ─── Backend -> sessions ─────────────────────────────────────────────────────

Route RequestRouter::from_backend(const nlohmann::json&                message,
                                  const std::optional<ipc::SessionId>& owner)
{
    if (!message.is_object())
        return Route::drop();

    if (has_method(message))
    {
        if (has_id(message))
            return backend_request(message, owner);
        return backend_notification(message);
    }
    if (has_id(message))
        return backend_response(message);
    return Route::drop();
}

Route RequestRouter::backend_response(nlohmann::json message)
{
    auto key = as_key(message["id"]);
    auto it  = key ? client_requests_.find(*key) : client_requests_.end();
    if (it == client_requests_.end())
    {
        // Late response for a session that went away.
        MCPMUX_LOG_DEBUG("daemon", "discarding backend response with unknown id");
        return Route::drop();
    }

    ClientRequest req = std::move(it->second);
    client_requests_.erase(it);
    if (req.progress_key)
        progress_.erase(*req.progress_key);

    if (req.initialize && !initialize_result_)
    {
        auto result = message.find("result");
        if (result != message.end())
            initialize_result_ = *result;
    }

    message["id"] = req.original_id;
    return Route{Route::Target::SESSION, req.session, std::move(message)};
}

Route RequestRouter::backend_request(nlohmann::json                       message,
                                     const std::optional<ipc::SessionId>& owner)
{
    if (!owner)
    {
        return Route{Route::Target::BACKEND,
                     {},
                     error_response(message["id"],
                                    JSONRPC_INTERNAL_ERROR,
                                    "No client session available")};
    }

    int64_t m            = next_id_++;
    backend_requests_[m] = BackendRequest{*owner, message["id"]};
    message["id"]        = m;
    return Route{Route::Target::SESSION, *owner, std::move(message)};
}

Route RequestRouter::backend_notification(nlohmann::json message)
{
    const auto& method = message["method"];
    auto        params = message.find("params");
    bool        has_params = params != message.end() && params->is_object();

    if (method == "notifications/progress" && has_params && params->contains("progressToken"))
    {
        auto key = as_key((*params)["progressToken"]);
        auto it  = key ? progress_.find(*key) : progress_.end();
        if (it == progress_.end())
            return Route::drop();
        (*params)["progressToken"] = it->second.original_token;
        return Route{Route::Target::SESSION, it->second.session, std::move(message)};
    }

    if (method == "notifications/cancelled" && has_params && params->contains("requestId"))
    {
        const auto& original = (*params)["requestId"];
        for (auto it = backend_requests_.begin(); it != backend_requests_.end(); ++it)
        {
            if (it->second.original_id == original)
            {
                ipc::SessionId target = it->second.session;
                (*params)["requestId"] = it->first;
                backend_requests_.erase(it);
                return Route{Route::Target::SESSION, std::move(target), std::move(message)};
            }
        }
        return Route::drop();
    }

    return Route{Route::Target::ALL_SESSIONS, {}, std::move(message)};
}

// ─── Session teardown ────────────────────────────────────────────────────────

std::vector<nlohmann::json> RequestRouter::drop_session(const ipc::SessionId& session)
{
    for (auto it = client_requests_.begin(); it != client_requests_.end();)
    {
        if (it->second.session == session)
        {
            if (it->second.progress_key)
                progress_.erase(*it->second.progress_key);
            it = client_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    std::vector<nlohmann::json> replies;
    for (auto it = backend_requests_.begin(); it != backend_requests_.end();)
    {
        if (it->second.session == session)
        {
            replies.push_back(error_response(it->second.original_id,
                                             JSONRPC_INTERNAL_ERROR,
                                             "Client session closed"));
            it = backend_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return replies;
}

}   // namespace mcpmux::daemon
