#pragma once

#include "../ipc/envelope.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpmux::daemon
{

// JSON-RPC error code used for requests the daemon cannot route.
static constexpr int JSONRPC_INTERNAL_ERROR = -32603;

// Where a message should go after remapping.
struct Route
{
    enum class Target : uint8_t
    {
        NONE,           // drop
        BACKEND,
        SESSION,
        ALL_SESSIONS,
    };

    Target         target = Target::NONE;
    ipc::SessionId session;   // Target::SESSION
    nlohmann::json message;

    static Route drop() { return Route{}; }
};

// ─── RequestRouter ───────────────────────────────────────────────────────────
// Rewrites JSON-RPC ids so many sessions can share one backend:
//
//  - a session request {id: X} goes to the backend as {id: N} with N unique
//    in this daemon; the response for N returns to that session as X
//  - notifications/cancelled and _meta.progressToken are translated the same
//    way so they stay with the session that issued the request
//  - a backend request {id: Y} goes to the owner session as {id: M}; the
//    owner's answer returns to the backend as Y
//  - other backend notifications go to every session
//  - the backend is initialized once: after the first successful initialize,
//    later sessions get that result back under their own id, and only the
//    first notifications/initialized is forwarded
//
// Not thread-safe; owned by the daemon's loop.
class RequestRouter
{
   public:
    RequestRouter() = default;

    Route from_session(const ipc::SessionId& session, const nlohmann::json& message);

    // `owner` receives backend-initiated requests. Without one the request is
    // answered to the backend with JSONRPC_INTERNAL_ERROR.
    Route from_backend(const nlohmann::json& message, const std::optional<ipc::SessionId>& owner);

    // Forget a session. Returns error responses for backend requests that
    // were waiting on it; the caller sends them to the backend.
    std::vector<nlohmann::json> drop_session(const ipc::SessionId& session);

    size_t pending_client_requests() const { return client_requests_.size(); }
    size_t pending_backend_requests() const { return backend_requests_.size(); }

    // Result of the first successful initialize, once the backend sent it.
    const std::optional<nlohmann::json>& initialize_result() const { return initialize_result_; }

    static nlohmann::json error_response(const nlohmann::json& id,
                                         int                   code,
                                         const std::string&    message);

   private:
    struct ClientRequest
    {
        ipc::SessionId                session;
        nlohmann::json                original_id;
        std::optional<int64_t>        progress_key;
        bool                          initialize = false;
    };

    struct Progress
    {
        ipc::SessionId session;
        nlohmann::json original_token;
    };

    struct BackendRequest
    {
        ipc::SessionId session;
        nlohmann::json original_id;
    };

    Route session_request(const ipc::SessionId& session, nlohmann::json message);
    Route session_notification(const ipc::SessionId& session, nlohmann::json message);
    Route session_response(const ipc::SessionId& session, nlohmann::json message);

    Route backend_response(nlohmann::json message);
    Route backend_request(nlohmann::json message, const std::optional<ipc::SessionId>& owner);
    Route backend_notification(nlohmann::json message);

    std::optional<int64_t> find_client_request(const ipc::SessionId& session,
                                               const nlohmann::json& original_id) const;

    int64_t next_id_ = 1;

    std::optional<nlohmann::json> initialize_result_;
    bool                          initialized_sent_ = false;

    std::map<int64_t, ClientRequest>  client_requests_;
    std::map<int64_t, Progress>       progress_;
    std::map<int64_t, BackendRequest> backend_requests_;
};

}   // namespace mcpmux::daemon
