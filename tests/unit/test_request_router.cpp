#include <gtest/gtest.h>

#include "daemon/request_router.hpp"

#include <set>

using namespace mcpmux::daemon;
using nlohmann::json;

namespace
{

json request(const json& id, const std::string& method, json params = json::object())
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

json result(const json& id, json value = json::object())
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(value)}};
}

json notification(const std::string& method, json params = json::object())
{
    return {{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Client requests
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RequestRouter, SameClientIdsFromTwoSessionsStayApart)
{
    RequestRouter r;

    auto ra = r.from_session("A", request(1, "tools/call"));
    auto rb = r.from_session("B", request(1, "tools/call"));
    ASSERT_EQ(ra.target, Route::Target::BACKEND);
    ASSERT_EQ(rb.target, Route::Target::BACKEND);
    EXPECT_NE(ra.message["id"], rb.message["id"]);
    EXPECT_EQ(r.pending_client_requests(), 2u);

    // Answer B first.
    auto back_b = r.from_backend(result(rb.message["id"], {{"who", "b"}}), "A");
    ASSERT_EQ(back_b.target, Route::Target::SESSION);
    EXPECT_EQ(back_b.session, "B");
    EXPECT_EQ(back_b.message["id"], 1);
    EXPECT_EQ(back_b.message["result"]["who"], "b");

    auto back_a = r.from_backend(result(ra.message["id"]), "A");
    EXPECT_EQ(back_a.session, "A");
    EXPECT_EQ(back_a.message["id"], 1);
    EXPECT_EQ(r.pending_client_requests(), 0u);
}

TEST(RequestRouter, StringIdsRestoredVerbatim)
{
    RequestRouter r;
    auto          out = r.from_session("A", request("req-7", "ping"));
    EXPECT_TRUE(out.message["id"].is_number_integer());

    auto back = r.from_backend(result(out.message["id"]), std::nullopt);
    EXPECT_EQ(back.message["id"], "req-7");
}

TEST(RequestRouter, BackendIdsUniqueAcrossSessions)
{
    RequestRouter r;
    std::set<int64_t> ids;
    for (int i = 0; i < 100; ++i)
    {
        auto out = r.from_session(i % 2 ? "A" : "B", request(i / 2, "x"));
        ids.insert(out.message["id"].get<int64_t>());
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(RequestRouter, UnknownBackendResponseDropped)
{
    RequestRouter r;
    EXPECT_EQ(r.from_backend(result(999), "A").target, Route::Target::NONE);
    EXPECT_EQ(r.from_backend(result("abc"), "A").target, Route::Target::NONE);
}

TEST(RequestRouter, ClientNotificationPassesThrough)
{
    RequestRouter r;
    auto          n   = notification("notifications/initialized");
    auto          out = r.from_session("A", n);
    EXPECT_EQ(out.target, Route::Target::BACKEND);
    EXPECT_EQ(out.message, n);
}

TEST(RequestRouter, NonObjectsDropped)
{
    RequestRouter r;
    EXPECT_EQ(r.from_session("A", json::array()).target, Route::Target::NONE);
    EXPECT_EQ(r.from_backend(json("x"), "A").target, Route::Target::NONE);
    EXPECT_EQ(r.from_session("A", json{{"jsonrpc", "2.0"}}).target, Route::Target::NONE);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Cancellation and progress
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RequestRouter, ClientCancelTranslated)
{
    RequestRouter r;
    auto          out = r.from_session("A", request(5, "tools/call"));
    auto cancel = r.from_session("A", notification("notifications/cancelled", {{"requestId", 5}}));
    ASSERT_EQ(cancel.target, Route::Target::BACKEND);
    EXPECT_EQ(cancel.message["params"]["requestId"], out.message["id"]);

    // Another session cannot cancel A's request.
    auto foreign = r.from_session("B", notification("notifications/cancelled", {{"requestId", 5}}));
    EXPECT_EQ(foreign.target, Route::Target::NONE);
}

TEST(RequestRouter, ProgressTokenRoutedToIssuingSession)
{
    RequestRouter r;
    auto out = r.from_session("A", request(1, "tools/call", {{"_meta", {{"progressToken", "tok"}}}}));
    auto key = out.message["params"]["_meta"]["progressToken"];
    EXPECT_TRUE(key.is_number_integer());

    auto progress = r.from_backend(
        notification("notifications/progress", {{"progressToken", key}, {"progress", 50}}), "B");
    ASSERT_EQ(progress.target, Route::Target::SESSION);
    EXPECT_EQ(progress.session, "A");
    EXPECT_EQ(progress.message["params"]["progressToken"], "tok");

    // After the response the token is forgotten.
    r.from_backend(result(out.message["id"]), "B");
    auto late = r.from_backend(
        notification("notifications/progress", {{"progressToken", key}, {"progress", 99}}), "B");
    EXPECT_EQ(late.target, Route::Target::NONE);
}

TEST(RequestRouter, OtherBackendNotificationsBroadcast)
{
    RequestRouter r;
    auto          out = r.from_backend(notification("notifications/tools/list_changed"), "A");
    EXPECT_EQ(out.target, Route::Target::ALL_SESSIONS);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Backend-initiated requests
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RequestRouter, BackendRequestGoesToOwnerAndBack)
{
    RequestRouter r;
    auto          out = r.from_backend(request("srv-1", "sampling/createMessage"), "OWNER");
    ASSERT_EQ(out.target, Route::Target::SESSION);
    EXPECT_EQ(out.session, "OWNER");
    EXPECT_EQ(r.pending_backend_requests(), 1u);

    // A different session cannot answer it.
    EXPECT_EQ(r.from_session("OTHER", result(out.message["id"])).target, Route::Target::NONE);

    auto reply = r.from_session("OWNER", result(out.message["id"], {{"ok", true}}));
    ASSERT_EQ(reply.target, Route::Target::BACKEND);
    EXPECT_EQ(reply.message["id"], "srv-1");
    EXPECT_EQ(r.pending_backend_requests(), 0u);
}

TEST(RequestRouter, BackendRequestWithoutOwnerAnsweredWithError)
{
    RequestRouter r;
    auto          out = r.from_backend(request(3, "roots/list"), std::nullopt);
    ASSERT_EQ(out.target, Route::Target::BACKEND);
    EXPECT_EQ(out.message["id"], 3);
    EXPECT_EQ(out.message["error"]["code"], JSONRPC_INTERNAL_ERROR);
}

TEST(RequestRouter, BackendCancelReachesOwner)
{
    RequestRouter r;
    auto          out = r.from_backend(request(11, "sampling/createMessage"), "OWNER");
    auto cancel = r.from_backend(notification("notifications/cancelled", {{"requestId", 11}}), "OWNER");
    ASSERT_EQ(cancel.target, Route::Target::SESSION);
    EXPECT_EQ(cancel.session, "OWNER");
    EXPECT_EQ(cancel.message["params"]["requestId"], out.message["id"]);
}

TEST(RequestRouter, DropSessionFailsItsBackendRequests)
{
    RequestRouter r;
    r.from_session("A", request(1, "tools/call"));
    r.from_backend(request("q", "roots/list"), "A");
    r.from_backend(request("z", "roots/list"), "B");

    auto replies = r.drop_session("A");
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0]["id"], "q");
    EXPECT_EQ(replies[0]["error"]["code"], JSONRPC_INTERNAL_ERROR);
    EXPECT_EQ(r.pending_client_requests(), 0u);
    EXPECT_EQ(r.pending_backend_requests(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RequestRouter, LaterInitializeAnsweredFromFirstResult)
{
    RequestRouter r;
    json          caps = {{"protocolVersion", "2025-03-26"}, {"capabilities", {{"tools", json::object()}}}};

    auto first = r.from_session("A", request(0, "initialize"));
    ASSERT_EQ(first.target, Route::Target::BACKEND);
    EXPECT_FALSE(r.initialize_result().has_value());

    auto back = r.from_backend(result(first.message["id"], caps), "A");
    EXPECT_EQ(back.session, "A");
    ASSERT_TRUE(r.initialize_result().has_value());

    auto second = r.from_session("B", request("init-b", "initialize"));
    ASSERT_EQ(second.target, Route::Target::SESSION);
    EXPECT_EQ(second.session, "B");
    EXPECT_EQ(second.message["id"], "init-b");
    EXPECT_EQ(second.message["result"], caps);
    EXPECT_EQ(r.pending_client_requests(), 0u);
}

TEST(RequestRouter, FailedInitializeNotCached)
{
    RequestRouter r;
    auto          first = r.from_session("A", request(1, "initialize"));
    r.from_backend(RequestRouter::error_response(first.message["id"], -32602, "bad version"), "A");
    EXPECT_FALSE(r.initialize_result().has_value());

    auto retry = r.from_session("B", request(1, "initialize"));
    EXPECT_EQ(retry.target, Route::Target::BACKEND);
}

TEST(RequestRouter, OnlyFirstInitializedNotificationForwarded)
{
    RequestRouter r;
    auto          n = notification("notifications/initialized");
    EXPECT_EQ(r.from_session("A", n).target, Route::Target::BACKEND);
    EXPECT_EQ(r.from_session("B", n).target, Route::Target::NONE);
    EXPECT_EQ(r.from_session("A", n).target, Route::Target::NONE);
    EXPECT_EQ(r.from_session("B", notification("notifications/roots/list_changed")).target,
              Route::Target::BACKEND);
}
