#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcpmux::ipc
{

// ─── IPC ID types ────────────────────────────────────────────────────────────
using SessionId = std::string;

// ─── Envelope types ──────────────────────────────────────────────────────────
// Order matches the alternatives of `Envelope` below.
enum class EnvelopeType : uint8_t
{
    MCP           = 0,
    HELLO         = 1,
    HELLO_ACK     = 2,
    HEARTBEAT     = 3,
    OWNER_CHANGED = 4,
    GOODBYE       = 5,
    ERROR         = 6,
};

// ─── Frame layout ────────────────────────────────────────────────────────────
// Wire format: [length (uint32_t BE)] [UTF-8 JSON envelope (length bytes)]
//
// The JSON object carries a "type" discriminator:
//   {"type":"mcp","payload":{...}}
//   {"type":"hello","clientId":"...","sharedSecret":"..."}
//   {"type":"helloAck","sessionId":"...","isOwner":true}
//   {"type":"heartbeat","sessionId":"..."}
//   {"type":"ownerChanged","ownerSessionId":"..."}
//   {"type":"goodbye","sessionId":"..."}
//   {"type":"error","message":"..."}

static constexpr size_t FRAME_HEADER_SIZE = 4;
static constexpr size_t MAX_FRAME_SIZE    = 16 * 1024 * 1024;   // 16 MiB

// ─── Payloads ────────────────────────────────────────────────────────────────

// Opaque JSON-RPC message. Never inspected by the transport layer.
struct McpPayload
{
    nlohmann::json message;

    bool operator==(const McpPayload&) const = default;
};

struct HelloPayload
{
    std::optional<std::string> client_id;
    std::optional<std::string> shared_secret;

    bool operator==(const HelloPayload&) const = default;
};

struct HelloAckPayload
{
    SessionId session_id;
    bool      is_owner = false;

    bool operator==(const HelloAckPayload&) const = default;
};

struct HeartbeatPayload
{
    std::optional<SessionId> session_id;

    bool operator==(const HeartbeatPayload&) const = default;
};

struct OwnerChangedPayload
{
    SessionId owner_session_id;

    bool operator==(const OwnerChangedPayload&) const = default;
};

struct GoodbyePayload
{
    std::optional<SessionId> session_id;

    bool operator==(const GoodbyePayload&) const = default;
};

struct ErrorPayload
{
    std::string message;

    bool operator==(const ErrorPayload&) const = default;
};

// One discriminated-union message unit exchanged over a framed socket.
using Envelope = std::variant<McpPayload,
                              HelloPayload,
                              HelloAckPayload,
                              HeartbeatPayload,
                              OwnerChangedPayload,
                              GoodbyePayload,
                              ErrorPayload>;

inline EnvelopeType envelope_type(const Envelope& env)
{
    return static_cast<EnvelopeType>(env.index());
}

inline bool is_control(const Envelope& env)
{
    return envelope_type(env) != EnvelopeType::MCP;
}

// Wire name of an envelope type ("mcp", "hello", "helloAck", ...).
std::string_view envelope_type_name(EnvelopeType type);

// Inverse of envelope_type_name(). Returns std::nullopt for unknown names.
std::optional<EnvelopeType> parse_envelope_type(std::string_view name);

}   // namespace mcpmux::ipc
