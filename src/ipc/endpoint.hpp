#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpmux::ipc
{

// ─── Endpoint ────────────────────────────────────────────────────────────────
// Either a filesystem path to a unix-domain socket or "tcp://host:port".

struct Endpoint
{
    enum class Kind : uint8_t
    {
        UNIX,
        TCP,
    };

    Kind        kind = Kind::UNIX;
    std::string path;   // UNIX
    std::string host;   // TCP
    uint16_t    port = 0;

    bool is_tcp() const { return kind == Kind::TCP; }

    // Canonical text form ("tcp://127.0.0.1:4000" or the socket path).
    std::string to_string() const;
};

inline bool is_tcp_endpoint(std::string_view text)
{
    return text.substr(0, 6) == "tcp://";
}

// Returns std::nullopt for an empty path or a malformed tcp:// endpoint.
std::optional<Endpoint> parse_endpoint(std::string_view text);

// ─── Socket helpers ──────────────────────────────────────────────────────────
// All descriptors are created non-blocking and close-on-exec. Functions that
// return an fd return -1 on failure with errno describing the cause.

bool set_nonblocking(int fd);

// Bind and listen. For TCP with port 0, `bound` receives the endpoint with the
// port the kernel picked. A unix socket file is made owner-only.
int listen_endpoint(const Endpoint& ep, std::string& bound, int backlog = 64);

// Start a non-blocking connect. `in_progress` is set when the connect has not
// completed yet (wait for writability, then check connect_result()).
int start_connect(const Endpoint& ep, bool& in_progress);

// SO_ERROR of a socket whose non-blocking connect became writable. 0 = connected.
int connect_result(int fd);

// Accept one pending connection from a non-blocking listener, or -1.
int accept_connection(int listen_fd);

// Probe: true if a connection to `endpoint` completes within `timeout`.
// Blocks the caller for at most `timeout`.
bool can_connect(const std::string& endpoint,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(300));

}   // namespace mcpmux::ipc
