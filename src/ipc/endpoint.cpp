#include "endpoint.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace mcpmux::ipc
{

// ─── Endpoint parsing ────────────────────────────────────────────────────────

std::string Endpoint::to_string() const
{
    if (kind == Kind::UNIX)
        return path;
    if (host.find(':') != std::string::npos)
        return "tcp://[" + host + "]:" + std::to_string(port);
    return "tcp://" + host + ":" + std::to_string(port);
}

std::optional<Endpoint> parse_endpoint(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    Endpoint ep;
    if (!is_tcp_endpoint(text))
    {
        ep.kind = Endpoint::Kind::UNIX;
        ep.path = std::string(text);
        return ep;
    }

    std::string_view rest = text.substr(6);
    if (!rest.empty() && rest.back() == '/')
        rest.remove_suffix(1);

    std::string_view host;
    std::string_view port;
    if (!rest.empty() && rest.front() == '[')
    {
        auto close = rest.find(']');
        if (close == std::string_view::npos || close + 1 >= rest.size() || rest[close + 1] != ':')
            return std::nullopt;
        host = rest.substr(1, close - 1);
        port = rest.substr(close + 2);
    }
    else
    {
        auto colon = rest.rfind(':');
        if (colon == std::string_view::npos)
            return std::nullopt;
        host = rest.substr(0, colon);
        port = rest.substr(colon + 1);
    }
    if (host.empty() || port.empty())
        return std::nullopt;

    unsigned value = 0;
    auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc() || end != port.data() + port.size() || value > 65535)
        return std::nullopt;

    ep.kind = Endpoint::Kind::TCP;
    ep.host = std::string(host);
    ep.port = static_cast<uint16_t>(value);
    return ep;
}

// ─── Socket helpers ──────────────────────────────────────────────────────────

bool set_nonblocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0)
        return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

namespace
{

int make_socket(int family)
{
    return ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
}

bool fill_unix_addr(const std::string& path, sockaddr_un& addr)
{
    addr            = sockaddr_un{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        return false;
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

// Resolves host:port. Numeric hosts never hit the resolver.
bool resolve_tcp(const Endpoint& ep, sockaddr_storage& out, socklen_t& out_len)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo*   result = nullptr;
    std::string port   = std::to_string(ep.port);
    if (::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &result) != 0 || !result)
    {
        errno = EHOSTUNREACH;
        return false;
    }
    std::memcpy(&out, result->ai_addr, result->ai_addrlen);
    out_len = static_cast<socklen_t>(result->ai_addrlen);
    ::freeaddrinfo(result);
    return true;
}

std::string format_bound(const sockaddr_storage& ss)
{
    char     host[INET6_ADDRSTRLEN] = {};
    uint16_t port                   = 0;
    Endpoint ep;
    ep.kind = Endpoint::Kind::TCP;
    if (ss.ss_family == AF_INET6)
    {
        const auto* a6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        ::inet_ntop(AF_INET6, &a6->sin6_addr, host, sizeof(host));
        port = ntohs(a6->sin6_port);
    }
    else
    {
        const auto* a4 = reinterpret_cast<const sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &a4->sin_addr, host, sizeof(host));
        port = ntohs(a4->sin_port);
    }
    ep.host = host;
    ep.port = port;
    return ep.to_string();
}

}   // namespace

int listen_endpoint(const Endpoint& ep, std::string& bound, int backlog)
{
    if (!ep.is_tcp())
    {
        sockaddr_un addr{};
        if (!fill_unix_addr(ep.path, addr))
            return -1;

        int fd = make_socket(AF_UNIX);
        if (fd < 0)
            return -1;

        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        {
            int saved = errno;
            ::close(fd);
            errno = saved;
            return -1;
        }

        ::chmod(ep.path.c_str(), 0600);

        if (::listen(fd, backlog) < 0)
        {
            int saved = errno;
            ::close(fd);
            ::unlink(ep.path.c_str());
            errno = saved;
            return -1;
        }
        bound = ep.path;
        return fd;
    }

    sockaddr_storage addr{};
    socklen_t        addr_len = 0;
    if (!resolve_tcp(ep, addr, addr_len))
        return -1;

    int fd = make_socket(addr.ss_family);
    if (fd < 0)
        return -1;

    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), addr_len) < 0
        || ::listen(fd, backlog) < 0)
    {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }

    sockaddr_storage actual{};
    socklen_t        actual_len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &actual_len) == 0)
        bound = format_bound(actual);
    else
        bound = ep.to_string();
    return fd;
}

int start_connect(const Endpoint& ep, bool& in_progress)
{
    in_progress = false;

    sockaddr_storage addr{};
    socklen_t        addr_len = 0;
    int              family   = AF_UNIX;

    if (ep.is_tcp())
    {
        if (!resolve_tcp(ep, addr, addr_len))
            return -1;
        family = addr.ss_family;
    }
    else
    {
        sockaddr_un un{};
        if (!fill_unix_addr(ep.path, un))
            return -1;
        std::memcpy(&addr, &un, sizeof(un));
        addr_len = sizeof(un);
    }

    int fd = make_socket(family);
    if (fd < 0)
        return -1;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), addr_len) == 0)
        return fd;

    if (errno == EINPROGRESS)
    {
        in_progress = true;
        return fd;
    }

    int saved = errno;
    ::close(fd);
    errno = saved;
    return -1;
}

int connect_result(int fd)
{
    int       err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
        return errno;
    return err;
}

int accept_connection(int listen_fd)
{
    return ::accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
}

bool can_connect(const std::string& endpoint, std::chrono::milliseconds timeout)
{
    auto ep = parse_endpoint(endpoint);
    if (!ep)
        return false;

    bool in_progress = false;
    int  fd          = start_connect(*ep, in_progress);
    if (fd < 0)
        return false;

    bool ok = !in_progress;
    if (in_progress)
    {
        pollfd pfd{fd, POLLOUT, 0};
        int    ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        ok           = ready > 0 && connect_result(fd) == 0;
    }
    ::close(fd);
    return ok;
}

}   // namespace mcpmux::ipc
