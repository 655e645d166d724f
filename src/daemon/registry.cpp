#include "registry.hpp"

#include "core/paths.hpp"
#include "ipc/endpoint.hpp"

#include <mcpmux/logger.hpp>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mcpmux::daemon
{

// ─── RegistryEntry ───────────────────────────────────────────────────────────

nlohmann::json RegistryEntry::to_json() const
{
    nlohmann::json j = {
        {"daemonId", daemon_id},
        {"endpoint", endpoint},
        {"pid", pid},
        {"startedAt", started_at},
    };
    if (version)
        j["version"] = *version;
    if (config_hash)
        j["configHash"] = *config_hash;
    if (shared_secret)
        j["sharedSecret"] = *shared_secret;
    return j;
}

namespace
{
bool optional_string(const nlohmann::json& j, const char* key, std::optional<std::string>& out)
{
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

// Integral JSON number within [lo, hi]. Floats and out-of-range values fail.
bool integer_in_range(const nlohmann::json& v, int64_t lo, int64_t hi, int64_t& out)
{
    if (v.is_number_unsigned())
    {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(hi))
            return false;
        out = static_cast<int64_t>(u);
    }
    else if (v.is_number_integer())
        out = v.get<int64_t>();
    else
        return false;
    return out >= lo && out <= hi;
}
}   // namespace

std::optional<RegistryEntry> RegistryEntry::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        return std::nullopt;

    auto id  = j.find("daemonId");
    auto ep  = j.find("endpoint");
    auto pid = j.find("pid");
    auto ts  = j.find("startedAt");
    if (id == j.end() || !id->is_string() || ep == j.end() || !ep->is_string()
        || pid == j.end() || !pid->is_number() || ts == j.end() || !ts->is_number())
        return std::nullopt;

    RegistryEntry e;
    e.daemon_id  = id->get<std::string>();
    e.endpoint   = ep->get<std::string>();
    if (!integer_in_range(*pid, 1, std::numeric_limits<pid_t>::max(), e.pid))
        return std::nullopt;
    if (ts->is_number_float())
    {
        // Timestamps written by other tools may be floating point.
        double ms = ts->get<double>();
        if (!std::isfinite(ms) || ms < 0 || ms >= 9.0e18)
            return std::nullopt;
        e.started_at = static_cast<int64_t>(ms);
    }
    else if (!integer_in_range(*ts, 0, std::numeric_limits<int64_t>::max(), e.started_at))
        return std::nullopt;

    if (!optional_string(j, "version", e.version)
        || !optional_string(j, "configHash", e.config_hash)
        || !optional_string(j, "sharedSecret", e.shared_secret))
        return std::nullopt;
    return e;
}

int64_t now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ─── DaemonRegistry: paths ───────────────────────────────────────────────────

DaemonRegistry::DaemonRegistry(std::string root) : root_(std::move(root)) {}

DaemonRegistry DaemonRegistry::from_environment()
{
    return DaemonRegistry(registry_root());
}

std::string DaemonRegistry::daemon_dir(const std::string& config_hash) const
{
    return root_ + "/" + (config_hash.empty() ? std::string("default") : config_hash);
}

std::string DaemonRegistry::entry_path(const std::string& config_hash) const
{
    return daemon_dir(config_hash) + "/daemon.json";
}

std::string DaemonRegistry::default_endpoint(const std::string& config_hash) const
{
    return daemon_dir(config_hash) + "/daemon.sock";
}

// ─── DaemonRegistry: writing ─────────────────────────────────────────────────

std::string DaemonRegistry::write_temp(const RegistryEntry& entry) const
{
    const std::string hash = entry.config_hash.value_or("");
    const std::string dir  = daemon_dir(hash);
    if (!ensure_directory(dir, 0700))
        throw RegistryError("Failed to create registry directory " + dir + ": "
                            + std::strerror(errno));

    const std::string tmp  = entry_path(hash) + "." + std::to_string(::getpid()) + ".tmp";
    const std::string body = entry.to_json().dump(2) + "\n";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0)
        throw RegistryError("Failed to open " + tmp + ": " + std::strerror(errno));

    size_t written = 0;
    while (written < body.size())
    {
        ssize_t n = ::write(fd, body.data() + written, body.size() - written);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
        {
            int saved = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw RegistryError("Failed to write " + tmp + ": " + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }
    ::fchmod(fd, 0600);
    ::close(fd);
    return tmp;
}

void DaemonRegistry::write(const RegistryEntry& entry) const
{
    const std::string tmp  = write_temp(entry);
    const std::string path = entry_path(entry.config_hash.value_or(""));
    if (::rename(tmp.c_str(), path.c_str()) != 0)
    {
        int saved = errno;
        ::unlink(tmp.c_str());
        throw RegistryError("Failed to publish " + path + ": " + std::strerror(saved));
    }
    MCPMUX_LOG_DEBUG("registry", "wrote {}", path);
}

bool DaemonRegistry::create(const RegistryEntry& entry) const
{
    const std::string tmp  = write_temp(entry);
    const std::string path = entry_path(entry.config_hash.value_or(""));

    // link() fails with EEXIST instead of replacing, unlike rename().
    int rc    = ::link(tmp.c_str(), path.c_str());
    int saved = errno;
    ::unlink(tmp.c_str());

    if (rc == 0)
    {
        MCPMUX_LOG_DEBUG("registry", "created {}", path);
        return true;
    }
    if (saved == EEXIST)
        return false;
    throw RegistryError("Failed to publish " + path + ": " + std::strerror(saved));
}

// ─── DaemonRegistry: reading ─────────────────────────────────────────────────

std::optional<RegistryEntry> DaemonRegistry::read(const std::string& config_hash) const
{
    std::ifstream in(entry_path(config_hash));
    if (!in)
        return std::nullopt;

    std::stringstream ss;
    ss << in.rdbuf();

    auto j = nlohmann::json::parse(ss.str(), nullptr, false);
    if (j.is_discarded())
    {
        MCPMUX_LOG_DEBUG("registry", "ignoring unparsable {}", entry_path(config_hash));
        return std::nullopt;
    }
    return RegistryEntry::from_json(j);
}

void DaemonRegistry::remove(const std::string& config_hash) const
{
    const std::string path = entry_path(config_hash);
    if (::unlink(path.c_str()) != 0 && errno != ENOENT)
        MCPMUX_LOG_DEBUG("registry", "failed to remove {}: {}", path, std::strerror(errno));
}

bool DaemonRegistry::remove_if_owned(const std::string& config_hash,
                                     const std::string& daemon_id) const
{
    auto current = read(config_hash);
    if (!current || current->daemon_id != daemon_id)
        return false;
    remove(config_hash);
    return true;
}

// ─── Liveness ────────────────────────────────────────────────────────────────

bool DaemonRegistry::is_process_running(int64_t pid)
{
    if (pid <= 0 || pid > std::numeric_limits<pid_t>::max())
        return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno == EPERM;
}

bool DaemonRegistry::is_alive(const RegistryEntry& entry, std::chrono::milliseconds timeout)
{
    if (!is_process_running(entry.pid))
        return false;
    return ipc::can_connect(entry.endpoint, timeout);
}

std::optional<RegistryEntry> DaemonRegistry::load_live(const std::string&        config_hash,
                                                       std::chrono::milliseconds timeout) const
{
    auto entry = read(config_hash);
    if (!entry)
        return std::nullopt;

    if (!is_alive(*entry, timeout))
    {
        MCPMUX_LOG_DEBUG("registry",
                         "removing stale entry {} (pid {})",
                         entry->daemon_id,
                         entry->pid);
        remove(config_hash);
        return std::nullopt;
    }
    return entry;
}

}   // namespace mcpmux::daemon
