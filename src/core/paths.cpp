#include "paths.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mcpmux
{

uint64_t djb2_hash64(std::string_view text)
{
    uint64_t hash = 5381;
    for (char c : text)
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    return hash;
}

std::string config_hash(std::string_view config_text)
{
    char buf[17];
    std::snprintf(buf,
                  sizeof(buf),
                  "%016llx",
                  static_cast<unsigned long long>(djb2_hash64(config_text)));
    return std::string(buf, 12);
}

std::optional<std::string> env_value(const char* name)
{
    const char* v = std::getenv(name);
    if (v && v[0] != '\0')
        return std::string(v);
    return std::nullopt;
}

std::string registry_root()
{
    if (auto dir = env_value("MCPMUX_DAEMON_DIR"))
        return *dir;
    if (auto xdg = env_value("XDG_CONFIG_HOME"))
        return *xdg + "/mcpmux/daemon";
    if (auto home = env_value("HOME"))
        return *home + "/.config/mcpmux/daemon";
    return "/tmp/mcpmux-" + std::to_string(::getuid()) + "/daemon";
}

bool ensure_directory(const std::string& path, unsigned mode)
{
    if (path.empty())
        return false;

    for (size_t pos = 1; pos <= path.size(); ++pos)
    {
        if (pos != path.size() && path[pos] != '/')
            continue;
        std::string prefix = path.substr(0, pos);
        if (::mkdir(prefix.c_str(), static_cast<mode_t>(mode)) != 0 && errno != EEXIST)
            return false;
    }

    struct stat st
    {
    };
    if (::stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
        return false;
    return ::chmod(path.c_str(), static_cast<mode_t>(mode)) == 0;
}

std::string self_executable_path()
{
    char    buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0)
        return {};
    return std::string(buf, static_cast<size_t>(n));
}

}   // namespace mcpmux
