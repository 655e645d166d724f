#include "process_manager.hpp"

#include <mcpmux/logger.hpp>

#include <cerrno>
#include <cstring>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcpmux::daemon
{

std::string join_command(const std::vector<std::string>& argv)
{
    std::string out;
    for (const auto& a : argv)
    {
        if (!out.empty())
            out.push_back(' ');
        out += a;
    }
    return out;
}

namespace
{

std::vector<char*> to_c_argv(const std::vector<std::string>& argv)
{
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv)
        out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

// The current environment with `overrides` applied, as NAME=value strings.
std::vector<std::string> merged_environment(const EnvOverrides& overrides)
{
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string_view kv(*e);
        auto             eq   = kv.find('=');
        std::string_view name = kv.substr(0, eq);

        bool replaced = false;
        for (const auto& [k, v] : overrides)
        {
            if (k == name)
            {
                replaced = true;
                break;
            }
        }
        if (!replaced)
            env.emplace_back(kv);
    }
    for (const auto& [k, v] : overrides)
        env.push_back(k + "=" + v);
    return env;
}

}   // namespace

// ─── Supervised children ─────────────────────────────────────────────────────

std::optional<PipedChild> ProcessManager::spawn_piped(const std::vector<std::string>& argv)
{
    if (argv.empty())
        return std::nullopt;

    int to_child[2]   = {-1, -1};
    int from_child[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0)
        return std::nullopt;
    if (::pipe2(from_child, O_CLOEXEC) != 0)
    {
        ::close(to_child[0]);
        ::close(to_child[1]);
        return std::nullopt;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, to_child[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, from_child[1], STDOUT_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    auto  c_argv = to_c_argv(argv);
    pid_t pid    = 0;
    int   ret = ::posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(), environ);
    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    ::close(to_child[0]);
    ::close(from_child[1]);

    if (ret != 0)
    {
        MCPMUX_LOG_ERROR("process", "posix_spawn {} failed: {}", argv[0], std::strerror(ret));
        ::close(to_child[1]);
        ::close(from_child[0]);
        return std::nullopt;
    }

    children_[pid] = join_command(argv);
    MCPMUX_LOG_INFO("process", "spawned pid={} ({})", pid, join_command(argv));

    return PipedChild{pid, to_child[1], from_child[0]};
}

std::vector<pid_t> ProcessManager::reap_finished()
{
    std::vector<pid_t> reaped;
    for (auto it = children_.begin(); it != children_.end();)
    {
        int   status = 0;
        pid_t result = ::waitpid(it->first, &status, WNOHANG);
        if (result > 0 || (result < 0 && errno == ECHILD))
        {
            if (result > 0 && WIFEXITED(status))
                MCPMUX_LOG_INFO("process", "reaped pid={} ({}) exit_code={}", it->first, it->second,
                                WEXITSTATUS(status));
            else if (result > 0 && WIFSIGNALED(status))
                MCPMUX_LOG_INFO("process", "reaped pid={} ({}) signal={}", it->first, it->second,
                                WTERMSIG(status));

            reaped.push_back(it->first);
            it = children_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return reaped;
}

bool ProcessManager::terminate(pid_t pid, std::chrono::milliseconds grace)
{
    if (pid <= 0 || children_.count(pid) == 0)
        return false;

    // The group outlives its leader while any member runs, so -pid stays
    // valid for stragglers even after the child itself was reaped.
    int  status = 0;
    bool reaped = ::waitpid(pid, &status, WNOHANG) != 0;
    if (!reaped)
    {
        ::kill(-pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (!reaped && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            reaped = ::waitpid(pid, &status, WNOHANG) != 0;
        }
        if (!reaped)
            MCPMUX_LOG_WARN("process", "pid={} ignored SIGTERM, killing", pid);
    }

    if (::kill(-pid, SIGKILL) == 0)
        MCPMUX_LOG_DEBUG("process", "killed remaining members of process group {}", pid);
    if (!reaped)
        reaped = ::waitpid(pid, &status, 0) == pid;

    children_.erase(pid);
    return reaped;
}

// ─── Detached launch ─────────────────────────────────────────────────────────

bool ProcessManager::spawn_detached(const std::vector<std::string>& argv,
                                    const EnvOverrides&             env,
                                    const std::string&              log_path)
{
    if (argv.empty())
        return false;

    // Everything the children need is built before fork().
    auto env_strings = merged_environment(env);
    auto c_env       = to_c_argv(env_strings);
    auto c_argv      = to_c_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        MCPMUX_LOG_ERROR("process", "fork() failed: {}", std::strerror(errno));
        return false;
    }

    if (pid == 0)
    {
        // Intermediate child: new session, then fork the daemon and exit so
        // the daemon is never our zombie.
        ::setsid();
        pid_t daemon_pid = ::fork();
        if (daemon_pid != 0)
            ::_exit(daemon_pid < 0 ? 1 : 0);

        int null_fd = ::open("/dev/null", O_RDWR);
        int err_fd  = -1;
        if (!log_path.empty())
            err_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
        if (null_fd >= 0)
        {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
            ::dup2(err_fd >= 0 ? err_fd : null_fd, STDERR_FILENO);
        }
        for (int fd = STDERR_FILENO + 1; fd < 1024; ++fd)
            ::close(fd);

        ::execve(c_argv[0], c_argv.data(), c_env.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
    bool ok = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (ok)
        MCPMUX_LOG_DEBUG("process", "detached launch of {}", join_command(argv));
    else
        MCPMUX_LOG_ERROR("process", "detached launch of {} failed", argv[0]);
    return ok;
}

}   // namespace mcpmux::daemon
