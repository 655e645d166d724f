#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace mcpmux::daemon
{

// A supervised child whose stdin/stdout are pipes held by this process.
struct PipedChild
{
    pid_t pid       = -1;
    int   stdin_fd  = -1;   // write end, child's stdin
    int   stdout_fd = -1;   // read end, child's stdout
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// Launches processes two ways:
//  - supervised: piped stdio, own process group, reaped and terminated here
//  - detached: new session, stdio on /dev/null, never waited for
class ProcessManager
{
   public:
    ProcessManager() = default;

    // Spawn `argv` (PATH lookup for argv[0]) with stdin and stdout piped and
    // stderr inherited. The child leads a new process group so wrappers such
    // as `sh -c` or `npx` can be stopped together with what they start.
    // Returns std::nullopt on failure.
    std::optional<PipedChild> spawn_piped(const std::vector<std::string>& argv);

    // Launch, detach, do not wait. Double fork so the daemon is reparented to
    // init; `env` entries override the inherited environment. stderr goes to
    // `log_path` when given, else /dev/null. Returns false if the launch
    // itself failed (fork, or the intermediate child).
    static bool spawn_detached(const std::vector<std::string>& argv,
                               const EnvOverrides&             env      = {},
                               const std::string&              log_path = "");

    // Reap any finished supervised children. Returns the reaped PIDs.
    std::vector<pid_t> reap_finished();

    // SIGTERM to the child's process group, wait up to `grace` for the child,
    // then SIGKILL whatever is left of the group. Blocks for at most `grace`
    // plus the final reap. Returns true once the child is reaped, false for a
    // pid this manager does not supervise (or no longer does).
    bool terminate(pid_t pid, std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

   private:
    std::unordered_map<pid_t, std::string> children_;   // pid -> command, for logs
};

// Render argv for logs: words joined by spaces.
std::string join_command(const std::vector<std::string>& argv);

}   // namespace mcpmux::daemon
