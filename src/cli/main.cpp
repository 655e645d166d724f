#include "options.hpp"

#include "core/paths.hpp"
#include "daemon/daemon_server.hpp"
#include "daemon/process_manager.hpp"
#include "daemon/registry.hpp"
#include "daemon/stdio_backend.hpp"
#include "ipc/event_loop.hpp"
#include "ipc/line_channel.hpp"
#include "proxy/proxy_bridge.hpp"

#include <mcpmux/logger.hpp>
#include <mcpmux/version.hpp>

#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace mcpmux;

namespace
{

constexpr int EXIT_OK      = 0;
constexpr int EXIT_RUNTIME = 1;
constexpr int EXIT_USAGE   = 2;

// ─── Signals ─────────────────────────────────────────────────────────────────
// SIGINT/SIGTERM are turned into a readable byte on a pipe so shutdown runs
// as an ordinary loop callback.

int g_signal_pipe[2] = {-1, -1};

void signal_handler(int /*sig*/)
{
    const char byte    = 1;
    ssize_t    written = ::write(g_signal_pipe[1], &byte, 1);
    (void)written;
}

bool install_signal_handlers(ipc::EventLoop& loop, std::function<void()> on_signal)
{
    if (::pipe2(g_signal_pipe, O_CLOEXEC | O_NONBLOCK) != 0)
        return false;

    struct sigaction sa
    {
    };
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    loop.add(g_signal_pipe[0],
             ipc::EventLoop::EVENT_READABLE,
             [on_signal = std::move(on_signal)](uint32_t)
             {
                 char    buf[16];
                 ssize_t n = ::read(g_signal_pipe[0], buf, sizeof(buf));
                 (void)n;
                 MCPMUX_LOG_INFO("cli", "signal received, shutting down");
                 on_signal();
             });
    return true;
}

// ─── Logging ─────────────────────────────────────────────────────────────────

bool setup_logging(const cli::CliOptions& opts, LogLevel fallback)
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(sinks::console_sink());
    if (!opts.log_file.empty())
        logger.add_sink(sinks::file_sink(opts.log_file));

    std::string name = opts.log_level;
    if (name.empty())
        name = env_value("MCPMUX_LOG_LEVEL").value_or("");
    if (name.empty())
    {
        logger.set_level(fallback);
        return true;
    }

    auto level = Logger::parse_level(name);
    if (!level)
    {
        std::cerr << "mcpmux: invalid log level: " << name << "\n";
        return false;
    }
    logger.set_level(*level);
    return true;
}

// ─── daemon ──────────────────────────────────────────────────────────────────

int run_daemon(const cli::CliOptions& opts)
{
    if (!setup_logging(opts, LogLevel::Info))
        return EXIT_USAGE;

    ipc::EventLoop         loop;
    daemon::DaemonRegistry registry = daemon::DaemonRegistry::from_environment();
    daemon::StdioBackend   backend(opts.backend_command);

    daemon::DaemonOptions d;
    d.endpoint      = opts.endpoint;
    d.config_hash   = opts.effective_config_hash();
    d.shared_secret = env_value("MCPMUX_SHARED_SECRET");
    if (opts.idle_timeout)
        d.idle_timeout = *opts.idle_timeout;
    if (opts.heartbeat_timeout)
        d.heartbeat_timeout = *opts.heartbeat_timeout;
    d.on_shutdown = [&loop]() { loop.stop(); };

    daemon::DaemonServer server(loop, backend, registry, std::move(d));
    try
    {
        server.start();
    }
    catch (const std::exception& e)
    {
        MCPMUX_LOG_ERROR("cli", "daemon failed to start: {}", e.what());
        return EXIT_RUNTIME;
    }

    if (!install_signal_handlers(loop,
                                 [&]()
                                 {
                                     server.stop();
                                     loop.stop();
                                 }))
        MCPMUX_LOG_WARN("cli", "signal handlers not installed: {}", std::strerror(errno));

    MCPMUX_LOG_INFO("cli", "mcpmux {} daemon pid {}", VERSION, ::getpid());
    loop.run();
    server.stop();
    return EXIT_OK;
}

// ─── proxy ───────────────────────────────────────────────────────────────────

// Default spawn operation: re-run this executable as a detached daemon.
void spawn_daemon_process(const daemon::DaemonRegistry&     registry,
                          const cli::CliOptions&            opts,
                          const std::string&                hash,
                          const std::optional<std::string>& secret)
{
    std::string self = self_executable_path();
    if (self.empty())
        throw std::runtime_error("cannot locate the mcpmux executable");

    std::string dir = registry.daemon_dir(hash);
    if (!ensure_directory(dir, 0700))
        throw std::runtime_error("cannot create " + dir + ": " + std::strerror(errno));

    std::vector<std::string> argv = {self, "daemon", "--log-file", dir + "/daemon.log"};
    if (!hash.empty())
    {
        argv.push_back("--config-hash");
        argv.push_back(hash);
    }
    argv.push_back("--");
    argv.insert(argv.end(), opts.backend_command.begin(), opts.backend_command.end());

    daemon::EnvOverrides env;
    if (secret)
        env.emplace_back("MCPMUX_SHARED_SECRET", *secret);

    if (!daemon::ProcessManager::spawn_detached(argv, env))
        throw std::runtime_error("detached launch failed");
}

int run_proxy(const cli::CliOptions& opts)
{
    bool debug = opts.debug || env_value("MCPMUX_PROXY_DEBUG").value_or("") == "1";
    if (!setup_logging(opts, debug ? LogLevel::Debug : LogLevel::Warning))
        return EXIT_USAGE;

    const std::string hash = opts.effective_config_hash();

    ipc::EventLoop         loop;
    daemon::DaemonRegistry registry = daemon::DaemonRegistry::from_environment();
    ipc::LineChannel       local(loop, STDIN_FILENO, STDOUT_FILENO, false);

    proxy::ProxyOptions p;
    p.endpoint      = opts.endpoint;
    p.config_hash   = hash;
    p.shared_secret = env_value("MCPMUX_SHARED_SECRET");
    p.no_spawn      = opts.no_spawn;
    p.debug         = debug;
    if (opts.connect_timeout)
        p.connect_timeout = *opts.connect_timeout;
    if (opts.startup_timeout)
        p.startup_timeout = *opts.startup_timeout;
    if (opts.heartbeat_interval)
        p.heartbeat_interval = *opts.heartbeat_interval;
    p.spawn_daemon = [&registry, &opts, hash](const std::optional<std::string>& secret)
    { spawn_daemon_process(registry, opts, hash, secret); };
    p.on_finished = [&loop]() { loop.stop(); };

    proxy::ProxyBridge bridge(loop, local, registry, std::move(p));
    try
    {
        bridge.start();
    }
    catch (const proxy::ProxyError& e)
    {
        MCPMUX_LOG_ERROR("cli", "{}", e.what());
        return EXIT_RUNTIME;
    }
    catch (const ipc::TransportError& e)
    {
        MCPMUX_LOG_ERROR("cli", "cannot reach daemon: {}", e.what());
        return EXIT_RUNTIME;
    }

    if (!install_signal_handlers(loop, [&bridge]() { bridge.stop(); }))
        MCPMUX_LOG_WARN("cli", "signal handlers not installed: {}", std::strerror(errno));

    if (!bridge.finished())
        loop.run();
    bridge.stop();

    // Let queued responses reach stdout.
    loop.run_until([&local]() { return local.pending_output() == 0; },
                   std::chrono::milliseconds(1000));
    if (bridge.rejection())
    {
        MCPMUX_LOG_ERROR("cli", "daemon refused the session: {}", *bridge.rejection());
        return EXIT_RUNTIME;
    }
    return EXIT_OK;
}

// ─── status ──────────────────────────────────────────────────────────────────

int run_status(const cli::CliOptions& opts)
{
    const std::string      hash     = opts.effective_config_hash();
    daemon::DaemonRegistry registry = daemon::DaemonRegistry::from_environment();

    auto entry = registry.load_live(hash);
    if (!entry)
    {
        std::cout << "No live daemon for " << (hash.empty() ? "default" : hash) << "\n";
        return EXIT_RUNTIME;
    }

    auto j = entry->to_json();
    j.erase("sharedSecret");
    std::cout << j.dump(2) << "\n";
    return EXIT_OK;
}

}   // namespace

int main(int argc, char* argv[])
{
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args[0] == "--help" || args[0] == "-h"))
    {
        std::cout << cli::usage();
        return EXIT_OK;
    }
    if (!args.empty() && args[0] == "--version")
    {
        std::cout << "mcpmux " << VERSION << "\n";
        return EXIT_OK;
    }

    std::string error;
    auto        opts = cli::parse_args(args, error);
    if (!opts)
    {
        std::cerr << "mcpmux: " << error << "\n" << cli::usage();
        return EXIT_USAGE;
    }

    switch (opts->command)
    {
        case cli::Command::DAEMON:
            return run_daemon(*opts);
        case cli::Command::PROXY:
            return run_proxy(*opts);
        case cli::Command::STATUS:
            return run_status(*opts);
    }
    return EXIT_USAGE;
}
