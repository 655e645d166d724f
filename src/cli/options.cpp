#include "options.hpp"

#include "core/paths.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace mcpmux::cli
{

const char* usage()
{
    return "Usage:\n"
           "  mcpmux daemon [--endpoint E] [--config-hash H] [--idle-timeout-ms N]\n"
           "                [--heartbeat-timeout-ms N] [--log-file F] [--log-level L]\n"
           "                -- <backend command...>\n"
           "  mcpmux proxy  [--endpoint E] [--config-hash H] [--no-spawn] [--timeout-ms N]\n"
           "                [--startup-timeout-ms N] [--heartbeat-ms N] [--debug]\n"
           "                [--log-level L] -- <backend command...>\n"
           "  mcpmux status [--config-hash H] [-- <backend command...>]\n";
}

std::string CliOptions::effective_config_hash() const
{
    if (!config_hash.empty())
        return config_hash;
    if (backend_command.empty())
        return {};
    return mcpmux::config_hash(nlohmann::json(backend_command).dump());
}

namespace
{

bool parse_ms(const std::string& text, std::optional<std::chrono::milliseconds>& out)
{
    int64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value <= 0)
        return false;
    out = std::chrono::milliseconds(value);
    return true;
}

}   // namespace

std::optional<CliOptions> parse_args(const std::vector<std::string>& args, std::string& error)
{
    if (args.empty())
    {
        error = "missing command";
        return std::nullopt;
    }

    CliOptions opts;
    if (args[0] == "daemon")
        opts.command = Command::DAEMON;
    else if (args[0] == "proxy")
        opts.command = Command::PROXY;
    else if (args[0] == "status")
        opts.command = Command::STATUS;
    else
    {
        error = "unknown command: " + args[0];
        return std::nullopt;
    }

    const bool daemon = opts.command == Command::DAEMON;
    const bool proxy  = opts.command == Command::PROXY;

    for (size_t i = 1; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "--")
        {
            opts.backend_command.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                                        args.end());
            break;
        }

        // Flags without a value.
        if (arg == "--no-spawn" && proxy)
        {
            opts.no_spawn = true;
            continue;
        }
        if (arg == "--debug" && proxy)
        {
            opts.debug = true;
            continue;
        }
        if (arg == "--no-spawn" || arg == "--debug")
        {
            error = "unknown option: " + arg;
            return std::nullopt;
        }

        if (i + 1 >= args.size())
        {
            error = "missing value for " + arg;
            return std::nullopt;
        }
        const std::string& value = args[i + 1];
        bool               ok    = true;

        if (arg == "--config-hash")
            opts.config_hash = value;
        else if (arg == "--endpoint" && (daemon || proxy))
            opts.endpoint = value;
        else if (arg == "--log-level" && (daemon || proxy))
            opts.log_level = value;
        else if (arg == "--log-file" && daemon)
            opts.log_file = value;
        else if (arg == "--idle-timeout-ms" && daemon)
            ok = parse_ms(value, opts.idle_timeout);
        else if (arg == "--heartbeat-timeout-ms" && daemon)
            ok = parse_ms(value, opts.heartbeat_timeout);
        else if (arg == "--timeout-ms" && proxy)
            ok = parse_ms(value, opts.connect_timeout);
        else if (arg == "--startup-timeout-ms" && proxy)
            ok = parse_ms(value, opts.startup_timeout);
        else if (arg == "--heartbeat-ms" && proxy)
            ok = parse_ms(value, opts.heartbeat_interval);
        else
        {
            error = "unknown option: " + arg;
            return std::nullopt;
        }

        if (!ok)
        {
            error = "invalid value for " + arg + ": " + value;
            return std::nullopt;
        }
        ++i;
    }

    // A proxy needs the command only to spawn a daemon.
    bool need_command = daemon || (proxy && opts.endpoint.empty() && !opts.no_spawn);
    if (need_command && opts.backend_command.empty())
    {
        error = "missing backend command after --";
        return std::nullopt;
    }
    return opts;
}

}   // namespace mcpmux::cli
