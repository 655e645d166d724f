#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpmux::cli
{

enum class Command : uint8_t
{
    DAEMON,
    PROXY,
    STATUS,
};

struct CliOptions
{
    Command command = Command::PROXY;

    std::string endpoint;
    std::string config_hash;   // explicit --config-hash
    std::string log_file;
    std::string log_level;

    std::optional<std::chrono::milliseconds> idle_timeout;
    std::optional<std::chrono::milliseconds> heartbeat_timeout;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> startup_timeout;
    std::optional<std::chrono::milliseconds> heartbeat_interval;

    bool no_spawn = false;
    bool debug    = false;

    // Everything after "--".
    std::vector<std::string> backend_command;

    // --config-hash if given, else derived from the backend command, else "".
    std::string effective_config_hash() const;
};

// Parse argv[1..]. On a usage error returns std::nullopt and sets `error`.
std::optional<CliOptions> parse_args(const std::vector<std::string>& args, std::string& error);

const char* usage();

}   // namespace mcpmux::cli
