#include <gtest/gtest.h>

#include "cli/options.hpp"
#include "core/paths.hpp"

using namespace mcpmux::cli;
using namespace std::chrono_literals;

namespace
{

std::optional<CliOptions> parse(const std::vector<std::string>& args, std::string* error = nullptr)
{
    std::string err;
    auto        opts = parse_args(args, err);
    if (error)
        *error = err;
    return opts;
}

std::string parse_error(const std::vector<std::string>& args)
{
    std::string err;
    EXPECT_FALSE(parse(args, &err).has_value());
    return err;
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CliOptions, DaemonWithAllOptions)
{
    auto opts = parse({"daemon",
                       "--endpoint", "/tmp/d.sock",
                       "--config-hash", "abc",
                       "--idle-timeout-ms", "1500",
                       "--heartbeat-timeout-ms", "900",
                       "--log-file", "/tmp/d.log",
                       "--log-level", "debug",
                       "--", "npx", "-y", "server"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->command, Command::DAEMON);
    EXPECT_EQ(opts->endpoint, "/tmp/d.sock");
    EXPECT_EQ(opts->config_hash, "abc");
    EXPECT_EQ(opts->idle_timeout, 1500ms);
    EXPECT_EQ(opts->heartbeat_timeout, 900ms);
    EXPECT_EQ(opts->log_file, "/tmp/d.log");
    EXPECT_EQ(opts->log_level, "debug");
    EXPECT_EQ(opts->backend_command, (std::vector<std::string>{"npx", "-y", "server"}));
}

TEST(CliOptions, ProxyFlags)
{
    auto opts = parse({"proxy", "--no-spawn", "--debug", "--timeout-ms", "250",
                       "--startup-timeout-ms", "4000", "--heartbeat-ms", "100",
                       "--config-hash", "h"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->command, Command::PROXY);
    EXPECT_TRUE(opts->no_spawn);
    EXPECT_TRUE(opts->debug);
    EXPECT_EQ(opts->connect_timeout, 250ms);
    EXPECT_EQ(opts->startup_timeout, 4000ms);
    EXPECT_EQ(opts->heartbeat_interval, 100ms);
    EXPECT_TRUE(opts->backend_command.empty());
    EXPECT_FALSE(opts->idle_timeout.has_value());
}

TEST(CliOptions, BackendArgumentsAreNotParsed)
{
    auto opts = parse({"proxy", "--", "server", "--debug", "--endpoint"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_FALSE(opts->debug);
    EXPECT_TRUE(opts->endpoint.empty());
    EXPECT_EQ(opts->backend_command, (std::vector<std::string>{"server", "--debug", "--endpoint"}));
}

TEST(CliOptions, ProxyNeedsCommandOnlyToSpawn)
{
    EXPECT_EQ(parse_error({"proxy"}), "missing backend command after --");
    EXPECT_TRUE(parse({"proxy", "--endpoint", "tcp://127.0.0.1:9000"}).has_value());
    EXPECT_TRUE(parse({"proxy", "--no-spawn"}).has_value());
}

TEST(CliOptions, StatusNeedsNoCommand)
{
    auto opts = parse({"status"});
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->command, Command::STATUS);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CliOptions, UsageErrors)
{
    EXPECT_EQ(parse_error({}), "missing command");
    EXPECT_EQ(parse_error({"serve"}), "unknown command: serve");
    EXPECT_EQ(parse_error({"daemon"}), "missing backend command after --");
    EXPECT_EQ(parse_error({"daemon", "--endpoint"}), "missing value for --endpoint");
    EXPECT_EQ(parse_error({"daemon", "--bogus", "x", "--", "srv"}), "unknown option: --bogus");
}

TEST(CliOptions, OptionsBelongToTheirCommand)
{
    EXPECT_EQ(parse_error({"daemon", "--no-spawn", "--", "srv"}), "unknown option: --no-spawn");
    EXPECT_EQ(parse_error({"status", "--debug"}), "unknown option: --debug");
    EXPECT_EQ(parse_error({"proxy", "--idle-timeout-ms", "5", "--", "srv"}),
              "unknown option: --idle-timeout-ms");
    EXPECT_EQ(parse_error({"status", "--endpoint", "/x"}), "unknown option: --endpoint");
    EXPECT_EQ(parse_error({"proxy", "--log-file", "/x", "--", "srv"}), "unknown option: --log-file");
}

TEST(CliOptions, TimeoutsMustBePositiveIntegers)
{
    EXPECT_EQ(parse_error({"daemon", "--idle-timeout-ms", "0", "--", "srv"}),
              "invalid value for --idle-timeout-ms: 0");
    EXPECT_EQ(parse_error({"daemon", "--idle-timeout-ms", "-5", "--", "srv"}),
              "invalid value for --idle-timeout-ms: -5");
    EXPECT_EQ(parse_error({"proxy", "--timeout-ms", "10s", "--", "srv"}),
              "invalid value for --timeout-ms: 10s");
    EXPECT_EQ(parse_error({"proxy", "--heartbeat-ms", "", "--", "srv"}),
              "invalid value for --heartbeat-ms: ");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Config hash
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CliOptions, EffectiveConfigHash)
{
    CliOptions o;
    EXPECT_EQ(o.effective_config_hash(), "");

    o.backend_command = {"npx", "-y", "server"};
    std::string derived = o.effective_config_hash();
    EXPECT_EQ(derived.size(), 12u);
    EXPECT_EQ(derived, mcpmux::config_hash(R"(["npx","-y","server"])"));

    // Argument boundaries matter.
    CliOptions joined;
    joined.backend_command = {"npx -y", "server"};
    EXPECT_NE(joined.effective_config_hash(), derived);

    o.config_hash = "explicit";
    EXPECT_EQ(o.effective_config_hash(), "explicit");
}
