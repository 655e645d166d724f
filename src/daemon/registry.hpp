#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpmux::daemon
{

class RegistryError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// ─── RegistryEntry ───────────────────────────────────────────────────────────
// "A daemon exists at `endpoint`, owned by `pid`, for configuration hash H."

struct RegistryEntry
{
    std::string                daemon_id;
    std::string                endpoint;
    int64_t                    pid        = 0;
    int64_t                    started_at = 0;   // ms since epoch
    std::optional<std::string> version;
    std::optional<std::string> config_hash;
    std::optional<std::string> shared_secret;

    nlohmann::json to_json() const;

    // Validates field types. Returns std::nullopt on any mismatch.
    static std::optional<RegistryEntry> from_json(const nlohmann::json& j);
};

// Wall clock, ms since epoch.
int64_t now_ms();

// ─── DaemonRegistry ──────────────────────────────────────────────────────────
// One JSON file per configuration hash under a root directory:
//
//   <root>/<hash or "default">/daemon.json
//   <root>/<hash or "default">/daemon.sock   (default endpoint)
//
// The file is never modified in place: writers replace it by rename, or
// create it exclusively. Readers re-validate on every read. An empty
// `config_hash` selects the "default" slot.

class DaemonRegistry
{
   public:
    static constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{300};

    explicit DaemonRegistry(std::string root);

    // Root from MCPMUX_DAEMON_DIR / XDG_CONFIG_HOME / HOME.
    static DaemonRegistry from_environment();

    const std::string& root() const { return root_; }

    std::string daemon_dir(const std::string& config_hash) const;
    std::string entry_path(const std::string& config_hash) const;
    std::string default_endpoint(const std::string& config_hash) const;

    // Atomically replace the entry for entry.config_hash. Throws RegistryError.
    void write(const RegistryEntry& entry) const;

    // Publish only if no entry exists. Returns false if one does.
    // Throws RegistryError on I/O failure.
    bool create(const RegistryEntry& entry) const;

    // Parse and validate. Missing, unreadable or invalid -> std::nullopt.
    std::optional<RegistryEntry> read(const std::string& config_hash) const;

    // Delete the entry. Missing files are not an error.
    void remove(const std::string& config_hash) const;

    // Delete the entry only if it still names `daemon_id`.
    bool remove_if_owned(const std::string& config_hash, const std::string& daemon_id) const;

    // read() + is_alive(); a stale entry is deleted and std::nullopt returned.
    std::optional<RegistryEntry> load_live(
        const std::string&        config_hash,
        std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT) const;

    // kill(pid, 0): true when the process exists (EPERM counts as existing).
    static bool is_process_running(int64_t pid);

    // Process exists AND a connect to the endpoint succeeds within `timeout`.
    static bool is_alive(const RegistryEntry&       entry,
                         std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT);

   private:
    // Writes `entry` to <path>.<pid>.tmp with mode 0600. Returns the temp path.
    std::string write_temp(const RegistryEntry& entry) const;

    std::string root_;
};

}   // namespace mcpmux::daemon
