#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpmux
{

// djb2 over bytes, widened to 64 bits. Deterministic across platforms and
// builds (unlike std::hash), so independent processes agree on it.
uint64_t djb2_hash64(std::string_view text);

// 12 lowercase hex digits identifying a backend configuration.
std::string config_hash(std::string_view config_text);

// Registry root directory:
//   $MCPMUX_DAEMON_DIR
//   $XDG_CONFIG_HOME/mcpmux/daemon
//   $HOME/.config/mcpmux/daemon
//   /tmp/mcpmux-<uid>/daemon          (no HOME)
std::string registry_root();

// Returns the environment variable when set and non-empty.
std::optional<std::string> env_value(const char* name);

// mkdir -p with the given mode on every created component. Existing
// directories are left as they are, except the leaf which is chmod'ed.
bool ensure_directory(const std::string& path, unsigned mode);

// Absolute path of the running executable (/proc/self/exe), empty on failure.
std::string self_executable_path();

}   // namespace mcpmux
