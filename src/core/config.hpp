#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Everything the service needs to start. Loaded in layers:
// YAML file, then PROXY_* environment, then command-line flags.
struct ProxySettings {
    // SSH endpoint: either an alias from ~/.ssh/config or explicit fields
    std::optional<std::string> ssh_host_alias;
    std::optional<std::string> ssh_host;
    std::optional<std::string> ssh_username;
    std::optional<std::string> ssh_key_path;
    std::optional<int> ssh_port;

    std::string data_path;                  // directory served on the remote host
    int local_port = DEFAULT_LOCAL_PORT;
    int remote_port = DEFAULT_REMOTE_PORT;
    std::string listen_host = DEFAULT_LISTEN_HOST;
    int listen_port = DEFAULT_LISTEN_PORT;

    int ssh_timeout = SSH_TIMEOUT_SECS;
    int readiness_timeout = READINESS_TIMEOUT_SECS;
    int upstream_stall_timeout = UPSTREAM_STALL_TIMEOUT_SECS;
    bool strict_host_key_checking = false;

    std::string remote_server_command = DEFAULT_REMOTE_SERVER_CMD;
    std::string remote_kill_pattern = DEFAULT_REMOTE_KILL_PATTERN;

    std::string log_file;
    bool verbose = false;

    bool using_ssh_config() const { return ssh_host_alias.has_value(); }
};

using EnvLookup = std::function<const char*(const char*)>;

// Set one setting from its string form. `key` is the snake_case name used in
// the YAML file (fastapi_port is accepted as an alias of listen_port).
Result<void> apply_setting(ProxySettings& settings, const std::string& key,
                           const std::string& value);

// Overlay a YAML mapping file onto settings.
Result<void> load_settings_file(const fs::path& path, ProxySettings& settings);

// Overlay PROXY_<KEY> environment variables onto settings.
Result<void> apply_settings_env(ProxySettings& settings, const EnvLookup& lookup = nullptr);

// Check the combined settings before the service starts.
Result<void> validate_settings(const ProxySettings& settings);

// Environment variable consulted for a settings file when --config is absent.
constexpr const char* CONFIG_PATH_ENV = "PROXY_CONFIG";
