#include "config.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace {

// Keys accepted from every layer, in the order they are looked up in the
// environment.
const std::vector<std::string> SETTING_KEYS{
    "ssh_host_alias", "ssh_host", "ssh_username", "ssh_key_path", "ssh_port",
    "data_path", "local_port", "remote_port", "listen_host", "listen_port",
    "fastapi_port", "ssh_timeout", "readiness_timeout", "upstream_stall_timeout",
    "strict_host_key_checking", "remote_server_command", "remote_kill_pattern",
    "log_file", "verbose",
};

Result<bool> parse_bool(const std::string& key, const std::string& value) {
    std::string v = to_lower(trimmed(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return Result<bool>::Ok(true);
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty())
        return Result<bool>::Ok(false);
    return Result<bool>::Err(ErrorKind::Config,
        fmt::format("{}: expected a boolean, got '{}'", key, value));
}

Result<int> parse_port_setting(const std::string& key, const std::string& value, int min_port) {
    int port = parse_port(trimmed(value), min_port);
    if (port < 0) {
        return Result<int>::Err(ErrorKind::Config,
            fmt::format("{}: invalid port '{}'", key, value));
    }
    return Result<int>::Ok(port);
}

Result<int> parse_seconds(const std::string& key, const std::string& value) {
    std::string v = trimmed(value);
    int secs = safe_stoi(v, -1);
    if (secs < 0 || std::to_string(secs) != v) {
        return Result<int>::Err(ErrorKind::Config,
            fmt::format("{}: expected a non-negative number of seconds, got '{}'", key, value));
    }
    return Result<int>::Ok(secs);
}

std::optional<std::string> non_empty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

Result<void> apply_setting(ProxySettings& s, const std::string& key, const std::string& value) {
    auto port_into = [&](int& field, int min_port) -> Result<void> {
        auto r = parse_port_setting(key, value, min_port);
        if (r.is_err()) return Result<void>::Err(r.kind, r.error);
        field = r.value;
        return Result<void>::Ok();
    };
    auto secs_into = [&](int& field) -> Result<void> {
        auto r = parse_seconds(key, value);
        if (r.is_err()) return Result<void>::Err(r.kind, r.error);
        field = r.value;
        return Result<void>::Ok();
    };
    auto bool_into = [&](bool& field) -> Result<void> {
        auto r = parse_bool(key, value);
        if (r.is_err()) return Result<void>::Err(r.kind, r.error);
        field = r.value;
        return Result<void>::Ok();
    };

    if (key == "ssh_host_alias") { s.ssh_host_alias = non_empty(value); return Result<void>::Ok(); }
    if (key == "ssh_host")       { s.ssh_host = non_empty(value);       return Result<void>::Ok(); }
    if (key == "ssh_username")   { s.ssh_username = non_empty(value);   return Result<void>::Ok(); }
    if (key == "ssh_key_path")   { s.ssh_key_path = non_empty(value);   return Result<void>::Ok(); }
    if (key == "ssh_port") {
        int port = 0;
        auto r = port_into(port, 1);
        if (r.is_ok()) s.ssh_port = port;
        return r;
    }
    if (key == "data_path")   { s.data_path = value; return Result<void>::Ok(); }
    if (key == "local_port")  return port_into(s.local_port, 1);
    if (key == "remote_port") return port_into(s.remote_port, 1);
    if (key == "listen_host") { s.listen_host = value; return Result<void>::Ok(); }
    if (key == "listen_port" || key == "fastapi_port") return port_into(s.listen_port, 1);
    if (key == "ssh_timeout")            return secs_into(s.ssh_timeout);
    if (key == "readiness_timeout")      return secs_into(s.readiness_timeout);
    if (key == "upstream_stall_timeout") return secs_into(s.upstream_stall_timeout);
    if (key == "strict_host_key_checking") return bool_into(s.strict_host_key_checking);
    if (key == "remote_server_command") { s.remote_server_command = value; return Result<void>::Ok(); }
    if (key == "remote_kill_pattern")   { s.remote_kill_pattern = value;   return Result<void>::Ok(); }
    if (key == "log_file") { s.log_file = value; return Result<void>::Ok(); }
    if (key == "verbose")  return bool_into(s.verbose);

    return Result<void>::Err(ErrorKind::Config, fmt::format("Unknown setting: {}", key));
}

Result<void> load_settings_file(const fs::path& path, ProxySettings& settings) {
    if (!fs::exists(path)) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Config file not found: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    if (root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("{}: top level must be a mapping", path.string()));
    }

    for (const auto& entry : root) {
        std::string key = entry.first.as<std::string>();
        if (!entry.second.IsScalar() && !entry.second.IsNull()) {
            return Result<void>::Err(ErrorKind::Config,
                fmt::format("{}: value of '{}' must be a scalar", path.string(), key));
        }
        std::string value = entry.second.IsNull() ? "" : entry.second.as<std::string>();
        auto r = apply_setting(settings, key, value);
        if (r.is_err()) {
            return Result<void>::Err(ErrorKind::Config,
                fmt::format("{}: {}", path.string(), r.error));
        }
    }
    return Result<void>::Ok();
}

Result<void> apply_settings_env(ProxySettings& settings, const EnvLookup& lookup) {
    EnvLookup get = lookup ? lookup : EnvLookup([](const char* name) { return std::getenv(name); });

    for (const auto& key : SETTING_KEYS) {
        std::string name = "PROXY_";
        for (char c : key) name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        const char* value = get(name.c_str());
        if (!value) continue;

        auto r = apply_setting(settings, key, value);
        if (r.is_err()) {
            return Result<void>::Err(ErrorKind::Config, fmt::format("{}: {}", name, r.error));
        }
    }
    return Result<void>::Ok();
}

Result<void> validate_settings(const ProxySettings& s) {
    if (s.ssh_host_alias && s.ssh_host) {
        return Result<void>::Err(ErrorKind::Config,
            "ssh_host_alias and ssh_host are mutually exclusive");
    }
    if (!s.ssh_host_alias && !s.ssh_host) {
        return Result<void>::Err(ErrorKind::Config,
            "One of ssh_host_alias or ssh_host is required");
    }
    if (s.ssh_host_alias && s.ssh_port) {
        return Result<void>::Err(ErrorKind::Config,
            "ssh_port cannot be used with ssh_host_alias; set Port in the SSH config instead");
    }
    if (s.ssh_host && !s.ssh_username) {
        return Result<void>::Err(ErrorKind::Config,
            "ssh_username is required when using ssh_host");
    }
    if (trimmed(s.data_path).empty()) {
        return Result<void>::Err(ErrorKind::Config, "data_path is required");
    }
    if (s.local_port == s.listen_port) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("local_port and listen_port must differ (both {})", s.local_port));
    }
    if (s.remote_server_command.find("{port}") == std::string::npos) {
        return Result<void>::Err(ErrorKind::Config,
            "remote_server_command must contain {port}");
    }
    if (s.ssh_timeout == 0) {
        return Result<void>::Err(ErrorKind::Config, "ssh_timeout must be positive");
    }
    return Result<void>::Ok();
}
