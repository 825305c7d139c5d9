#include "ssh_config.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fnmatch.h>
#include <fstream>

// ── Line parsing ──────────────────────────────────────────────

// Split "Keyword value", "Keyword=value" or "Keyword = value".
static bool split_keyword(const std::string& line, std::string& keyword, std::string& value) {
    size_t end = line.find_first_of(" \t=");
    if (end == std::string::npos) {
        keyword = line;
        value.clear();
        return !keyword.empty();
    }
    keyword = line.substr(0, end);

    size_t pos = line.find_first_not_of(" \t", end);
    if (pos != std::string::npos && line[pos] == '=') {
        pos = line.find_first_not_of(" \t", pos + 1);
    }
    value = (pos == std::string::npos) ? "" : line.substr(pos);
    trim(value);
    return !keyword.empty();
}

// Whitespace-separated arguments, honouring double quotes.
static std::vector<std::string> split_args(const std::string& value) {
    std::vector<std::string> args;
    std::string cur;
    bool in_quotes = false;
    bool have_token = false;

    for (char c : value) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have_token) args.push_back(cur);
            cur.clear();
            have_token = false;
        } else {
            cur += c;
            have_token = true;
        }
    }
    if (have_token) args.push_back(cur);
    return args;
}

static std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        return value.substr(1, value.size() - 2);
    return value;
}

// ── SshHostOptions ────────────────────────────────────────────

std::optional<std::string> SshHostOptions::get(const std::string& keyword) const {
    auto it = values.find(to_lower(keyword));
    if (it == values.end()) return std::nullopt;
    return it->second;
}

// ── SshConfigFile ─────────────────────────────────────────────

SshConfigFile SshConfigFile::parse(std::istream& in) {
    SshConfigFile cfg;
    // Options before the first Host line apply to every host
    Block current;
    current.patterns = {"*"};
    bool implicit = true;

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::string keyword, value;
        if (!split_keyword(line, keyword, value)) continue;
        keyword = to_lower(keyword);

        if (keyword == "host" || keyword == "match") {
            if (!implicit || !current.entries.empty()) {
                cfg.blocks_.push_back(std::move(current));
            }
            current = Block{};
            implicit = false;
            current.is_match = (keyword == "match");
            if (!current.is_match) current.patterns = split_args(value);
            continue;
        }

        current.entries.emplace_back(keyword, unquote(value));
    }
    if (!implicit || !current.entries.empty()) {
        cfg.blocks_.push_back(std::move(current));
    }
    return cfg;
}

Result<SshConfigFile> SshConfigFile::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<SshConfigFile>::Ok(SshConfigFile{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<SshConfigFile>::Err(ErrorKind::Config,
            fmt::format("Cannot read SSH config {}", path.string()));
    }
    return Result<SshConfigFile>::Ok(parse(in));
}

SshHostOptions SshConfigFile::lookup(const std::string& host) const {
    SshHostOptions opts;
    for (const auto& block : blocks_) {
        if (block.is_match) continue;
        if (!host_patterns_match(block.patterns, host)) continue;

        for (const auto& [key, value] : block.entries) {
            if (key == "identityfile") {
                opts.identity_files.push_back(value);
            } else if (opts.values.find(key) == opts.values.end()) {
                opts.values[key] = value;
            }
        }
    }
    return opts;
}

bool host_patterns_match(const std::vector<std::string>& patterns, const std::string& host) {
    bool matched = false;
    for (const auto& pattern : patterns) {
        if (pattern.empty()) continue;
        bool negated = pattern[0] == '!';
        std::string p = negated ? pattern.substr(1) : pattern;
        bool hit = fnmatch(p.c_str(), host.c_str(), FNM_CASEFOLD) == 0;
        if (hit && negated) return false;
        if (hit) matched = true;
    }
    return matched;
}

fs::path default_ssh_config_path() {
    return platform::home_dir() / ".ssh" / "config";
}

// ── Token expansion ───────────────────────────────────────────

static std::string expand_tokens(const std::string& value, const std::string& host,
                                 const std::string& user, int port) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%' || i + 1 >= value.size()) {
            out += value[i];
            continue;
        }
        char t = value[++i];
        switch (t) {
        case '%': out += '%'; break;
        case 'h': out += host; break;
        case 'r':
        case 'u': out += user; break;
        case 'p': out += std::to_string(port); break;
        case 'd': out += platform::home_dir().string(); break;
        default:  out += '%'; out += t; break;
        }
    }
    return out;
}

static std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) return (platform::home_dir() / path.substr(2)).string();
    return path;
}

// ── SshConfigResolver ─────────────────────────────────────────

SshConfigResolver::SshConfigResolver(fs::path config_path)
    : config_path_(std::move(config_path)) {}

Result<ConnectionSpec> SshConfigResolver::resolve_alias(const std::string& alias) const {
    if (trimmed(alias).empty()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config, "Empty SSH host alias");
    }

    std::error_code ec;
    if (!fs::exists(config_path_, ec)) {
        ds_warn(fmt::format("No SSH config file found at {}", config_path_.string()));
    }

    auto loaded = SshConfigFile::load(config_path_);
    if (loaded.is_err()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config, loaded.error);
    }
    SshHostOptions opts = loaded.value.lookup(alias);

    ConnectionSpec spec;
    spec.from_ssh_config = true;
    spec.alias = alias;

    spec.port = 22;
    if (auto port = opts.get("port")) {
        spec.port = parse_port(*port);
        if (spec.port < 0) {
            return Result<ConnectionSpec>::Err(ErrorKind::Config,
                fmt::format("Invalid Port '{}' for host {}", *port, alias));
        }
    }

    spec.username = opts.get("user").value_or(platform::current_user());
    spec.username = expand_tokens(spec.username, alias, "", spec.port);

    spec.hostname = expand_tokens(opts.get("hostname").value_or(alias), alias,
                                  spec.username, spec.port);

    if (!opts.identity_files.empty()) {
        spec.key_path = expand_home(expand_tokens(opts.identity_files.front(), spec.hostname,
                                                  spec.username, spec.port));
    }

    if (spec.hostname.empty()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config,
            fmt::format("No hostname resolved for alias {}", alias));
    }
    if (spec.username.empty()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config,
            fmt::format("No username resolved for alias {}", alias));
    }

    return Result<ConnectionSpec>::Ok(spec);
}

Result<ConnectionSpec> SshConfigResolver::resolve_explicit(const std::string& hostname,
                                                           const std::string& username,
                                                           const std::optional<std::string>& key_path,
                                                           int port) const {
    if (trimmed(hostname).empty()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config, "SSH hostname is required");
    }
    if (trimmed(username).empty()) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config, "SSH username is required");
    }
    if (port < 1 || port > 65535) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config,
            fmt::format("Invalid SSH port {}", port));
    }

    ConnectionSpec spec;
    spec.hostname = hostname;
    spec.username = username;
    if (key_path && !key_path->empty()) spec.key_path = expand_home(*key_path);
    spec.port = port;
    spec.from_ssh_config = false;
    return Result<ConnectionSpec>::Ok(spec);
}

Result<ConnectionSpec> SshConfigResolver::resolve(const ProxySettings& settings) const {
    if (settings.ssh_host_alias) {
        ds_log(fmt::format("Using SSH config alias: {}", *settings.ssh_host_alias));
        return resolve_alias(*settings.ssh_host_alias);
    }

    if (!settings.ssh_host || !settings.ssh_username) {
        return Result<ConnectionSpec>::Err(ErrorKind::Config,
            "Either an SSH host alias or an explicit host and username is required");
    }

    ds_log("Using direct SSH parameters");
    return resolve_explicit(*settings.ssh_host, *settings.ssh_username,
                            settings.ssh_key_path, settings.ssh_port.value_or(DEFAULT_SSH_PORT));
}
