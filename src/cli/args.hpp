#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>

// Parsed command line. Flags become settings overrides keyed by their
// settings name, applied after the YAML file and PROXY_* environment.
struct CliOptions {
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool alias_given = false;
    bool host_given = false;
};

// Errors are usage errors (the caller exits with status 2).
Result<CliOptions> parse_args(int argc, const char* const* argv);

// Overlay the command line onto settings. Choosing a connection mode on the
// command line (alias or host) discards the other mode from lower layers.
Result<void> apply_cli(ProxySettings& settings, const CliOptions& options);

std::string usage_text(const std::string& program);
