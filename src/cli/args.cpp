#include "args.hpp"
#include <fmt/format.h>
#include <map>

namespace {

struct FlagSpec {
    const char* setting;   // settings key, or nullptr for flags handled here
    bool takes_value;
};

const std::map<std::string, FlagSpec>& flag_table() {
    static const std::map<std::string, FlagSpec> table{
        {"--ssh-host-alias",           {"ssh_host_alias", true}},
        {"--ssh-host",                 {"ssh_host", true}},
        {"--ssh-username",             {"ssh_username", true}},
        {"--ssh-key-path",             {"ssh_key_path", true}},
        {"--ssh-port",                 {"ssh_port", true}},
        {"--data-path",                {"data_path", true}},
        {"--local-port",               {"local_port", true}},
        {"--remote-port",              {"remote_port", true}},
        {"--fastapi-port",             {"listen_port", true}},
        {"--listen-port",              {"listen_port", true}},
        {"--listen-host",              {"listen_host", true}},
        {"--readiness-timeout",        {"readiness_timeout", true}},
        {"--log-file",                 {"log_file", true}},
        {"--strict-host-key-checking", {"strict_host_key_checking", false}},
        {"--verbose",                  {"verbose", false}},
        {"--config",                   {nullptr, true}},
        {"--help",                     {nullptr, false}},
        {"--version",                  {nullptr, false}},
    };
    return table;
}

} // namespace

Result<CliOptions> parse_args(int argc, const char* const* argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = arg;
        std::optional<std::string> inline_value;

        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }
        if (name == "-h") name = "--help";

        auto it = flag_table().find(name);
        if (it == flag_table().end()) {
            return Result<CliOptions>::Err(ErrorKind::Config,
                fmt::format("unrecognized argument: {}", arg));
        }
        const FlagSpec& spec = it->second;

        std::string value;
        if (spec.takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                return Result<CliOptions>::Err(ErrorKind::Config,
                    fmt::format("argument {}: expected one argument", name));
            }
        } else if (inline_value) {
            return Result<CliOptions>::Err(ErrorKind::Config,
                fmt::format("argument {}: ignored explicit argument '{}'", name, *inline_value));
        } else {
            value = "true";
        }

        if (name == "--help") { opts.show_help = true; continue; }
        if (name == "--version") { opts.show_version = true; continue; }
        if (name == "--config") { opts.config_path = value; continue; }

        if (name == "--ssh-host-alias") opts.alias_given = true;
        if (name == "--ssh-host") opts.host_given = true;
        if (opts.alias_given && opts.host_given) {
            return Result<CliOptions>::Err(ErrorKind::Config,
                "argument --ssh-host: not allowed with argument --ssh-host-alias");
        }

        opts.overrides.emplace_back(spec.setting, value);
    }

    return Result<CliOptions>::Ok(opts);
}

Result<void> apply_cli(ProxySettings& settings, const CliOptions& options) {
    if (options.alias_given) {
        settings.ssh_host.reset();
        settings.ssh_username.reset();
        settings.ssh_key_path.reset();
        settings.ssh_port.reset();   // alias mode takes Port from the SSH config
    }
    if (options.host_given) {
        settings.ssh_host_alias.reset();
    }

    for (const auto& [key, value] : options.overrides) {
        auto r = apply_setting(settings, key, value);
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

std::string usage_text(const std::string& program) {
    return fmt::format(
        "Usage: {0} (--ssh-host-alias ALIAS | --ssh-host HOST --ssh-username USER)\n"
        "       {1:<{2}} --data-path PATH [options]\n"
        "\n"
        "Serve files from a remote host over an SSH tunnel as a local HTTP endpoint.\n"
        "\n"
        "Connection:\n"
        "  --ssh-host-alias ALIAS        host alias from ~/.ssh/config\n"
        "  --ssh-host HOST               SSH hostname\n"
        "  --ssh-username USER           SSH username (required with --ssh-host)\n"
        "  --ssh-key-path PATH           private key (default: agent, then ~/.ssh/id_*)\n"
        "  --ssh-port PORT               SSH port (default: 22)\n"
        "  --strict-host-key-checking    verify the host key against ~/.ssh/known_hosts\n"
        "\n"
        "Serving:\n"
        "  --data-path PATH              directory to serve on the remote host\n"
        "  --local-port PORT             local tunnel port (default: {3})\n"
        "  --remote-port PORT            remote file server port (default: {4})\n"
        "  --fastapi-port, --listen-port PORT\n"
        "                                HTTP listen port (default: {5})\n"
        "  --listen-host ADDR            HTTP listen address (default: {6})\n"
        "  --readiness-timeout SECS      wait for the remote server, 0 to skip (default: {7})\n"
        "\n"
        "General:\n"
        "  --config FILE                 YAML settings file (also PROXY_CONFIG)\n"
        "  --log-file FILE               append log lines to FILE\n"
        "  --verbose                     debug logging\n"
        "  --version                     show version\n"
        "  -h, --help                    show this help\n"
        "\n"
        "Every setting can also be given as a PROXY_<NAME> environment variable.\n",
        program, "", program.size(), DEFAULT_LOCAL_PORT, DEFAULT_REMOTE_PORT,
        DEFAULT_LISTEN_PORT, DEFAULT_LISTEN_HOST, READINESS_TIMEOUT_SECS);
}
