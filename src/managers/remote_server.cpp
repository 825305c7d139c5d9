#include "remote_server.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <cctype>

static std::string substitute_port(const std::string& tmpl, int port) {
    return replace_all(tmpl, "{port}", std::to_string(port));
}

std::string build_kill_command(const std::string& pattern_template, int port) {
    std::string pattern = substitute_port(pattern_template, port);
    if (!pattern.empty() && std::isalnum(static_cast<unsigned char>(pattern[0]))) {
        pattern = "[" + pattern.substr(0, 1) + "]" + pattern.substr(1);
    }
    return "pkill -f -- " + shell_quote(pattern);
}

std::string build_launch_command(const std::string& data_path,
                                 const std::string& command_template, int port) {
    return fmt::format("cd {} || exit 1; nohup {} > /dev/null 2>&1 < /dev/null & echo $!",
                       shell_quote(data_path), substitute_port(command_template, port));
}

RemoteServerController::RemoteServerController(RemoteServerOptions options)
    : options_(std::move(options)) {}

Result<void> RemoteServerController::ensure_remote_server(SessionManager& session,
                                                         const std::string& data_path,
                                                         int remote_port) {
    ExecFn exec = [&session](const std::string& cmd, int timeout) {
        return session.exec(cmd, timeout);
    };
    return ensure_remote_server(exec, data_path, remote_port);
}

Result<void> RemoteServerController::ensure_remote_server(const ExecFn& exec,
                                                         const std::string& data_path,
                                                         int remote_port) {
    kill_stale(exec, remote_port);

    std::string cmd = build_launch_command(data_path, options_.server_command, remote_port);
    ds_debug("Remote: " + cmd);
    SSHResult r = exec(cmd, options_.timeout_secs);

    if (r.failed()) {
        std::string detail = trimmed(r.stderr_data);
        if (r.exit_code == 1 && detail.empty()) detail = "cannot cd into " + data_path;
        std::string err = fmt::format("Failed to launch remote file server on port {} (exit {}): {}",
                                      remote_port, r.exit_code, detail);
        ds_warn(fmt::format("{}: {}", error_kind_name(ErrorKind::RemoteCommand), err));
        return Result<void>::Err(ErrorKind::RemoteCommand, err);
    }

    std::string pid = trimmed(r.stdout_data);
    ds_log(fmt::format("Remote file server launched in {} on port {}{}", data_path, remote_port,
                       pid.empty() ? "" : " (pid " + pid + ")"));
    return Result<void>::Ok();
}

void RemoteServerController::kill_stale(const ExecFn& exec, int remote_port) {
    std::string cmd = build_kill_command(options_.kill_pattern, remote_port);
    ds_debug("Remote: " + cmd);
    SSHResult r = exec(cmd, options_.timeout_secs);

    // pkill: 0 = killed something, 1 = nothing matched
    switch (r.exit_code) {
    case 0:
        ds_log(fmt::format("Remote: terminated stale file server on port {}", remote_port));
        break;
    case 1:
        ds_debug(fmt::format("Remote: no stale file server on port {}", remote_port));
        break;
    case 127:
        ds_warn(fmt::format("{}: pkill not available on remote host, stale server not checked",
                            error_kind_name(ErrorKind::RemoteCommand)));
        break;
    default:
        ds_warn(fmt::format("{}: stale server cleanup failed (exit {}): {}",
                            error_kind_name(ErrorKind::RemoteCommand), r.exit_code,
                            trimmed(r.get_output())));
        break;
    }
}
