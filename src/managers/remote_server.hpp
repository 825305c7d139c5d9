#pragma once

#include <string>
#include <functional>
#include <core/types.hpp>
#include <core/constants.hpp>

class SessionManager;

struct RemoteServerOptions {
    std::string server_command = DEFAULT_REMOTE_SERVER_CMD;   // {port} substituted
    std::string kill_pattern = DEFAULT_REMOTE_KILL_PATTERN;   // {port} substituted
    int timeout_secs = SSH_CMD_TIMEOUT_SECS;
};

// pkill command for stale servers on `port`. The first character of the
// pattern is bracketed so the pattern never matches the shell running it.
std::string build_kill_command(const std::string& pattern_template, int port);

// Detached launch: cd into data_path, start the server with stdio on
// /dev/null under nohup, print the background pid.
std::string build_launch_command(const std::string& data_path,
                                 const std::string& command_template, int port);

// Keeps exactly one remote file server on the remote port. Best effort:
// nothing here is fatal to the service, and the launched process is not
// tracked after launch.
class RemoteServerController {
public:
    using ExecFn = std::function<SSHResult(const std::string& command, int timeout_secs)>;

    explicit RemoteServerController(RemoteServerOptions options = {});

    // Kill any stale instance, then launch a fresh one. Returns a
    // RemoteCommandError when the launch could not be confirmed.
    Result<void> ensure_remote_server(SessionManager& session,
                                      const std::string& data_path, int remote_port);
    Result<void> ensure_remote_server(const ExecFn& exec,
                                      const std::string& data_path, int remote_port);

private:
    RemoteServerOptions options_;

    void kill_stale(const ExecFn& exec, int remote_port);
};
