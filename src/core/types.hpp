#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstdint>

// Which layer an error came from. Startup treats Config and Tunnel as fatal;
// RemoteCommand is logged only; ProxyUpstream stays inside one request.
enum class ErrorKind {
    None,
    Config,
    Tunnel,
    RemoteCommand,
    ProxyUpstream,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:          return "Error";
    case ErrorKind::Config:        return "ConfigError";
    case ErrorKind::Tunnel:        return "TunnelError";
    case ErrorKind::RemoteCommand: return "RemoteCommandError";
    case ErrorKind::ProxyUpstream: return "ProxyUpstreamError";
    }
    return "Error";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::None};
    }

    static Result<T> Err(ErrorKind k, const std::string& err) {
        return {false, T{}, err, k};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::None};
    }

    static Result<void> Err(ErrorKind k, const std::string& err) {
        return {false, err, k};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Resolved SSH endpoint. Built once at startup, read-only afterwards.
struct ConnectionSpec {
    std::string hostname;
    std::string username;
    std::optional<std::string> key_path;
    int port = 22;
    bool from_ssh_config = false;   // alias lookup was used
    std::string alias;
};

enum class TunnelStatus {
    Unstarted,
    Active,
    Stopped,
    Failed,
};

struct TunnelState {
    int local_port = 0;
    int remote_port = 0;
    std::string bind_address = "127.0.0.1";
    TunnelStatus status = TunnelStatus::Unstarted;
};

inline const char* tunnel_status_name(TunnelStatus s) {
    switch (s) {
    case TunnelStatus::Unstarted: return "unstarted";
    case TunnelStatus::Active:    return "active";
    case TunnelStatus::Stopped:   return "stopped";
    case TunnelStatus::Failed:    return "failed";
    }
    return "unknown";
}

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
