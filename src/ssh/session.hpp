#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <filesystem>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionTarget {
    std::string host;
    std::string user;
    int port = 22;
    int timeout = 30;                             // seconds, per connect/handshake/auth step
    std::optional<std::string> ssh_key_path;
    bool strict_host_key_checking = false;
    std::filesystem::path known_hosts_path;       // empty = ~/.ssh/known_hosts
};

// One authenticated libssh2 session. The session runs in non-blocking
// mode; every libssh2 call is made under io_mutex() so channels can be
// driven from several threads at once.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // TCP connect, handshake, host key check and key-based auth.
    // On failure everything acquired so far is released.
    SSHResult establish(StatusCallback callback = nullptr);
    // Disconnect and release the session, any channels still open on it and
    // the socket. Safe to call more than once.
    void close();
    bool is_active() const;
    void send_keepalive();

    // Run a command on a fresh exec channel and wait for it to exit.
    SSHResult exec(const std::string& command, int timeout_secs);

    // Open a direct-tcpip channel to host:port as seen from the server.
    // Caller owns the channel and releases it with close_channel().
    LIBSSH2_CHANNEL* open_direct_tcpip(const std::string& host, int port,
                                       std::string* error = nullptr);
    void close_channel(LIBSSH2_CHANNEL* channel);

    int get_socket() const { return sock_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult verify_host_key(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    bool auth_with_key_file(const std::string& path);
    bool auth_with_agent(StatusCallback callback);
    void free_session(const char* reason);
    void teardown(const char* reason);
};
