#pragma once

#include <string>
#include <list>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <core/types.hpp>
#include <ssh/session.hpp>

struct TunnelOptions {
    int timeout_secs = 30;
    bool strict_host_key_checking = false;
};

// Local port forward: 127.0.0.1:local_port -> (SSH) -> 127.0.0.1:remote_port
// on the remote host. One accept thread, one thread per forwarded
// connection, all sharing a single SSH session.
class TunnelManager {
public:
    TunnelManager();
    ~TunnelManager();

    TunnelManager(const TunnelManager&) = delete;
    TunnelManager& operator=(const TunnelManager&) = delete;

    // Bind the local port, open and authenticate the SSH session, start
    // accepting. Any failure unwinds what was acquired and returns a
    // TunnelError; the state is then Failed.
    Result<TunnelState> start(const ConnectionSpec& spec, int local_port, int remote_port,
                              const TunnelOptions& options = {});

    // Close forwarded channels, the listening socket and the session.
    // Safe to call repeatedly and before start().
    void stop();

    TunnelState state() const;

    // The authenticated session, or nullptr when not active. Shared with the
    // remote process controller.
    SessionManager* session();

    // Number of forwarded connections currently open.
    size_t active_connections();

private:
    struct Forward {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    std::unique_ptr<SessionManager> session_;
    int listen_fd_ = -1;
    std::atomic<bool> stop_{false};
    std::thread accept_thread_;

    std::mutex forwards_mutex_;
    std::list<std::unique_ptr<Forward>> forwards_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex state_mutex_;
    TunnelState state_;

    void accept_loop();
    void forward_connection(int client_fd, LIBSSH2_CHANNEL* channel, Forward* self);
    void reap_finished_forwards();
    void release(TunnelStatus final_status);
    void set_status(TunnelStatus status);
};
