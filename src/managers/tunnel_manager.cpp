#include "tunnel_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <cerrno>
#include <vector>

// ── Lifecycle ─────────────────────────────────────────────

TunnelManager::TunnelManager() = default;

TunnelManager::~TunnelManager() {
    stop();
}

Result<TunnelState> TunnelManager::start(const ConnectionSpec& spec, int local_port,
                                         int remote_port, const TunnelOptions& options) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (listen_fd_ >= 0 || session_) {
        return Result<TunnelState>::Err(ErrorKind::Tunnel, "Tunnel already started");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = TunnelState{};
        state_.local_port = local_port;
        state_.remote_port = remote_port;
        state_.bind_address = LOOPBACK_ADDR;
    }
    stop_.store(false);

    // Listening socket on loopback
    auto listener = platform::listen_tcp(LOOPBACK_ADDR, local_port, LISTEN_BACKLOG);
    if (listener.is_err()) {
        ds_error(fmt::format("Tunnel: {}", listener.error));
        release(TunnelStatus::Failed);
        return Result<TunnelState>::Err(ErrorKind::Tunnel, listener.error);
    }
    listen_fd_ = listener.value;
    int bound = platform::bound_port(listen_fd_);

    // Authenticated SSH session
    SessionTarget target;
    target.host = spec.hostname;
    target.user = spec.username;
    target.port = spec.port;
    target.timeout = options.timeout_secs;
    target.ssh_key_path = spec.key_path;
    target.strict_host_key_checking = options.strict_host_key_checking;

    session_ = std::make_unique<SessionManager>(target);
    auto result = session_->establish([](const std::string& msg) {
        ds_debug("Tunnel: " + msg);
    });
    if (result.failed()) {
        std::string err = fmt::format("SSH connection to {}@{}:{} failed: {}",
                                      spec.username, spec.hostname, spec.port, result.stderr_data);
        ds_error("Tunnel: " + err);
        release(TunnelStatus::Failed);
        return Result<TunnelState>::Err(ErrorKind::Tunnel, err);
    }

    accept_thread_ = std::thread(&TunnelManager::accept_loop, this);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.local_port = bound > 0 ? bound : local_port;
    }
    set_status(TunnelStatus::Active);
    TunnelState snapshot = state();

    ds_log(fmt::format("Tunnel: {}:{} -> {}:{} via {} ready",
                       snapshot.bind_address, snapshot.local_port,
                       LOOPBACK_ADDR, remote_port, session_->get_target()));
    return Result<TunnelState>::Ok(snapshot);
}

void TunnelManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (listen_fd_ < 0 && !session_ && !accept_thread_.joinable()) {
        return;   // never started, or already stopped
    }

    release(TunnelStatus::Stopped);
    ds_log(fmt::format("Tunnel: {}", tunnel_status_name(state().status)));
}

// Tear down in order: forwarded channels, listening socket, SSH session.
void TunnelManager::release(TunnelStatus final_status) {
    stop_.store(true);

    if (accept_thread_.joinable()) accept_thread_.join();

    {
        std::lock_guard<std::mutex> lock(forwards_mutex_);
        for (auto& f : forwards_) {
            if (f->thread.joinable()) f->thread.join();
        }
        forwards_.clear();
    }

    if (listen_fd_ >= 0) {
        platform::close_socket(listen_fd_);
        listen_fd_ = -1;
    }

    if (session_) {
        session_->close();
        session_.reset();
    }

    set_status(final_status);
}

TunnelState TunnelManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

SessionManager* TunnelManager::session() {
    return (session_ && session_->is_active()) ? session_.get() : nullptr;
}

size_t TunnelManager::active_connections() {
    std::lock_guard<std::mutex> lock(forwards_mutex_);
    size_t n = 0;
    for (auto& f : forwards_) {
        if (!f->done.load()) ++n;
    }
    return n;
}

void TunnelManager::set_status(TunnelStatus status) {
    TunnelStatus previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_.status;
        state_.status = status;
    }
    if (previous != status) {
        ds_debug(fmt::format("Tunnel: {} -> {}", tunnel_status_name(previous),
                             tunnel_status_name(status)));
    }
}

// ── Accept loop ───────────────────────────────────────────

void TunnelManager::reap_finished_forwards() {
    std::lock_guard<std::mutex> lock(forwards_mutex_);
    for (auto it = forwards_.begin(); it != forwards_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = forwards_.erase(it);
        } else {
            ++it;
        }
    }
}

void TunnelManager::accept_loop() {
    int remote_port = state().remote_port;

    while (!stop_.load()) {
        // Accept with timeout so we can check stop flag
        struct pollfd pfd = {listen_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, ACCEPT_POLL_MS);
        reap_finished_forwards();
        // libssh2 only sends when the keepalive interval has elapsed
        session_->send_keepalive();
        if (pr <= 0) continue;

        int client = accept(listen_fd_, nullptr, nullptr);
        if (client < 0) continue;

        std::string err;
        LIBSSH2_CHANNEL* ch = session_->open_direct_tcpip(LOOPBACK_ADDR, remote_port, &err);
        if (!ch) {
            ds_warn(fmt::format("Tunnel: direct-tcpip to {}:{} failed: {}",
                                LOOPBACK_ADDR, remote_port, err));
            platform::close_socket(client);
            continue;
        }

        auto fwd = std::make_unique<Forward>();
        Forward* raw = fwd.get();
        std::lock_guard<std::mutex> lock(forwards_mutex_);
        forwards_.push_back(std::move(fwd));
        raw->thread = std::thread(&TunnelManager::forward_connection, this, client, ch, raw);
    }
}

// ── Forwarding ────────────────────────────────────────────

// Pump bytes between a local TCP socket and a direct-tcpip channel until
// either side closes or stop is requested.
void TunnelManager::forward_connection(int client_fd, LIBSSH2_CHANNEL* ch, Forward* self) {
    std::vector<char> buf(FORWARD_BUF_SIZE);
    auto mtx = session_->io_mutex();
    int ssh_sock = session_->get_socket();
    bool channel_had_data = false;

    while (!stop_.load()) {
        struct pollfd pfds[2] = {
            {client_fd, POLLIN, 0},
            {ssh_sock, POLLIN, 0},
        };
        // libssh2 may already hold buffered data for this channel
        int pr = poll(pfds, 2, channel_had_data ? 0 : FORWARD_POLL_MS);
        if (pr < 0 && errno != EINTR) break;

        // local → channel
        if (pr > 0 && (pfds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(client_fd, buf.data(), buf.size());
            if (n <= 0) break;  // client closed

            ssize_t sent = 0;
            bool failed = false;
            while (sent < n && !stop_.load()) {
                ssize_t w;
                {
                    std::lock_guard<std::mutex> lock(*mtx);
                    w = libssh2_channel_write(ch, buf.data() + sent, static_cast<size_t>(n - sent));
                }
                if (w == LIBSSH2_ERROR_EAGAIN) {
                    platform::sleep_ms(1);
                    continue;
                }
                if (w < 0) { failed = true; break; }
                sent += w;
            }
            if (failed) break;
        }

        // channel → local (non-blocking read)
        ssize_t n;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*mtx);
            n = libssh2_channel_read(ch, buf.data(), buf.size());
            eof = libssh2_channel_eof(ch);
        }
        channel_had_data = n > 0;
        if (n > 0) {
            if (!platform::send_all(client_fd, buf.data(), static_cast<size_t>(n))) break;
        } else if (n == LIBSSH2_ERROR_EAGAIN) {
            if (eof) break;
        } else {
            break;  // remote closed or channel error
        }
    }

    session_->close_channel(ch);
    platform::close_socket(client_fd);
    self->done.store(true);
}
