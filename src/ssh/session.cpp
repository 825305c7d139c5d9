#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <chrono>
#include <cstring>
#include <mutex>
#include <vector>

using Clock = std::chrono::steady_clock;

static std::once_flag g_libssh2_init;
static int g_libssh2_init_rc = 0;

static Clock::time_point deadline_after(int secs) {
    return Clock::now() + std::chrono::seconds(secs);
}

static std::string session_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

// Repeat a non-blocking libssh2 call under the io mutex while it reports
// EAGAIN, up to the deadline. Returns the last result.
template <typename Fn>
static int retry_while_eagain(std::mutex& mtx, Clock::time_point deadline, Fn call) {
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            rc = call();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) return rc;
        platform::sleep_ms(10);
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    return establish_connection(callback);
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (session_ || sock_ >= 0) {
        return SSHResult{-1, "", "Session already established"};
    }

    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    std::call_once(g_libssh2_init, [] { g_libssh2_init_rc = libssh2_init(0); });
    if (g_libssh2_init_rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto conn = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (conn.is_err()) {
        return SSHResult{-1, "", conn.error};
    }
    sock_ = conn.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("init failed");
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    auto deadline = deadline_after(target_.timeout);
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) break;
        platform::sleep_ms(10);
    }
    if (ret != 0) {
        std::string err = (ret == LIBSSH2_ERROR_EAGAIN)
            ? fmt::format("SSH handshake timed out after {}s", target_.timeout)
            : "SSH handshake failed: " + session_error(session_);
        teardown("Handshake failed");
        return SSHResult{-1, "", err};
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    auto host_key = verify_host_key(callback);
    if (host_key.failed()) {
        teardown("Host key rejected");
        return host_key;
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_str_);
    }

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::verify_host_key(StatusCallback callback) {
    size_t key_len = 0;
    int key_type = 0;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (!key) {
        return SSHResult{-1, "", "Server did not provide a host key"};
    }

    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        std::string hex;
        for (int i = 0; i < 32; ++i) {
            hex += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
        }
        ds_debug(fmt::format("Host key SHA256 for {}: {}", target_.host, hex));
    }

    if (!target_.strict_host_key_checking) {
        return SSHResult{0, "", ""};
    }

    if (callback) callback("Checking host key against known_hosts...");

    std::filesystem::path known = target_.known_hosts_path.empty()
        ? platform::home_dir() / ".ssh" / "known_hosts"
        : target_.known_hosts_path;

    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session_);
    if (!hosts) {
        return SSHResult{-1, "", "Failed to initialise known_hosts check"};
    }
    if (libssh2_knownhost_readfile(hosts, known.string().c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(hosts);
        return SSHResult{-1, "", "Cannot read known hosts file " + known.string()};
    }

    struct libssh2_knownhost* entry = nullptr;
    int check = libssh2_knownhost_checkp(hosts, target_.host.c_str(), target_.port,
                                         key, key_len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                         &entry);
    libssh2_knownhost_free(hosts);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return SSHResult{0, "", ""};
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return SSHResult{-1, "", "Host key for " + target_.host + " does not match known_hosts"};
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return SSHResult{-1, "", "Host " + target_.host + " is not in " + known.string()};
    default:
        return SSHResult{-1, "", "Host key check failed for " + target_.host};
    }
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    auto deadline = deadline_after(target_.timeout);

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return SSHResult{0, "", ""};   // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) {
            break;
        }
        platform::sleep_ms(10);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }
    if (!methods.empty() && methods.find("publickey") == std::string::npos) {
        return SSHResult{-1, "", "Server does not accept public key authentication (offers: " + methods + ")"};
    }

    if (target_.ssh_key_path) {
        if (callback) callback("Using key " + *target_.ssh_key_path);
        if (auth_with_key_file(*target_.ssh_key_path)) {
            return SSHResult{0, "", ""};
        }
        return SSHResult{-1, "", fmt::format("Public key authentication failed for {} with {}: {}",
                                             target_.user, *target_.ssh_key_path,
                                             session_error(session_))};
    }

    if (auth_with_agent(callback)) {
        return SSHResult{0, "", ""};
    }

    auto ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : {"id_ed25519", "id_ecdsa", "id_rsa"}) {
        auto path = ssh_dir / name;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        if (callback) callback("Trying key " + path.string());
        if (auth_with_key_file(path.string())) {
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed for " + target_.user + " (no usable key)"};
}

bool SessionManager::auth_with_key_file(const std::string& path) {
    auto deadline = deadline_after(target_.timeout);
    int rc;
    while ((rc = libssh2_userauth_publickey_fromfile_ex(
                session_, target_.user.c_str(), static_cast<unsigned int>(target_.user.length()),
                nullptr, path.c_str(), "")) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) return false;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        ds_debug(fmt::format("Key {} rejected: {}", path, session_error(session_)));
    }
    return rc == 0;
}

bool SessionManager::auth_with_agent(StatusCallback callback) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) return false;

    bool ok = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (!ok && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            if (callback) callback(fmt::format("Trying agent key {}", identity->comment ? identity->comment : ""));

            auto deadline = deadline_after(target_.timeout);
            int rc;
            while ((rc = libssh2_agent_userauth(agent, target_.user.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN) {
                if (Clock::now() >= deadline) break;
                platform::sleep_ms(10);
            }
            ok = (rc == 0);
            prev = identity;
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}

SSHResult SessionManager::exec(const std::string& command, int timeout_secs) {
    if (!session_ || !active_) {
        return SSHResult{-1, "", "No SSH session"};
    }

    // Open a new exec channel (no PTY)
    LIBSSH2_CHANNEL* ch = nullptr;
    auto open_deadline = deadline_after(target_.timeout);
    while (Clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return SSHResult{-1, "", "Failed to open exec channel: " + session_error(session_)};
            }
        }
        if (ch) break;
        platform::sleep_ms(10);
    }
    if (!ch) {
        return SSHResult{-1, "", "Timed out opening exec channel"};
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    auto exec_deadline = deadline_after(target_.timeout);
    while (Clock::now() < exec_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(ch, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        close_channel(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Drain stdout and stderr together so neither window stalls
    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = deadline_after(effective_timeout);

    while (Clock::now() < deadline) {
        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) err.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch);
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            close_channel(ch);
            return SSHResult{-1, out, "SSH channel read error"};
        }
        if (eof && n_out <= 0 && n_err <= 0) {
            timed_out = false;
            break;
        }
        if (n_out <= 0 && n_err <= 0) platform::sleep_ms(10);
    }

    if (timed_out) {
        close_channel(ch);
        return SSHResult{-1, out, fmt::format("Command timed out after {}s", effective_timeout)};
    }

    int exit_status = -1;
    auto close_deadline = deadline_after(target_.timeout);
    rc = retry_while_eagain(*io_mutex_, close_deadline, [&] { return libssh2_channel_close(ch); });
    if (rc == 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    rc = retry_while_eagain(*io_mutex_, close_deadline, [&] { return libssh2_channel_free(ch); });
    if (rc == LIBSSH2_ERROR_EAGAIN) {
        ds_warn("SSH: exec channel not freed before timeout; released with the session");
    }

    return SSHResult{exit_status, out, err};
}

LIBSSH2_CHANNEL* SessionManager::open_direct_tcpip(const std::string& host, int port,
                                                   std::string* error) {
    if (!session_ || !active_) {
        if (error) *error = "No SSH session";
        return nullptr;
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = deadline_after(target_.timeout);
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_direct_tcpip_ex(session_, host.c_str(), port, LOOPBACK_ADDR, 0);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                if (error) *error = session_error(session_);
                return nullptr;
            }
        }
        if (ch) return ch;
        platform::sleep_ms(10);
    }
    if (error) *error = fmt::format("Timed out opening channel to {}:{}", host, port);
    return nullptr;
}

// Close and free a channel. The peer has to confirm the close before
// libssh2 will free it, so both steps are retried until the session timeout.
// A channel still held after that is freed by close().
void SessionManager::close_channel(LIBSSH2_CHANNEL* channel) {
    if (!channel) return;
    auto deadline = deadline_after(target_.timeout);
    int rc = retry_while_eagain(*io_mutex_, deadline, [&] { return libssh2_channel_close(channel); });
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        ds_debug(fmt::format("SSH: channel close returned {}", rc));
    }
    rc = retry_while_eagain(*io_mutex_, deadline, [&] { return libssh2_channel_free(channel); });
    if (rc == LIBSSH2_ERROR_EAGAIN) {
        ds_warn("SSH: channel not freed before timeout; released with the session");
    }
}

// Disconnect and free in blocking mode, bounded by the session timeout, so
// libssh2 waits for pending channel closes instead of returning EAGAIN.
// Caller holds the io mutex.
void SessionManager::free_session(const char* reason) {
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_disconnect(session_, reason);
    int rc = libssh2_session_free(session_);
    if (rc != 0) {
        ds_warn(fmt::format("SSH: session free returned {}", rc));
    }
    session_ = nullptr;
}

// Unwinds a failed establish(). No channel has been opened yet, so the
// non-blocking free has nothing to wait for.
void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (session_) free_session("Normal disconnection");
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SessionManager::is_active() const {
    return active_;
}

void SessionManager::send_keepalive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (session_ && active_) {
        int seconds_to_next = 0;
        libssh2_keepalive_send(session_, &seconds_to_next);
    }
}
