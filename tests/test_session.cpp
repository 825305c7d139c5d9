#include <gtest/gtest.h>
#include <ssh/session.hpp>
#include <managers/tunnel_manager.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <core/utils.hpp>
#include <sys/socket.h>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>

// ── Without a server ──────────────────────────────────────────

static SessionTarget unreachable_target() {
    auto s = platform::listen_tcp("127.0.0.1", 0, 1);
    EXPECT_TRUE(s.is_ok()) << s.error;
    int port = platform::bound_port(s.value);
    platform::close_socket(s.value);

    SessionTarget target;
    target.host = "127.0.0.1";
    target.user = "nobody";
    target.port = port;
    target.timeout = 1;
    target.ssh_key_path = "/nonexistent/id_ed25519";
    return target;
}

TEST(SessionManager, CloseBeforeEstablish) {
    SessionManager session(unreachable_target());
    session.close();
    session.close();
    EXPECT_FALSE(session.is_active());
    EXPECT_EQ(session.get_socket(), -1);
}

TEST(SessionManager, FailedEstablishReleasesSocket) {
    SessionManager session(unreachable_target());
    auto r = session.establish();
    EXPECT_TRUE(r.failed());
    EXPECT_FALSE(session.is_active());
    EXPECT_EQ(session.get_socket(), -1);
    session.close();
    EXPECT_EQ(session.get_socket(), -1);
}

TEST(SessionManager, HandshakeTimeoutReleasesSocket) {
    auto silent = platform::listen_tcp("127.0.0.1", 0, 4);
    ASSERT_TRUE(silent.is_ok()) << silent.error;
    SessionTarget target = unreachable_target();
    target.port = platform::bound_port(silent.value);

    SessionManager session(target);
    auto r = session.establish();
    EXPECT_TRUE(r.failed());
    EXPECT_NE(r.stderr_data.find("timed out"), std::string::npos) << r.stderr_data;
    EXPECT_EQ(session.get_socket(), -1);
    session.close();

    platform::close_socket(silent.value);
}

TEST(SessionManager, ChannelOperationsNeedSession) {
    SessionManager session(unreachable_target());

    std::string error;
    EXPECT_EQ(session.open_direct_tcpip("127.0.0.1", 8001, &error), nullptr);
    EXPECT_EQ(error, "No SSH session");

    auto r = session.exec("true", 5);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stderr_data, "No SSH session");

    session.close_channel(nullptr);
    session.send_keepalive();
}

// ── Against a live server ─────────────────────────────────────
//
// Set DS_TEST_SSH_HOST and DS_TEST_SSH_USER (optionally DS_TEST_SSH_PORT and
// DS_TEST_SSH_KEY) to run these against a reachable sshd that allows TCP
// forwarding. Skipped otherwise.

static std::optional<SessionTarget> live_target() {
    const char* host = std::getenv("DS_TEST_SSH_HOST");
    const char* user = std::getenv("DS_TEST_SSH_USER");
    if (!host || !user || !*host || !*user) return std::nullopt;

    SessionTarget target;
    target.host = host;
    target.user = user;
    target.timeout = 10;
    if (const char* port = std::getenv("DS_TEST_SSH_PORT")) {
        target.port = parse_port(port);
    }
    if (const char* key = std::getenv("DS_TEST_SSH_KEY")) {
        target.ssh_key_path = std::string(key);
    }
    return target;
}

TEST(SessionLive, ExecCollectsOutputAndStatus) {
    auto target = live_target();
    if (!target) GTEST_SKIP() << "DS_TEST_SSH_HOST not set";

    SessionManager session(*target);
    auto up = session.establish();
    ASSERT_TRUE(up.success()) << up.stderr_data;

    auto r = session.exec("echo out; echo err >&2; exit 3", 10);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");

    // Channels freed above leave the session usable
    EXPECT_TRUE(session.exec("true", 10).success());
    session.close();
    EXPECT_FALSE(session.is_active());
}

// Forward to the server's own sshd and read its banner. The local side
// hangs up first every time, so each channel has to be closed and freed
// before the remote end confirms.
TEST(SessionLive, TunnelForwardsAndReleasesChannels) {
    auto target = live_target();
    if (!target) GTEST_SKIP() << "DS_TEST_SSH_HOST not set";

    ConnectionSpec spec;
    spec.hostname = target->host;
    spec.username = target->user;
    spec.port = target->port;
    spec.key_path = target->ssh_key_path;

    TunnelManager tunnel;
    TunnelOptions opts;
    opts.timeout_secs = 10;
    auto started = tunnel.start(spec, 0, 22, opts);
    ASSERT_TRUE(started.is_ok()) << started.error;

    for (int i = 0; i < 5; ++i) {
        auto conn = platform::connect_tcp("127.0.0.1", started.value.local_port, 5000);
        ASSERT_TRUE(conn.is_ok()) << conn.error;

        std::string banner;
        char buf[256];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (banner.find('\n') == std::string::npos &&
               std::chrono::steady_clock::now() < deadline) {
            if (platform::poll_socket(conn.value, POLLIN, 100) == 0) continue;
            ssize_t n = recv(conn.value, buf, sizeof(buf), 0);
            if (n <= 0) break;
            banner.append(buf, static_cast<size_t>(n));
        }
        EXPECT_EQ(banner.rfind("SSH-", 0), 0u) << banner;
        platform::close_socket(conn.value);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (tunnel.active_connections() > 0 && std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(50);
    }
    EXPECT_EQ(tunnel.active_connections(), 0u);

    auto begin = std::chrono::steady_clock::now();
    tunnel.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    EXPECT_EQ(tunnel.state().status, TunnelStatus::Stopped);
}
