#include <gtest/gtest.h>
#include <managers/proxy_service.hpp>
#include <platform/socket_util.hpp>
#include <filesystem>

namespace fs = std::filesystem;

static int free_port() {
    auto s = platform::listen_tcp("127.0.0.1", 0, 1);
    EXPECT_TRUE(s.is_ok()) << s.error;
    int port = platform::bound_port(s.value);
    platform::close_socket(s.value);
    return port;
}

static bool port_is_free(int port) {
    auto s = platform::listen_tcp("127.0.0.1", port, 1);
    if (s.is_err()) return false;
    platform::close_socket(s.value);
    return true;
}

class ProxyServiceTest : public ::testing::Test {
protected:
    fs::path ssh_config = fs::temp_directory_path() / "data_stream_no_such_ssh_config";

    ProxySettings unreachable_settings() {
        ProxySettings s;
        s.ssh_host = "127.0.0.1";
        s.ssh_username = "nobody";
        s.ssh_key_path = "/nonexistent/id_ed25519";
        s.ssh_port = free_port();
        s.data_path = "/srv/data";
        s.local_port = free_port();
        s.listen_host = "127.0.0.1";
        s.listen_port = free_port();
        s.ssh_timeout = 2;
        s.readiness_timeout = 0;
        return s;
    }
};

TEST_F(ProxyServiceTest, StateNames) {
    EXPECT_STREQ(service_state_name(ServiceState::Unstarted), "unstarted");
    EXPECT_STREQ(service_state_name(ServiceState::Running), "running");
    EXPECT_STREQ(service_state_name(ServiceState::Failed), "failed");
}

TEST_F(ProxyServiceTest, StopWithoutStart) {
    ProxyService service(unreachable_settings(), ssh_config);
    service.stop();
    service.stop();
    EXPECT_EQ(service.state(), ServiceState::Unstarted);
    EXPECT_EQ(service.http_port(), 0);
}

TEST_F(ProxyServiceTest, MissingEndpointIsConfigError) {
    ProxySettings s;
    s.data_path = "/srv/data";
    ProxyService service(s, ssh_config);

    auto r = service.start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_EQ(service.state(), ServiceState::Failed);
}

TEST_F(ProxyServiceTest, TunnelFailureUnwindsEverything) {
    auto settings = unreachable_settings();
    ProxyService service(settings, ssh_config);

    auto r = service.start();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Tunnel);
    EXPECT_EQ(service.state(), ServiceState::Failed);

    // No HTTP listener was opened and the tunnel port was released
    EXPECT_EQ(service.http_port(), 0);
    EXPECT_TRUE(port_is_free(settings.listen_port));
    EXPECT_TRUE(port_is_free(settings.local_port));

    // Connection details were resolved before the tunnel failed
    EXPECT_EQ(service.context().connection.hostname, "127.0.0.1");
    EXPECT_FALSE(service.context().using_ssh_config);

    service.stop();
    service.stop();
    EXPECT_EQ(service.state(), ServiceState::Failed);
}

TEST_F(ProxyServiceTest, NoRestartAfterFailure) {
    ProxyService service(unreachable_settings(), ssh_config);
    ASSERT_TRUE(service.start().is_err());
    auto again = service.start();
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(service.state(), ServiceState::Failed);
}

TEST_F(ProxyServiceTest, AliasSettingsMarkContext) {
    ProxySettings s = unreachable_settings();
    s.ssh_host.reset();
    s.ssh_username.reset();
    s.ssh_host_alias = "lab";
    ProxyService service(s, ssh_config);
    EXPECT_TRUE(service.context().using_ssh_config);
    EXPECT_EQ(service.context().upstream_port, s.local_port);
}
