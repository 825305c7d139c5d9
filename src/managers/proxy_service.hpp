#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <http/proxy_routes.hpp>
#include <http/http_server.hpp>
#include <ssh/ssh_config.hpp>
#include "tunnel_manager.hpp"
#include "remote_server.hpp"

enum class ServiceState {
    Unstarted,
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed,
};

const char* service_state_name(ServiceState state);

// Owns every component of the proxy and sequences them:
//   resolve SSH endpoint -> tunnel -> remote file server -> readiness -> HTTP
// stop() tears down in reverse and is also run by the destructor.
class ProxyService {
public:
    explicit ProxyService(ProxySettings settings,
                          fs::path ssh_config_path = default_ssh_config_path());
    ~ProxyService();

    ProxyService(const ProxyService&) = delete;
    ProxyService& operator=(const ProxyService&) = delete;

    // Acquire everything. On failure, whatever was acquired is released
    // before returning and the state is Failed.
    Result<void> start();
    void stop();

    ServiceState state() const;
    const ServiceContext& context() const { return ctx_; }
    const ProxySettings& settings() const { return settings_; }

    // Bound port of the HTTP listener, 0 when not running.
    int http_port() const;

private:
    ProxySettings settings_;
    SshConfigResolver resolver_;
    ServiceContext ctx_;

    TunnelManager tunnel_;
    RemoteServerController remote_;
    std::unique_ptr<ProxyRoutes> routes_;
    std::unique_ptr<HttpServer> http_;

    mutable std::mutex state_mutex_;
    ServiceState state_ = ServiceState::Unstarted;
    std::mutex lifecycle_mutex_;

    Result<void> fail(const Result<void>& error);
    void wait_until_ready();
    void teardown();
    void set_state(ServiceState state);
};
