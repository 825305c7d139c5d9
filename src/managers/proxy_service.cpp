#include "proxy_service.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

const char* service_state_name(ServiceState state) {
    switch (state) {
    case ServiceState::Unstarted: return "unstarted";
    case ServiceState::Starting:  return "starting";
    case ServiceState::Running:   return "running";
    case ServiceState::Stopping:  return "stopping";
    case ServiceState::Stopped:   return "stopped";
    case ServiceState::Failed:    return "failed";
    }
    return "unknown";
}

static RemoteServerOptions remote_options(const ProxySettings& s) {
    RemoteServerOptions opts;
    opts.server_command = s.remote_server_command;
    opts.kill_pattern = s.remote_kill_pattern;
    opts.timeout_secs = s.ssh_timeout;
    return opts;
}

ProxyService::ProxyService(ProxySettings settings, fs::path ssh_config_path)
    : settings_(std::move(settings)),
      resolver_(std::move(ssh_config_path)),
      remote_(remote_options(settings_)) {
    ctx_.using_ssh_config = settings_.using_ssh_config();
    ctx_.upstream_port = settings_.local_port;
    ctx_.upstream.stall_timeout_secs = settings_.upstream_stall_timeout;
}

ProxyService::~ProxyService() {
    stop();
}

ServiceState ProxyService::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ProxyService::set_state(ServiceState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
}

int ProxyService::http_port() const {
    return (http_ && http_->is_running()) ? http_->port() : 0;
}

// ── Startup ───────────────────────────────────────────────

Result<void> ProxyService::fail(const Result<void>& error) {
    ds_error(fmt::format("{}: {}", error_kind_name(error.kind), error.error));
    teardown();
    set_state(ServiceState::Failed);
    return error;
}

Result<void> ProxyService::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    ServiceState current = state();
    if (current != ServiceState::Unstarted) {
        return Result<void>::Err(fmt::format("Service cannot start from state {}",
                                             service_state_name(current)));
    }
    set_state(ServiceState::Starting);

    // 1. SSH endpoint
    auto spec = resolver_.resolve(settings_);
    if (spec.is_err()) {
        return fail(Result<void>::Err(ErrorKind::Config, spec.error));
    }
    ctx_.connection = spec.value;

    // 2. Tunnel
    TunnelOptions tunnel_opts;
    tunnel_opts.timeout_secs = settings_.ssh_timeout;
    tunnel_opts.strict_host_key_checking = settings_.strict_host_key_checking;

    auto tunnel = tunnel_.start(ctx_.connection, settings_.local_port,
                                settings_.remote_port, tunnel_opts);
    if (tunnel.is_err()) {
        return fail(Result<void>::Err(ErrorKind::Tunnel, tunnel.error));
    }
    ctx_.upstream_port = tunnel.value.local_port;
    ds_log(fmt::format("SSH tunnel established: {}:{} -> {}:{}",
                       tunnel.value.bind_address, tunnel.value.local_port,
                       ctx_.connection.hostname, tunnel.value.remote_port));

    // 3. Remote file server (best effort)
    SessionManager* session = tunnel_.session();
    if (session != nullptr) {
        auto remote = remote_.ensure_remote_server(*session, settings_.data_path,
                                                   settings_.remote_port);
        if (remote.is_err()) {
            ds_warn(fmt::format("{}: {}", error_kind_name(remote.kind), remote.error));
        }
    }

    // 4. Readiness
    wait_until_ready();

    // 5. HTTP front end
    routes_ = std::make_unique<ProxyRoutes>(ctx_);
    const ProxyRoutes* routes = routes_.get();
    http_ = std::make_unique<HttpServer>([routes](const HttpRequest& req, ResponseWriter& w) {
        routes->handle(req, w);
    });
    auto bound = http_->start(settings_.listen_host, settings_.listen_port);
    if (bound.is_err()) {
        return fail(Result<void>::Err(ErrorKind::Config,
            fmt::format("HTTP listener on {}:{}: {}", settings_.listen_host,
                        settings_.listen_port, bound.error)));
    }

    ds_log(fmt::format("Proxy listening on http://{}:{}", settings_.listen_host, bound.value));
    set_state(ServiceState::Running);
    return Result<void>::Ok();
}

void ProxyService::wait_until_ready() {
    if (settings_.readiness_timeout <= 0) return;

    UpstreamClient client(ctx_.upstream);
    const std::string url = fmt::format("http://{}:{}/", ctx_.upstream_host, ctx_.upstream_port);
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(settings_.readiness_timeout);

    while (std::chrono::steady_clock::now() < deadline) {
        if (client.probe(url, READINESS_POLL_MS * 4)) {
            ds_log("Remote file server is ready");
            return;
        }
        platform::sleep_ms(READINESS_POLL_MS);
    }
    ds_warn(fmt::format("Remote file server not answering after {}s, continuing",
                        settings_.readiness_timeout));
}

// ── Shutdown ──────────────────────────────────────────────

void ProxyService::teardown() {
    if (http_) {
        http_->stop();
        http_.reset();
    }
    routes_.reset();
    tunnel_.stop();
}

void ProxyService::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    ServiceState current = state();
    if (current != ServiceState::Running) return;

    set_state(ServiceState::Stopping);
    ds_log("Shutting down gracefully...");
    teardown();
    set_state(ServiceState::Stopped);
    ds_log("Proxy stopped");
}
