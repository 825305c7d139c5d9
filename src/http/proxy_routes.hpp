#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "http_message.hpp"
#include "upstream_client.hpp"

// Read-only state shared by every request handler. Filled in once during
// startup, before the HTTP listener opens.
struct ServiceContext {
    ConnectionSpec connection;
    bool using_ssh_config = false;
    std::string upstream_host = LOOPBACK_ADDR;
    int upstream_port = DEFAULT_LOCAL_PORT;   // tunnel entry point
    UpstreamOptions upstream;
};

// True when a decoded relative path has no ".." segment.
bool is_safe_relative_path(const std::string& decoded_path);

// JSON body of GET /health.
std::string health_json(const ServiceContext& ctx);

// JSON error body: {"detail": "..."}.
std::string detail_json(const std::string& detail);

// Request dispatch for the proxy:
//   GET /data/{path}  stream {path} from the remote file server
//   GET /health       configured connection
class ProxyRoutes {
public:
    explicit ProxyRoutes(const ServiceContext& ctx);

    void handle(const HttpRequest& request, ResponseWriter& writer) const;

    void handle_data(const std::string& raw_path, ResponseWriter& writer) const;
    void handle_health(ResponseWriter& writer) const;

private:
    const ServiceContext& ctx_;
    UpstreamClient client_;

    HeaderList forward_headers(const UpstreamHead& head) const;
};
