#include "proxy_routes.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <sstream>

static const std::string DATA_PREFIX = "/data/";

bool is_safe_relative_path(const std::string& decoded_path) {
    std::stringstream ss(decoded_path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "..") return false;
    }
    return true;
}

std::string health_json(const ServiceContext& ctx) {
    nlohmann::json body = {
        {"status", "OK"},
        {"connection", {
            {"hostname", ctx.connection.hostname},
            {"username", ctx.connection.username},
            {"using_ssh_config", ctx.using_ssh_config},
        }},
    };
    return body.dump();
}

std::string detail_json(const std::string& detail) {
    // Error text from transports is not guaranteed to be valid UTF-8
    return nlohmann::json{{"detail", detail}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ProxyRoutes::ProxyRoutes(const ServiceContext& ctx)
    : ctx_(ctx), client_(ctx.upstream) {}

void ProxyRoutes::handle(const HttpRequest& request, ResponseWriter& writer) const {
    const bool is_data = request.path.rfind(DATA_PREFIX, 0) == 0;
    const bool is_health = request.path == "/health";

    if (!is_data && !is_health) {
        writer.send_json(404, detail_json("Not Found"));
        return;
    }
    if (request.method != "GET") {
        writer.send(405, {{"Content-Type", "application/json"}, {"Allow", "GET"}},
                    detail_json("Method Not Allowed"));
        return;
    }

    if (is_health) {
        handle_health(writer);
    } else {
        handle_data(request.path.substr(DATA_PREFIX.size()), writer);
    }
}

void ProxyRoutes::handle_health(ResponseWriter& writer) const {
    writer.send_json(200, health_json(ctx_));
}

HeaderList ProxyRoutes::forward_headers(const UpstreamHead& head) const {
    HeaderList out;
    for (const auto& [name, value] : head.headers) {
        if (is_framing_header(name)) continue;
        if (to_lower(name) == "location" && !value.empty() && value[0] == '/') {
            // Redirects from the file server point into its own namespace
            out.emplace_back(name, "/data" + value);
            continue;
        }
        out.emplace_back(name, value);
    }
    return out;
}

void ProxyRoutes::handle_data(const std::string& raw_path, ResponseWriter& writer) const {
    bool decoded_ok = true;
    std::string decoded = url_decode(raw_path, &decoded_ok);
    if (!decoded_ok || !is_safe_relative_path(decoded)) {
        writer.send_json(404, detail_json("File not found"));
        return;
    }

    const std::string url = fmt::format("http://{}:{}/{}", ctx_.upstream_host,
                                        ctx_.upstream_port, raw_path);
    ds_debug(fmt::format("Proxy: GET {}", url));

    bool client_gone = false;
    auto on_head = [&](const UpstreamHead& head) {
        if (head.status == 404) {
            writer.send_json(404, detail_json("File not found"));
            return false;
        }
        if (status_forbids_body(static_cast<int>(head.status))) {
            if (!writer.send(static_cast<int>(head.status), forward_headers(head), "")) {
                client_gone = true;
            }
            return false;
        }
        if (!writer.begin_chunked(static_cast<int>(head.status), forward_headers(head))) {
            client_gone = true;
            return false;
        }
        return true;
    };
    auto on_chunk = [&](const char* data, size_t len) {
        if (!writer.write_chunk(data, len)) {
            client_gone = true;
            return false;
        }
        return true;
    };

    auto should_cancel = [&] {
        if (writer.cancelled()) {
            client_gone = true;
            return true;
        }
        return false;
    };

    UpstreamOutcome outcome = client_.stream_get(url, on_head, on_chunk, should_cancel);

    if (outcome.ok) {
        writer.end_chunked();
        return;
    }
    if (client_gone) {
        ds_debug(fmt::format("Proxy: client disconnected during /{}", raw_path));
        return;
    }
    if (outcome.stopped) return;   // 404 or bodiless status already answered

    ds_error(fmt::format("{}: error proxying /{}: {}",
                         error_kind_name(ErrorKind::ProxyUpstream), raw_path, outcome.error));
    if (!writer.headers_sent()) {
        writer.send_json(500, detail_json(outcome.error));
    }
    // Mid-stream failure: the body stays unterminated and the connection
    // closes, so the caller sees a truncated transfer rather than a short file.
}
