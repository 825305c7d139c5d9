#include "http_server.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <chrono>

HttpServer::HttpServer(HttpHandler handler) : handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

Result<int> HttpServer::start(const std::string& host, int port) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        return Result<int>::Err("HTTP server already running");
    }

    auto listener = platform::listen_tcp(host, port, LISTEN_BACKLOG);
    if (listener.is_err()) {
        return Result<int>::Err(listener.error);
    }
    listen_fd_ = listener.value;
    port_ = platform::bound_port(listen_fd_);

    stop_.store(false);
    running_.store(true);
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);
    return Result<int>::Ok(port_);
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load()) return;

    stop_.store(true);
    if (accept_thread_.joinable()) accept_thread_.join();

    // Abort in-flight responses; handlers see the stop flag or their next write fail
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (socket_t fd : open_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
    }

    std::list<std::unique_ptr<Connection>> pending;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        pending.swap(conns_);
    }
    for (auto& c : pending) {
        if (c->thread.joinable()) c->thread.join();
    }

    if (listen_fd_ != DS_INVALID_SOCKET) {
        platform::close_socket(listen_fd_);
        listen_fd_ = DS_INVALID_SOCKET;
    }
    running_.store(false);
}

void HttpServer::reap_finished() {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    for (auto it = conns_.begin(); it != conns_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = conns_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::accept_loop() {
    while (!stop_.load()) {
        struct pollfd pfd = {listen_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, ACCEPT_POLL_MS);
        reap_finished();
        if (pr <= 0) continue;

        socket_t client = accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                ds_warn(fmt::format("HTTP: accept() failed: {}", strerror(errno)));
            }
            continue;
        }

        auto conn = std::make_unique<Connection>();
        Connection* raw = conn.get();
        std::lock_guard<std::mutex> lock(conns_mutex_);
        open_fds_.insert(client);
        conns_.push_back(std::move(conn));
        raw->thread = std::thread(&HttpServer::serve_connection, this, client, raw);
    }
}

void HttpServer::serve_connection(socket_t fd, Connection* self) {
    ResponseWriter writer(fd, &stop_);
    HttpRequest request;
    std::string buf;
    char chunk[4096];
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(HTTP_HEADER_TIMEOUT_MS);

    ParseStatus status = ParseStatus::Incomplete;
    std::string parse_error;
    while (!stop_.load()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        int revents = platform::poll_socket(fd, POLLIN, static_cast<int>(std::min<long long>(remaining, ACCEPT_POLL_MS)));
        if (revents == 0) continue;

        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) break;
        buf.append(chunk, static_cast<size_t>(n));

        status = parse_request_head(buf, request, &parse_error);
        if (status != ParseStatus::Incomplete) break;
    }

    if (status == ParseStatus::Complete) {
        try {
            handler_(request, writer);
            if (!writer.headers_sent()) {
                writer.send_json(500, R"({"detail":"No response"})");
            }
        } catch (const std::exception& e) {
            ds_error(fmt::format("HTTP: handler for {} {} threw: {}", request.method, request.target, e.what()));
            if (!writer.headers_sent()) {
                writer.send_json(500, R"({"detail":"Internal Server Error"})");
            }
        }
        ds_debug(fmt::format("HTTP: {} {} -> {} ({} bytes{})", request.method, request.target,
                             writer.status(), writer.body_bytes(),
                             writer.failed() ? ", client gone" : ""));
    } else if (status == ParseStatus::Invalid) {
        int code = parse_error == "Request header too large" ? 431 : 400;
        writer.send_json(code, fmt::format(R"({{"detail":"{}"}})", parse_error));
    } else if (!buf.empty() && !stop_.load()) {
        writer.send_json(408, R"({"detail":"Request Timeout"})");
    }

    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        open_fds_.erase(fd);
        platform::close_socket(fd);
    }
    self->done.store(true);
}
