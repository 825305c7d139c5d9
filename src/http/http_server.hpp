#pragma once

#include <string>
#include <list>
#include <set>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <core/types.hpp>
#include "http_message.hpp"

using HttpHandler = std::function<void(const HttpRequest&, ResponseWriter&)>;

// Minimal HTTP/1.1 server: one thread per connection, one request per
// connection. stop() aborts in-flight responses by shutting their sockets;
// handlers that wait on something else can poll ResponseWriter::cancelled().
class HttpServer {
public:
    explicit HttpServer(HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and start accepting. Returns the bound port (useful with port 0).
    Result<int> start(const std::string& host, int port);
    void stop();

    bool is_running() const { return running_.load(); }
    int port() const { return port_; }

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    HttpHandler handler_;
    socket_t listen_fd_ = DS_INVALID_SOCKET;
    int port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_{false};
    std::thread accept_thread_;

    std::mutex conns_mutex_;
    std::list<std::unique_ptr<Connection>> conns_;
    std::set<socket_t> open_fds_;

    std::mutex lifecycle_mutex_;

    void accept_loop();
    void serve_connection(socket_t fd, Connection* self);
    void reap_finished();
};
