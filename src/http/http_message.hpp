#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <atomic>
#include <cstddef>
#include <platform/socket_util.hpp>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;      // as sent: path plus optional ?query
    std::string path;        // raw (still percent-encoded) path part of target
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers;   // lower-case names

    std::string header(const std::string& name) const;
};

enum class ParseStatus {
    Complete,
    Incomplete,
    Invalid,
};

// Parse the request line and headers from `data`. Complete once the blank
// line has been seen; anything after it is left alone.
ParseStatus parse_request_head(const std::string& data, HttpRequest& out, std::string* error = nullptr);

// Percent-decode a path. Sets ok to false on a malformed escape.
std::string url_decode(const std::string& s, bool* ok = nullptr);

const char* status_text(int status);

// True for headers the local server sets itself and must not copy from an
// upstream response: content-length, transfer-encoding, connection, keep-alive.
bool is_framing_header(const std::string& name);

// True for statuses that never carry a body: 1xx, 204 and 304.
bool status_forbids_body(int status);

// Writes one HTTP/1.1 response to a client socket. Every response closes
// the connection. Bodies are either sent whole or as chunked encoding.
class ResponseWriter {
public:
    // stop_flag, when given, is the owning server's shutdown flag.
    explicit ResponseWriter(socket_t fd, const std::atomic<bool>* stop_flag = nullptr);

    bool send(int status, const HeaderList& headers, const std::string& body);
    bool send_json(int status, const std::string& json);

    bool begin_chunked(int status, const HeaderList& headers);
    bool write_chunk(const char* data, size_t len);
    bool end_chunked();

    // True once the client hung up or the server is shutting down. Checks the
    // socket without blocking, so long waits on the upstream can poll it.
    bool cancelled();

    bool headers_sent() const { return headers_sent_; }
    bool failed() const { return failed_; }
    int status() const { return status_; }
    size_t body_bytes() const { return body_bytes_; }

private:
    socket_t fd_;
    const std::atomic<bool>* stop_flag_;
    bool headers_sent_ = false;
    bool failed_ = false;
    bool chunked_ = false;
    int status_ = 0;
    size_t body_bytes_ = 0;

    bool write_raw(const std::string& data);
    bool write_raw(const char* data, size_t len);
    std::string head(int status, const HeaderList& headers) const;
};
