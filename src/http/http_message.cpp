#include "http_message.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <poll.h>

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

// ── Parsing ───────────────────────────────────────────────────

static bool is_token_char(unsigned char c) {
    return std::isalnum(c) || std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string::npos;
}

ParseStatus parse_request_head(const std::string& data, HttpRequest& out, std::string* error) {
    auto fail = [&](const std::string& why) {
        if (error) *error = why;
        return ParseStatus::Invalid;
    };

    size_t end = data.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (data.size() > HTTP_MAX_HEADER_BYTES) return fail("Request header too large");
        return ParseStatus::Incomplete;
    }
    if (end > HTTP_MAX_HEADER_BYTES) return fail("Request header too large");

    size_t line_end = data.find("\r\n");
    std::string request_line = data.substr(0, line_end);

    size_t sp1 = request_line.find(' ');
    size_t sp2 = (sp1 == std::string::npos) ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos ||
        request_line.find(' ', sp2 + 1) != std::string::npos) {
        return fail("Malformed request line");
    }

    out.method = request_line.substr(0, sp1);
    out.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    out.version = request_line.substr(sp2 + 1);

    if (out.method.empty()) return fail("Empty method");
    for (char c : out.method) {
        if (!is_token_char(static_cast<unsigned char>(c))) return fail("Invalid method");
    }
    if (out.target.empty() || out.target[0] != '/') return fail("Unsupported request target");
    if (out.version != "HTTP/1.1" && out.version != "HTTP/1.0") return fail("Unsupported HTTP version");

    size_t q = out.target.find('?');
    out.path = out.target.substr(0, q);
    out.query = (q == std::string::npos) ? "" : out.target.substr(q + 1);

    out.headers.clear();
    size_t pos = line_end + 2;
    while (pos < end) {
        size_t eol = data.find("\r\n", pos);
        std::string line = data.substr(pos, eol - pos);
        pos = eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return fail("Malformed header line");
        std::string name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(static_cast<unsigned char>(c))) return fail("Invalid header name");
        }
        std::string value = trimmed(line.substr(colon + 1));

        name = to_lower(name);
        auto it = out.headers.find(name);
        if (it == out.headers.end()) out.headers[name] = value;
        else it->second += ", " + value;
    }

    return ParseStatus::Complete;
}

std::string url_decode(const std::string& s, bool* ok) {
    if (ok) *ok = true;
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        if (i + 2 >= s.size() || !std::isxdigit(static_cast<unsigned char>(s[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            if (ok) *ok = false;
            out += s[i];
            continue;
        }
        out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
        i += 2;
    }
    return out;
}

const char* status_text(int status) {
    switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 206: return "Partial Content";
    case 301: return "Moved Permanently";
    case 302: return "Found";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

bool is_framing_header(const std::string& name) {
    std::string n = to_lower(name);
    return n == "content-length" || n == "transfer-encoding" ||
           n == "connection" || n == "keep-alive";
}

bool status_forbids_body(int status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

// ── ResponseWriter ────────────────────────────────────────────

ResponseWriter::ResponseWriter(socket_t fd, const std::atomic<bool>* stop_flag)
    : fd_(fd), stop_flag_(stop_flag) {}

bool ResponseWriter::cancelled() {
    if (failed_) return true;
    if (stop_flag_ && stop_flag_->load()) return true;
    // POLLRDHUP: the peer sent FIN; one request per connection, so nothing
    // more is expected from it
    int revents = platform::poll_socket(fd_, POLLRDHUP, 0);
    if (revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) {
        failed_ = true;
        return true;
    }
    return false;
}

std::string ResponseWriter::head(int status, const HeaderList& headers) const {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", status, status_text(status));
    for (const auto& [name, value] : headers) {
        out += name + ": " + value + "\r\n";
    }
    return out;
}

bool ResponseWriter::write_raw(const std::string& data) {
    return write_raw(data.data(), data.size());
}

bool ResponseWriter::write_raw(const char* data, size_t len) {
    if (failed_) return false;
    if (!platform::send_all(fd_, data, len)) {
        failed_ = true;
        return false;
    }
    return true;
}

bool ResponseWriter::send(int status, const HeaderList& headers, const std::string& body) {
    if (headers_sent_) return false;
    headers_sent_ = true;
    status_ = status;

    std::string out = head(status, headers);
    if (status_forbids_body(status)) {
        out += "Connection: close\r\n\r\n";
        return write_raw(out);
    }
    out += fmt::format("Content-Length: {}\r\nConnection: close\r\n\r\n", body.size());
    out += body;
    body_bytes_ = body.size();
    return write_raw(out);
}

bool ResponseWriter::send_json(int status, const std::string& json) {
    return send(status, {{"Content-Type", "application/json"}}, json);
}

bool ResponseWriter::begin_chunked(int status, const HeaderList& headers) {
    if (headers_sent_) return false;
    headers_sent_ = true;
    chunked_ = true;
    status_ = status;

    std::string out = head(status, headers);
    out += "Transfer-Encoding: chunked\r\nConnection: close\r\n\r\n";
    return write_raw(out);
}

bool ResponseWriter::write_chunk(const char* data, size_t len) {
    if (!chunked_) return false;
    if (len == 0) return !failed_;   // a zero-size chunk would end the body
    if (!write_raw(fmt::format("{:x}\r\n", len))) return false;
    if (!write_raw(data, len)) return false;
    body_bytes_ += len;
    return write_raw("\r\n", 2);
}

bool ResponseWriter::end_chunked() {
    if (!chunked_) return false;
    chunked_ = false;
    return write_raw("0\r\n\r\n", 5);
}
