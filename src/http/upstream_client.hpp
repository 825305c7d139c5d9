#pragma once

#include <string>
#include <functional>
#include <cstddef>
#include <core/constants.hpp>
#include "http_message.hpp"

struct UpstreamOptions {
    int connect_timeout_ms = UPSTREAM_CONNECT_TIMEOUT_MS;
    int stall_timeout_secs = UPSTREAM_STALL_TIMEOUT_SECS;   // 0 disables
    size_t chunk_size = PROXY_CHUNK_SIZE;
};

struct UpstreamHead {
    long status = 0;
    HeaderList headers;   // in upstream order, original case
};

struct UpstreamOutcome {
    bool ok = false;          // transfer finished normally
    bool stopped = false;     // a callback asked to stop (client gone, or response already decided)
    std::string error;        // transport error text when !ok && !stopped
};

// Streams one GET through libcurl. on_head runs once, before any body bytes;
// on_chunk receives the body in pieces of at most chunk_size. Returning false
// from either aborts the transfer and releases the upstream connection.
// should_cancel is polled while the transfer runs, including while the
// upstream is silent; returning true aborts the same way.
class UpstreamClient {
public:
    using HeadCallback = std::function<bool(const UpstreamHead&)>;
    using ChunkCallback = std::function<bool(const char* data, size_t len)>;
    using CancelCallback = std::function<bool()>;

    explicit UpstreamClient(UpstreamOptions options = {});

    UpstreamOutcome stream_get(const std::string& url,
                               const HeadCallback& on_head,
                               const ChunkCallback& on_chunk,
                               const CancelCallback& should_cancel = {}) const;

    // True once url answers with any HTTP status within timeout_ms.
    bool probe(const std::string& url, int timeout_ms) const;

private:
    UpstreamOptions options_;
};
