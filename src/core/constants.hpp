#pragma once

#include <cstddef>

constexpr const char* DS_VERSION = "1.0.0";

// ── Default ports ───────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DEFAULT_LOCAL_PORT         = 8000;  // tunnel entry on loopback
constexpr int DEFAULT_REMOTE_PORT        = 8001;  // remote file server
constexpr int DEFAULT_LISTEN_PORT        = 5001;  // HTTP proxy
constexpr const char* DEFAULT_LISTEN_HOST = "0.0.0.0";
constexpr const char* LOOPBACK_ADDR      = "127.0.0.1";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_TIMEOUT_SECS           = 30;    // connect, handshake, auth, channel open
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int SSH_CMD_TIMEOUT_SECS       = 30;    // remote kill/launch commands
constexpr int READINESS_TIMEOUT_SECS     = 10;    // 0 disables the probe
constexpr int READINESS_POLL_MS          = 250;
constexpr int UPSTREAM_CONNECT_TIMEOUT_MS = 10000;
constexpr int UPSTREAM_STALL_TIMEOUT_SECS = 60;   // abort below 1 byte/s for this long
constexpr int HTTP_HEADER_TIMEOUT_MS     = 15000; // client must send headers within this
constexpr int ACCEPT_POLL_MS             = 200;   // stop flag granularity for accept loops
constexpr int FORWARD_POLL_MS            = 50;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t PROXY_CHUNK_SIZE   = 64 * 1024;
constexpr std::size_t FORWARD_BUF_SIZE   = 32 * 1024;
constexpr std::size_t SSH_READ_BUF_SIZE  = 4096;
constexpr std::size_t HTTP_MAX_HEADER_BYTES = 16 * 1024;
constexpr int LISTEN_BACKLOG             = 64;

// ── Remote file server ──────────────────────────────────────
// {port} is substituted with the remote port.
constexpr const char* DEFAULT_REMOTE_SERVER_CMD  = "python3 -m http.server {port} --bind 127.0.0.1";
constexpr const char* DEFAULT_REMOTE_KILL_PATTERN = "http.server {port}";
