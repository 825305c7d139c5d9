#include "upstream_client.hpp"
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <mutex>

namespace {

std::once_flag g_curl_init;

void ensure_curl() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct TransferContext {
    const UpstreamClient::HeadCallback* on_head = nullptr;
    const UpstreamClient::ChunkCallback* on_chunk = nullptr;
    const UpstreamClient::CancelCallback* should_cancel = nullptr;
    UpstreamHead head;
    bool head_delivered = false;
    bool stopped = false;
};

bool deliver_head(TransferContext* ctx) {
    if (ctx->head_delivered) return true;
    ctx->head_delivered = true;
    if (ctx->on_head && *ctx->on_head && !(*ctx->on_head)(ctx->head)) {
        ctx->stopped = true;
        return false;
    }
    return true;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const auto total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string line(buffer, total);

    if (line.rfind("HTTP/", 0) == 0) {
        // New status line (interim 1xx responses start over)
        ctx->head.headers.clear();
        size_t sp = line.find(' ');
        ctx->head.status = (sp == std::string::npos) ? 0 : safe_stoi(line.substr(sp + 1, 3), 0);
        return total;
    }

    if (line == "\r\n" || line == "\n") {
        if (ctx->head.status >= 200 && !deliver_head(ctx)) return 0;
        return total;
    }

    const auto separator = line.find(':');
    if (separator != std::string::npos) {
        ctx->head.headers.emplace_back(trimmed(line.substr(0, separator)),
                                       trimmed(line.substr(separator + 1)));
    }
    return total;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto total = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);

    if (!deliver_head(ctx)) return 0;
    if (ctx->on_chunk && *ctx->on_chunk && !(*ctx->on_chunk)(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

// Called by libcurl about once a second while idle, more often when busy
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->should_cancel && *ctx->should_cancel && (*ctx->should_cancel)()) {
        ctx->stopped = true;
        return 1;
    }
    return 0;
}

size_t discard_callback(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

} // namespace

UpstreamClient::UpstreamClient(UpstreamOptions options) : options_(options) {}

UpstreamOutcome UpstreamClient::stream_get(const std::string& url,
                                           const HeadCallback& on_head,
                                           const ChunkCallback& on_chunk,
                                           const CancelCallback& should_cancel) const {
    UpstreamOutcome outcome;
    ensure_curl();

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        outcome.error = "curl_easy_init failed";
        return outcome;
    }

    TransferContext ctx;
    ctx.on_head = &on_head;
    ctx.on_chunk = &on_chunk;
    ctx.should_cancel = &should_cancel;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
    if (options_.stall_timeout_secs > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_secs));
    }
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(options_.chunk_size));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    if (should_cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    }
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "data-stream/1.0");

    const CURLcode code = curl_easy_perform(curl);

    if (code == CURLE_OK) {
        // Empty bodies never reach the write callback
        outcome.ok = deliver_head(&ctx);
    } else if (ctx.stopped) {
        outcome.stopped = true;
    } else {
        outcome.error = errbuf[0] ? fmt::format("{}: {}", curl_easy_strerror(code), errbuf)
                                  : curl_easy_strerror(code);
    }
    if (ctx.stopped) {
        outcome.ok = false;
        outcome.stopped = true;
    }

    curl_easy_cleanup(curl);
    return outcome;
}

bool UpstreamClient::probe(const std::string& url, int timeout_ms) const {
    ensure_curl();
    CURL* curl = curl_easy_init();
    if (curl == nullptr) return false;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_callback);

    const CURLcode code = curl_easy_perform(curl);
    long status = 0;
    if (code == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_easy_cleanup(curl);
    return code == CURLE_OK && status > 0;
}
