#include "gurgeh/transport/curl_transport.hpp"
#include "gurgeh/log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>

namespace gurgeh {
namespace transport {

namespace {

// Non-2xx bodies are diagnostic only
constexpr size_t kMaxErrorBodyBytes = 64 * 1024;

std::once_flag g_curl_init_flag;

struct TransferContext {
    CURL* curl = nullptr;
    const ChunkCallback* on_chunk = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    HttpResponse* response = nullptr;

    bool status_known = false;
    bool success_status = false;
    bool aborted_by_consumer = false;
    bool cancelled = false;
    bool idle_expired = false;

    std::chrono::milliseconds idle_timeout{0};
    std::chrono::steady_clock::time_point last_activity;
};

bool is_cancelled(const TransferContext& ctx) {
    return ctx.cancel != nullptr && ctx.cancel->load(std::memory_order_acquire);
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);
    ctx->last_activity = std::chrono::steady_clock::now();

    if (is_cancelled(*ctx)) {
        ctx->cancelled = true;
        return 0;
    }

    if (!ctx->status_known) {
        long status = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
        ctx->response->status = status;
        ctx->success_status = status >= 200 && status < 300;
        ctx->status_known = true;
    }

    if (!ctx->success_status) {
        auto& body = ctx->response->error_body;
        if (body.size() < kMaxErrorBodyBytes) {
            body.append(ptr, std::min(total, kMaxErrorBodyBytes - body.size()));
        }
        return total;
    }

    ctx->response->bytes_streamed += total;
    if (ctx->on_chunk != nullptr && *ctx->on_chunk) {
        if (!(*ctx->on_chunk)(std::string_view(ptr, total))) {
            ctx->aborted_by_consumer = true;
            return 0;
        }
    }
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (is_cancelled(*ctx)) {
        ctx->cancelled = true;
        return 1;
    }
    if (std::chrono::steady_clock::now() - ctx->last_activity > ctx->idle_timeout) {
        ctx->idle_expired = true;
        return 1;
    }
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlTransport::CurlTransport() {
    initialize_global();
}

void CurlTransport::initialize_global() {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

Expected<HttpResponse> CurlTransport::post_stream(
    const HttpRequest& request,
    const ChunkCallback& on_chunk,
    const std::atomic<bool>* cancel
) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "curl_easy_init failed"});
    }

    HttpResponse response;
    TransferContext ctx;
    ctx.curl = curl.get();
    ctx.on_chunk = &on_chunk;
    ctx.cancel = cancel;
    ctx.response = &response;
    ctx.idle_timeout = request.idle_timeout;
    ctx.last_activity = std::chrono::steady_clock::now();

    curl_slist* raw_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string line = key + ": " + value;
        raw_headers = curl_slist_append(raw_headers, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    if (headers) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "gurgeh/0.1");

    const CURLcode code = curl_easy_perform(h);

    if (ctx.cancelled || (code != CURLE_OK && is_cancelled(ctx))) {
        GURGEH_LOG_INFO("transfer cancelled after " << response.bytes_streamed << " bytes");
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "Request cancelled"});
    }
    if (ctx.aborted_by_consumer) {
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "Transfer aborted by stream consumer"});
    }
    if (ctx.idle_expired) {
        return tl::unexpected(Error{
            ErrorCode::ReadTimeout,
            "No data received for " + std::to_string(request.idle_timeout.count()) + " ms",
            request.url
        });
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        return tl::unexpected(Error{
            ErrorCode::ReadTimeout,
            std::string("Request timed out: ") + curl_easy_strerror(code),
            request.url
        });
    }
    if (code != CURLE_OK) {
        return tl::unexpected(Error{
            ErrorCode::TransportFailed,
            std::string("HTTP request failed: ") + curl_easy_strerror(code),
            request.url
        });
    }

    if (!ctx.status_known) {
        // Empty body: the status was never observed in the write callback
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    }
    return response;
}

std::unique_ptr<IHttpTransport> create_transport() {
    return std::make_unique<CurlTransport>();
}

} // namespace transport
} // namespace gurgeh
