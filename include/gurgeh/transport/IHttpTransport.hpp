#pragma once

#include "../types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gurgeh {
namespace transport {

/** @brief One streaming POST request. */
struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{120000};
    std::chrono::milliseconds idle_timeout{30000};   ///< Abort when no bytes arrive for this long
};

/** @brief Outcome of a request that reached the server and completed. */
struct HttpResponse {
    long status = 0;            ///< HTTP status code
    std::string error_body;     ///< Body of a non-2xx response (never streamed)
    size_t bytes_streamed = 0;  ///< Body bytes delivered to the chunk callback
};

/**
 * @brief Receives body bytes of a 2xx response as they arrive.
 *
 * Returning false aborts the transfer.
 */
using ChunkCallback = std::function<bool(std::string_view)>;

/**
 * @brief Abstract interface for the HTTP client used by the stream client.
 *
 * Keeps the C HTTP library out of the header-only engine and lets tests
 * script response streams.
 *
 * Design principles:
 * - Synchronous: post_stream() blocks until the body is fully read or the transfer fails
 * - Incremental: 2xx bodies are forwarded chunk by chunk, never buffered whole
 * - No retries: a failed transfer is reported once
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * @brief POST a request and stream the response body.
     *
     * @param request URL, headers, body and timeouts
     * @param on_chunk Invoked for each body chunk of a 2xx response
     * @param cancel Optional flag polled during the transfer; when set the transfer aborts
     * @return HttpResponse for any completed response (including non-2xx);
     *         TransportFailed, ReadTimeout or RequestCancelled otherwise
     */
    virtual Expected<HttpResponse> post_stream(
        const HttpRequest& request,
        const ChunkCallback& on_chunk,
        const std::atomic<bool>* cancel = nullptr
    ) = 0;
};

/**
 * @brief Factory for the production transport.
 *
 * Returns the libcurl implementation. For testing, inject a scripted
 * transport directly.
 */
std::unique_ptr<IHttpTransport> create_transport();

} // namespace transport
} // namespace gurgeh
