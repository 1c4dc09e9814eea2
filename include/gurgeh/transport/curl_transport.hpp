#pragma once

#include "IHttpTransport.hpp"
#include "../types.hpp"

namespace gurgeh {
namespace transport {

/**
 * @brief Production transport implemented with libcurl's easy interface.
 *
 * Each post_stream() call uses its own easy handle, so one instance may be
 * shared by concurrent exchanges. Global libcurl initialization happens once
 * per process.
 */
class CurlTransport : public IHttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override = default;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;
    CurlTransport(CurlTransport&&) = delete;
    CurlTransport& operator=(CurlTransport&&) = delete;

    Expected<HttpResponse> post_stream(
        const HttpRequest& request,
        const ChunkCallback& on_chunk,
        const std::atomic<bool>* cancel = nullptr
    ) override;

private:
    static void initialize_global();
};

} // namespace transport
} // namespace gurgeh
