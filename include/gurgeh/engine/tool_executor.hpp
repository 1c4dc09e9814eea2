#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "tool_registry.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace gurgeh {
namespace engine {

/**
 * @brief Runs one tool call with a timeout and cooperative cancellation.
 *
 * The registry call runs on a detached helper thread. The caller waits in
 * short slices so a cancellation request is noticed promptly. When the wait
 * times out or is cancelled the helper is abandoned: it finishes on its own
 * and its result is discarded. The helper keeps the registry alive.
 *
 * @threadsafety Safe to use from multiple exchanges concurrently.
 */
class ToolExecutor {
public:
    ToolExecutor(std::shared_ptr<const ToolRegistry> registry, std::chrono::milliseconds timeout)
        : registry_(std::move(registry))
        , timeout_(timeout)
    {}

    /**
     * @brief Execute a tool and wait for its result.
     *
     * @return The ToolResult (a timeout yields a failed ToolResult), or
     *         RequestCancelled when cancellation was requested while waiting
     */
    Expected<ToolResult> run(
        const std::string& name,
        const nlohmann::json& args,
        const std::atomic<bool>* cancel = nullptr
    ) const {
        auto promise = std::make_shared<std::promise<ToolResult>>();
        auto future = promise->get_future();

        try {
            std::thread([registry = registry_, promise, name, args]() {
                promise->set_value(registry->execute(name, args));
            }).detach();
        } catch (const std::system_error& e) {
            GURGEH_LOG_ERROR("could not start tool thread for " << name << ": " << e.what());
            return ToolResult::failure(std::string("Could not start tool: ") + e.what());
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        while (true) {
            if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
                GURGEH_LOG_INFO("tool " << name << " abandoned: exchange cancelled");
                return tl::unexpected(Error{ErrorCode::RequestCancelled, "Cancelled while running tool " + name});
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice);
            if (future.wait_for(slice) == std::future_status::ready) {
                return future.get();
            }
        }

        // A result that raced the deadline still counts
        if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            return future.get();
        }
        GURGEH_LOG_WARN("tool " << name << " timed out after " << timeout_.count() << " ms");
        return ToolResult::failure(
            "Tool '" + name + "' timed out after " + std::to_string(timeout_.count()) + " ms");
    }

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    static constexpr std::chrono::milliseconds kWaitSlice{10};

    std::shared_ptr<const ToolRegistry> registry_;
    std::chrono::milliseconds timeout_;
};

} // namespace engine
} // namespace gurgeh
