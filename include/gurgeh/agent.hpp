#pragma once

#include "types.hpp"
#include "log.hpp"
#include "transport/IHttpTransport.hpp"
#include "engine/request_queue.hpp"
#include "engine/tool_registry.hpp"
#include "engine/agentic_loop.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace gurgeh {

/**
 * @brief Main entry point for running coach exchanges
 *
 * The Agent owns the HTTP transport, the shared tool registry and a small
 * pool of worker threads. Each run_exchange() call becomes one queued
 * exchange; workers run it through the AgenticLoop to Done or Failed.
 *
 * The Agent keeps no conversation state. Callers pass their history with
 * every exchange, so concurrent exchanges never share a mutable transcript.
 *
 * Thread Model:
 * - Calling thread: run_exchange(), receives an ExchangeHandle
 * - Worker threads: stream rounds, execute tools, fire callbacks
 * - Callbacks: execute on a worker thread (caller handles synchronization)
 *
 * Example Usage:
 * @code
 * Config config;
 * config.api_key = key;
 * config.system_prompt = chess::kCoachSystemPrompt;
 *
 * auto agent_result = Agent::create(config);
 * if (!agent_result) {
 *     std::cerr << agent_result.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto agent = std::move(*agent_result);
 *
 * ExchangeCallbacks callbacks;
 * callbacks.on_chunk = [](std::string_view text) { std::cout << text << std::flush; };
 * auto handle = agent->run_exchange({}, Message::user("How am I doing?"), callbacks);
 * auto result = handle.future.get();
 * @endcode
 */
class Agent {
public:
    /**
     * @brief Factory method to create an Agent
     *
     * @param config Agent configuration (validated here)
     * @param transport Optional transport (for testing with a scripted transport)
     * @return Expected<std::unique_ptr<Agent>> Agent or configuration error
     */
    static Expected<std::unique_ptr<Agent>> create(
        const Config& config,
        std::unique_ptr<transport::IHttpTransport> transport = nullptr
    ) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        if (!transport) {
            transport = transport::create_transport();
            if (!transport) {
                return tl::unexpected(Error{
                    ErrorCode::TransportFailed,
                    "Failed to create HTTP transport"
                });
            }
        }

        return std::unique_ptr<Agent>(new Agent(config, std::move(transport)));
    }

    /**
     * @brief Destructor - cancels running exchanges and joins the workers
     */
    ~Agent() {
        stop();
    }

    // Non-copyable and non-movable (worker threads capture `this`)
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    /**
     * @brief Start one exchange.
     *
     * The history is copied; the caller may keep extending its own copy.
     * When the exchange cannot be queued (agent stopped, queue full) the
     * future is ready immediately and on_error fires on the calling thread.
     *
     * @param history Prior user/assistant turns
     * @param user_message New user message
     * @param callbacks Streaming and lifecycle callbacks (run on a worker thread)
     * @return ExchangeHandle with request ID, future and cancel()
     */
    ExchangeHandle run_exchange(
        std::vector<Message> history,
        Message user_message,
        ExchangeCallbacks callbacks = {}
    ) {
        auto promise = std::make_shared<std::promise<Expected<ExchangeResult>>>();
        auto future = promise->get_future();
        RequestId request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);

        ExchangeRequest request(std::move(history), std::move(user_message), std::move(callbacks));
        request.promise = promise;
        request.id = request_id;
        CancelToken token = request.cancelled;

        if (!running_.load(std::memory_order_acquire)) {
            reject(request, Error{ErrorCode::AgentNotRunning, "Agent is not running"});
            return ExchangeHandle{request_id, std::move(future), std::move(token)};
        }

        {
            std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
            cancel_tokens_[request_id] = token;
        }

        // push() consumes the request; keep what the failure path needs
        auto on_error = request.callbacks.on_error;
        if (auto pushed = request_queue_->push(std::move(request)); !pushed) {
            forget_token(request_id);
            if (on_error) {
                on_error(pushed.error());
            }
            promise->set_value(tl::unexpected(pushed.error()));
        }

        return ExchangeHandle{request_id, std::move(future), std::move(token)};
    }

    /**
     * @brief Cancel an exchange by ID
     *
     * A queued exchange fails with RequestCancelled when dequeued; a running
     * one stops at its next chunk read or tool wait. Unknown or finished IDs
     * are ignored.
     */
    void cancel(RequestId id) {
        std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
        auto it = cancel_tokens_.find(id);
        if (it != cancel_tokens_.end()) {
            it->second->store(true, std::memory_order_release);
        }
    }

    /**
     * @brief Stop the agent and wait for the workers to finish
     *
     * Running exchanges are cancelled; queued ones fail with AgentNotRunning.
     * Can be called multiple times safely.
     */
    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

        request_queue_->shutdown();
        {
            std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
            for (auto& [id, token] : cancel_tokens_) {
                token->store(true, std::memory_order_release);
            }
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        for (auto& remaining : request_queue_->drain()) {
            reject(remaining, Error{
                ErrorCode::AgentNotRunning,
                "Agent stopped before request could be processed"
            });
        }
        GURGEH_LOG_DEBUG("agent stopped");
    }

    bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    const Config& get_config() const {
        return config_;
    }

    /**
     * @brief Register a tool with automatic schema generation
     *
     * Supported parameter types: int, double, bool, std::string
     */
    template<typename Func>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func) {
        tool_registry_->register_tool(name, description, param_names, std::move(func));
    }

    /**
     * @brief Register a tool with an explicit parameters schema
     */
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, engine::ToolHandler handler) {
        tool_registry_->register_tool(name, description, std::move(schema), std::move(handler));
    }

    /// Registry shared with every exchange; safe to extend while running.
    engine::ToolRegistry& tools() {
        return *tool_registry_;
    }

    size_t tool_count() const {
        return tool_registry_->size();
    }

private:
    Agent(const Config& config, std::unique_ptr<transport::IHttpTransport> transport)
        : config_(config)
        , transport_(std::move(transport))
        , request_queue_(std::make_shared<engine::RequestQueue>(config.request_queue_capacity))
        , tool_registry_(std::make_shared<engine::ToolRegistry>())
        , agentic_loop_(std::make_shared<engine::AgenticLoop>(config, *transport_, tool_registry_))
        , running_(true)
    {
        workers_.reserve(config.worker_threads);
        for (size_t i = 0; i < config.worker_threads; ++i) {
            workers_.emplace_back([this]() {
                worker_loop();
            });
        }
    }

    /**
     * @brief Worker thread loop
     *
     * Processes exchanges from the queue until shutdown.
     */
    void worker_loop() {
        while (auto request = request_queue_->pop()) {
            if (!running_.load(std::memory_order_acquire)) {
                forget_token(request->id);
                reject(*request, Error{
                    ErrorCode::AgentNotRunning,
                    "Agent stopped before request could be processed"
                });
                continue;
            }

            auto result = agentic_loop_->process_request(*request);
            forget_token(request->id);

            if (request->promise) {
                request->promise->set_value(std::move(result));
            }
        }
    }

    void forget_token(RequestId id) {
        std::lock_guard<std::mutex> lock(cancel_tokens_mutex_);
        cancel_tokens_.erase(id);
    }

    static void reject(ExchangeRequest& request, const Error& error) {
        if (request.callbacks.on_error) {
            request.callbacks.on_error(error);
        }
        if (request.promise) {
            request.promise->set_value(tl::unexpected(error));
        }
    }

    Config config_;

    std::unique_ptr<transport::IHttpTransport> transport_;
    std::shared_ptr<engine::RequestQueue> request_queue_;
    std::shared_ptr<engine::ToolRegistry> tool_registry_;
    std::shared_ptr<engine::AgenticLoop> agentic_loop_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> next_request_id_{1};

    std::mutex cancel_tokens_mutex_;
    std::unordered_map<RequestId, CancelToken> cancel_tokens_;
};

} // namespace gurgeh
