#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../transport/IHttpTransport.hpp"
#include "stream_client.hpp"
#include "tool_call_accumulator.hpp"
#include "tool_executor.hpp"
#include "tool_registry.hpp"
#include "transcript_builder.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace engine {

/**
 * @brief Bounded model/tool loop driving one exchange.
 *
 * States: AwaitingModel -> AwaitingToolResults -> AwaitingModel -> ... ->
 * Done | Failed. Each model invocation consumes one round of the budget;
 * when the budget is spent and the model still asked for tools, the
 * exchange ends in Done with the latest round's text (a soft stop).
 *
 * Tool calls of a round run sequentially in first-seen order, so their
 * results enter the transcript in that order. Unknown tools, unparsable
 * arguments, failing executors and timeouts produce failed ToolResults and
 * never end the exchange; only transport-class errors and cancellation do.
 *
 * The loop holds no per-exchange state between calls, so one instance can
 * serve several worker threads.
 */
class AgenticLoop {
public:
    AgenticLoop(
        const Config& config,
        transport::IHttpTransport& transport,
        std::shared_ptr<const ToolRegistry> registry
    )
        : config_(config)
        , client_(config, transport)
        , registry_(std::move(registry))
        , executor_(registry_, config.tool_timeout)
    {}

    /**
     * @brief Process a single exchange to its terminal state.
     *
     * @param request History, new user message, callbacks and cancel token
     * @return ExchangeResult in state Done or Failed; an error only when the
     *         exchange could not start (cancelled before start, invalid history).
     *         on_error also fires in that case.
     */
    Expected<ExchangeResult> process_request(const ExchangeRequest& request) const {
        const std::atomic<bool>* cancel = request.cancelled.get();
        auto is_cancelled = [cancel]() {
            return cancel != nullptr && cancel->load(std::memory_order_acquire);
        };

        const auto& callbacks = request.callbacks;
        auto reject = [&callbacks](Error error) -> Expected<ExchangeResult> {
            if (callbacks.on_error) {
                callbacks.on_error(error);
            }
            return tl::unexpected(std::move(error));
        };

        if (is_cancelled()) {
            return reject(Error{ErrorCode::RequestCancelled, "Request cancelled before start"});
        }

        TranscriptBuilder transcript(config_.system_prompt);
        if (auto begun = transcript.begin(request.history, request.user_message); !begun) {
            return reject(begun.error());
        }

        const auto start_time = std::chrono::steady_clock::now();
        const nlohmann::json tools = registry_->get_all_schemas();

        ExchangeResult result;
        std::optional<std::chrono::steady_clock::time_point> first_chunk_time;
        StreamClient::TextCallback on_text = [&](std::string_view text) {
            if (!first_chunk_time) {
                first_chunk_time = std::chrono::steady_clock::now();
            }
            if (callbacks.on_chunk) {
                callbacks.on_chunk(text);
            }
        };

        ExchangeState state = ExchangeState::AwaitingModel;
        int remaining_rounds = config_.max_rounds;
        std::string latest_text;
        std::vector<CompletedToolCall> round_calls;
        std::optional<Error> failure;

        while (state != ExchangeState::Done && state != ExchangeState::Failed) {
            if (state == ExchangeState::AwaitingModel) {
                if (is_cancelled()) {
                    failure = Error{ErrorCode::RequestCancelled, "Request cancelled"};
                    state = ExchangeState::Failed;
                    continue;
                }
                if (remaining_rounds <= 0) {
                    GURGEH_LOG_INFO("round budget of " << config_.max_rounds
                                    << " exhausted; ending exchange with latest text");
                    result.budget_exhausted = true;
                    state = ExchangeState::Done;
                    continue;
                }

                --remaining_rounds;
                ++result.rounds_used;
                GURGEH_LOG_DEBUG("round " << result.rounds_used << " started, "
                                 << remaining_rounds << " remaining");

                auto round = client_.run_round(transcript.to_wire_json(), tools, on_text, cancel);
                if (!round) {
                    failure = round.error();
                    state = ExchangeState::Failed;
                    continue;
                }

                if (round->usage.has_value()) {
                    result.usage.prompt_tokens += round->usage->prompt_tokens;
                    result.usage.completion_tokens += round->usage->completion_tokens;
                    result.usage.total_tokens += round->usage->total_tokens;
                }
                if (round->malformed_records > 0) {
                    GURGEH_LOG_WARN("round " << result.rounds_used << " skipped "
                                    << round->malformed_records << " malformed records");
                }
                GURGEH_LOG_DEBUG("round " << result.rounds_used << " ended: "
                                 << round->text.size() << " text bytes, "
                                 << round->tool_calls.size() << " tool calls");

                latest_text = std::move(round->text);
                if (round->tool_calls.empty()) {
                    state = ExchangeState::Done;
                    continue;
                }
                round_calls = std::move(round->tool_calls);
                state = ExchangeState::AwaitingToolResults;
                continue;
            }

            // AwaitingToolResults
            std::vector<ToolCall> issued;
            issued.reserve(round_calls.size());
            for (const auto& completed : round_calls) {
                ToolCall call = completed.call;
                // Providers reject unparsable argument text when it is replayed
                call.arguments = completed.arguments ? completed.arguments->dump() : "{}";
                issued.push_back(std::move(call));
            }
            if (auto appended = transcript.append_tool_calls(latest_text, std::move(issued)); !appended) {
                failure = appended.error();
                state = ExchangeState::Failed;
                continue;
            }

            for (const auto& completed : round_calls) {
                if (is_cancelled()) {
                    failure = Error{ErrorCode::RequestCancelled, "Request cancelled during tool execution"};
                    break;
                }

                auto tool_result = run_tool(completed, callbacks, cancel);
                if (!tool_result) {
                    failure = tool_result.error();
                    break;
                }
                ++result.tool_invocations;

                if (auto appended = transcript.append_tool_result(
                        completed.call.id, tool_result->to_transcript_content()); !appended) {
                    failure = appended.error();
                    break;
                }
            }
            round_calls.clear();
            state = failure.has_value() ? ExchangeState::Failed : ExchangeState::AwaitingModel;
        }

        result.state = state;
        result.new_messages = transcript.exchange_messages();
        if (state == ExchangeState::Done) {
            result.text = latest_text;
            result.new_messages.push_back(Message::assistant(latest_text));
        } else {
            if (failure->code == ErrorCode::RequestCancelled) {
                GURGEH_LOG_INFO("exchange cancelled after " << result.rounds_used << " rounds");
            } else {
                GURGEH_LOG_ERROR("exchange failed: " << failure->to_string());
            }
            result.text = latest_text;
            result.new_messages.push_back(Message::assistant(user_facing_message(*failure)));
            result.error = failure;
        }

        const auto end_time = std::chrono::steady_clock::now();
        result.metrics.latency_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        if (first_chunk_time) {
            result.metrics.time_to_first_chunk_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(*first_chunk_time - start_time);
        }

        if (state == ExchangeState::Done) {
            if (callbacks.on_complete) {
                callbacks.on_complete(result.text);
            }
        } else if (callbacks.on_error) {
            callbacks.on_error(*result.error);
        }
        return result;
    }

    int max_rounds() const { return config_.max_rounds; }

private:
    /**
     * @brief Resolve, announce, execute and report one completed call.
     *
     * Exactly one on_tool_start and one on_tool_result fire per call unless
     * the exchange is cancelled while the tool runs.
     */
    Expected<ToolResult> run_tool(
        const CompletedToolCall& completed,
        const ExchangeCallbacks& callbacks,
        const std::atomic<bool>* cancel
    ) const {
        const auto& call = completed.call;
        const nlohmann::json shown_args = completed.arguments
            ? *completed.arguments
            : nlohmann::json(call.arguments);

        if (callbacks.on_tool_start) {
            callbacks.on_tool_start(call.name, shown_args);
        }

        ToolResult tool_result;
        if (!completed.arguments) {
            GURGEH_LOG_WARN("tool call " << call.id << " (" << call.name << ") has unparsable arguments");
            tool_result = ToolResult::failure(
                completed.arguments.error().message + " for tool '" + call.name + "'");
        } else if (call.name.empty() || !registry_->has_tool(call.name)) {
            GURGEH_LOG_WARN("tool call " << call.id << " names unknown tool '" << call.name << "'");
            tool_result = ToolResult::failure("Unknown tool: " + call.name);
        } else {
            GURGEH_LOG_INFO("running tool " << call.name << " (" << call.id << ")");
            auto executed = executor_.run(call.name, *completed.arguments, cancel);
            if (!executed) {
                return tl::unexpected(executed.error());
            }
            tool_result = std::move(*executed);
            if (!tool_result.success) {
                GURGEH_LOG_WARN("tool " << call.name << " failed: " << tool_result.payload.dump());
            }
        }

        if (callbacks.on_tool_result) {
            callbacks.on_tool_result(call.name, tool_result.to_json());
        }
        return tool_result;
    }

    Config config_;
    StreamClient client_;
    std::shared_ptr<const ToolRegistry> registry_;
    ToolExecutor executor_;
};

} // namespace engine
} // namespace gurgeh
