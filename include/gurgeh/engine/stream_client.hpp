#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include "../transport/IHttpTransport.hpp"
#include "sse_decoder.hpp"
#include "tool_call_accumulator.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gurgeh {
namespace engine {

/**
 * @brief Everything one streamed round produced.
 */
struct RoundOutput {
    std::string text;                              ///< Concatenated assistant text
    std::vector<CompletedToolCall> tool_calls;     ///< First-seen order, arguments parsed once
    std::optional<std::string> finish_reason;
    std::optional<TokenUsage> usage;
    size_t records = 0;                            ///< Data records processed
    size_t malformed_records = 0;                  ///< Records skipped as unparsable
    bool saw_done = false;                         ///< Stream ended with the [DONE] sentinel
};

/**
 * @brief OpenAI-compatible streaming chat-completions client.
 *
 * One run_round() call performs one HTTP POST and reads the event stream to
 * its end. Text deltas are handed to the caller as soon as their record is
 * complete; tool-call fragments are merged into a per-round accumulator.
 * Malformed records are skipped individually. Nothing is retried here.
 *
 * @threadsafety run_round() may be called concurrently provided the
 * transport supports concurrent requests; the client holds no round state.
 */
class StreamClient {
public:
    using TextCallback = std::function<void(std::string_view)>;

    StreamClient(const Config& config, transport::IHttpTransport& transport)
        : config_(config)
        , transport_(transport)
    {}

    /**
     * @brief Build the JSON request body for one round.
     *
     * @param messages Wire `messages` array (see TranscriptBuilder::to_wire_json)
     * @param tools Wire tool definitions; omitted from the body when empty
     */
    nlohmann::json build_request_body(const nlohmann::json& messages, const nlohmann::json& tools) const {
        nlohmann::json body = {
            {"model", config_.model},
            {"messages", messages},
            {"stream", true}
        };
        if (tools.is_array() && !tools.empty()) {
            body["tools"] = tools;
        }
        if (config_.temperature.has_value()) {
            body["temperature"] = *config_.temperature;
        }
        if (config_.max_tokens.has_value()) {
            body["max_tokens"] = *config_.max_tokens;
        }
        return body;
    }

    transport::HttpRequest build_http_request(const nlohmann::json& body) const {
        transport::HttpRequest request;
        request.url = config_.completions_url();
        request.headers = {
            {"Authorization", "Bearer " + config_.api_key},
            {"Content-Type", "application/json"},
            {"Accept", "text/event-stream"}
        };
        if (!config_.http_referer.empty()) {
            request.headers.emplace_back("HTTP-Referer", config_.http_referer);
        }
        if (!config_.app_title.empty()) {
            request.headers.emplace_back("X-Title", config_.app_title);
        }
        request.body = body.dump();
        request.connect_timeout = config_.connect_timeout;
        request.total_timeout = config_.request_timeout;
        request.idle_timeout = config_.read_idle_timeout;
        return request;
    }

    /**
     * @brief Perform one round.
     *
     * @param messages Wire transcript
     * @param tools Wire tool definitions
     * @param on_text Receives each text delta in wire order
     * @param cancel Optional cancellation flag, checked on every chunk
     * @return RoundOutput, or a transport-class error (HttpStatusError,
     *         TransportFailed, ReadTimeout, ProviderError) or RequestCancelled
     */
    Expected<RoundOutput> run_round(
        const nlohmann::json& messages,
        const nlohmann::json& tools,
        const TextCallback& on_text,
        const std::atomic<bool>* cancel = nullptr
    ) const {
        RoundState state;
        state.on_text = &on_text;

        auto request = build_http_request(build_request_body(messages, tools));

        transport::ChunkCallback on_chunk = [&](std::string_view bytes) -> bool {
            if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
                return false;
            }
            for (auto& event : state.decoder.feed(bytes)) {
                process_record(event.data, state);
                if (state.provider_error.has_value()) {
                    return false;
                }
            }
            return true;
        };

        auto response = transport_.post_stream(request, on_chunk, cancel);

        if (state.provider_error.has_value()) {
            GURGEH_LOG_ERROR("provider reported an error: " << state.provider_error->message);
            return tl::unexpected(*state.provider_error);
        }
        if (!response) {
            if (response.error().code != ErrorCode::RequestCancelled) {
                GURGEH_LOG_ERROR("transport failure: " << response.error().to_string());
            }
            return tl::unexpected(response.error());
        }
        if (response->status < 200 || response->status >= 300) {
            GURGEH_LOG_ERROR("HTTP status " << response->status << " from " << request.url);
            Error error{
                ErrorCode::HttpStatusError,
                "HTTP " + std::to_string(response->status) + provider_message(response->error_body),
                response->error_body
            };
            error.http_status = response->status;
            return tl::unexpected(std::move(error));
        }

        if (auto last = state.decoder.finish()) {
            process_record(last->data, state);
            if (state.provider_error.has_value()) {
                return tl::unexpected(*state.provider_error);
            }
        }

        if (!state.output.saw_done) {
            GURGEH_LOG_DEBUG("stream ended without [DONE] after " << state.output.records << " records");
        }
        state.output.tool_calls = state.accumulator.complete();
        return std::move(state.output);
    }

private:
    struct RoundState {
        SseDecoder decoder;
        ToolCallAccumulator accumulator;
        RoundOutput output;
        std::optional<Error> provider_error;
        const TextCallback* on_text = nullptr;
    };

    static void process_record(const std::string& data, RoundState& state) {
        std::string_view payload(data);
        while (!payload.empty() && (payload.front() == ' ' || payload.front() == '\t')) {
            payload.remove_prefix(1);
        }
        while (!payload.empty() && (payload.back() == ' ' || payload.back() == '\t')) {
            payload.remove_suffix(1);
        }
        if (payload.empty()) {
            return;
        }
        if (payload == "[DONE]") {
            state.output.saw_done = true;
            return;
        }

        auto j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) {
            // Some providers put several JSON documents on consecutive data lines
            if (payload.find('\n') != std::string_view::npos) {
                size_t start = 0;
                while (start <= payload.size()) {
                    size_t nl = payload.find('\n', start);
                    auto line = payload.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
                    if (!line.empty()) {
                        process_record(std::string(line), state);
                    }
                    if (nl == std::string_view::npos) {
                        break;
                    }
                    start = nl + 1;
                }
                return;
            }
            ++state.output.malformed_records;
            GURGEH_LOG_DEBUG("skipping malformed stream record (" << payload.size() << " bytes)");
            return;
        }

        ++state.output.records;
        apply_payload(j, state);
    }

    static void apply_payload(const nlohmann::json& j, RoundState& state) {
        if (!j.is_object()) {
            ++state.output.malformed_records;
            return;
        }

        auto err_it = j.find("error");
        if (err_it != j.end() && !err_it->is_null()) {
            std::string message = "Provider error";
            if (err_it->is_object()) {
                auto msg_it = err_it->find("message");
                if (msg_it != err_it->end() && msg_it->is_string()) {
                    message = msg_it->get<std::string>();
                }
            } else if (err_it->is_string()) {
                message = err_it->get<std::string>();
            }
            state.provider_error = Error{ErrorCode::ProviderError, message, err_it->dump()};
            return;
        }

        auto usage_it = j.find("usage");
        if (usage_it != j.end() && usage_it->is_object()) {
            TokenUsage usage;
            usage.prompt_tokens = int_field(*usage_it, "prompt_tokens");
            usage.completion_tokens = int_field(*usage_it, "completion_tokens");
            usage.total_tokens = int_field(*usage_it, "total_tokens");
            state.output.usage = usage;
        }

        auto choices_it = j.find("choices");
        if (choices_it == j.end() || !choices_it->is_array() || choices_it->empty()) {
            return;
        }
        const auto& choice = (*choices_it)[0];
        if (!choice.is_object()) {
            return;
        }

        auto finish_it = choice.find("finish_reason");
        if (finish_it != choice.end() && finish_it->is_string()) {
            state.output.finish_reason = finish_it->get<std::string>();
        }

        auto delta_it = choice.find("delta");
        if (delta_it == choice.end() || !delta_it->is_object()) {
            return;
        }

        auto content_it = delta_it->find("content");
        if (content_it != delta_it->end() && content_it->is_string()) {
            const auto& text = content_it->get_ref<const std::string&>();
            if (!text.empty()) {
                state.output.text += text;
                if (state.on_text != nullptr && *state.on_text) {
                    (*state.on_text)(text);
                }
            }
        }

        auto calls_it = delta_it->find("tool_calls");
        if (calls_it != delta_it->end() && calls_it->is_array()) {
            for (const auto& fragment : *calls_it) {
                state.accumulator.apply(ToolCallFragment::from_delta(fragment));
            }
        }
    }

    // Token counts are non-negative integers; anything else reads as 0 and
    // oversized values saturate.
    static int int_field(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) {
            return 0;
        }
        if (it->is_number_unsigned()) {
            const auto v = it->get<std::uint64_t>();
            return v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                ? std::numeric_limits<int>::max()
                : static_cast<int>(v);
        }
        if (it->is_number_integer()) {
            const auto v = it->get<std::int64_t>();
            if (v < 0) {
                return 0;
            }
            return v > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(v);
        }
        return 0;
    }

    // ": <message>" from a JSON error body, empty when the body has none
    static std::string provider_message(const std::string& body) {
        auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            return {};
        }
        auto err_it = j.find("error");
        if (err_it == j.end()) {
            return {};
        }
        if (err_it->is_object()) {
            auto msg_it = err_it->find("message");
            if (msg_it != err_it->end() && msg_it->is_string()) {
                return ": " + msg_it->get<std::string>();
            }
        } else if (err_it->is_string()) {
            return ": " + err_it->get<std::string>();
        }
        return {};
    }

    Config config_;
    transport::IHttpTransport& transport_;
};

} // namespace engine
} // namespace gurgeh
