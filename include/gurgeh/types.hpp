#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <optional>
#include <functional>
#include <atomic>
#include <memory>
#include <future>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace gurgeh {

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Message role in conversation flow
 *
 * Defines the source and purpose of a message in the transcript.
 */
enum class Role {
    System,     ///< Fixed coach instructions
    User,       ///< Input from the player
    Assistant,  ///< Model-generated text and/or tool call requests
    Tool        ///< Result of one tool execution
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

/**
 * @brief A model-issued request to execute a named tool
 *
 * Arguments are kept as the raw text the provider streamed; they are parsed
 * exactly once, when the round that produced the call has ended.
 */
struct ToolCall {
    std::string id;          ///< Opaque identifier, unique within a round
    std::string name;        ///< Tool name as requested by the model
    std::string arguments;   ///< Raw argument text (expected to be a JSON object)

    bool operator==(const ToolCall& other) const {
        return id == other.id && name == other.name && arguments == other.arguments;
    }
    bool operator!=(const ToolCall& other) const { return !(*this == other); }
};

/**
 * @brief Single message in a transcript
 *
 * Value type representing one turn. Assistant messages may carry the tool
 * calls they issued (content may then be empty); tool messages carry the
 * identifier of the call they answer.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Message {
    Role role;                                 ///< Message role (system/user/assistant/tool)
    std::string content;                       ///< Text content of the message
    std::vector<ToolCall> tool_calls;          ///< Calls issued by this message (assistant only)
    std::optional<std::string> tool_call_id;   ///< Back-reference to a ToolCall id (tool only)

    // Factory methods
    static Message system(std::string content) {
        return Message{Role::System, std::move(content), {}, std::nullopt};
    }

    static Message user(std::string content) {
        return Message{Role::User, std::move(content), {}, std::nullopt};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content), {}, std::nullopt};
    }

    static Message assistant_with_calls(std::string content, std::vector<ToolCall> calls) {
        return Message{Role::Assistant, std::move(content), std::move(calls), std::nullopt};
    }

    static Message tool(std::string content, std::string tool_call_id) {
        return Message{Role::Tool, std::move(content), {}, std::move(tool_call_id)};
    }

    // Equality for testing
    bool operator==(const Message& other) const {
        return role == other.role &&
               content == other.content &&
               tool_calls == other.tool_calls &&
               tool_call_id == other.tool_call_id;
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Transport errors (the only class that ends an exchange abnormally)
 * - 300-399: Transcript/engine errors
 * - 400-499: Runtime/request errors
 * - 500-599: Tool errors (always contained to one call)
 * - 600-699: Data source errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    MissingApiKey = 101,
    InvalidModel = 102,

    // Transport errors (200-299)
    TransportFailed = 200,
    HttpStatusError = 201,
    ReadTimeout = 202,
    ProviderError = 203,
    MalformedRecord = 204,

    // Engine errors (300-399)
    InvalidMessageSequence = 300,
    UnmatchedToolCall = 301,

    // Runtime errors (400-499)
    AgentNotRunning = 400,
    RequestCancelled = 401,
    QueueFull = 402,

    // Tool errors (500-599)
    ToolNotFound = 500,
    ToolExecutionFailed = 501,
    InvalidToolSignature = 502,
    ToolArgumentParseFailed = 503,
    ToolTimeout = 504,

    // Data source errors (600-699)
    DataSourceFailed = 600,
    ProfileNotFound = 601,

    // Unknown
    Unknown = 999
};

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (e.g., response body, URL)
    std::optional<int> http_status;      ///< Response status, set on HttpStatusError

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }

    bool is_transport_error() const {
        const int value = static_cast<int>(code);
        return value >= 200 && value < 300;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

/**
 * @brief Short explanation shown to the player when an exchange fails.
 */
inline std::string user_facing_message(const Error& error) {
    switch (error.code) {
        case ErrorCode::HttpStatusError:
            if (error.http_status == 401) {
                return "I could not reach the coaching service: the API key was rejected. "
                       "Please check your key in Settings.";
            }
            return "The coaching service returned an error (" + error.message + "). Please try again.";
        case ErrorCode::ReadTimeout:
            return "The coaching service took too long to respond. Please try again.";
        case ErrorCode::TransportFailed:
            return "I could not connect to the coaching service. Please check your connection.";
        case ErrorCode::ProviderError:
            return "The model provider reported an error: " + error.message;
        case ErrorCode::RequestCancelled:
            return "Stopped.";
        case ErrorCode::MissingApiKey:
            return "I need an API key to respond. Please configure your OpenRouter API key in Settings.";
        default:
            return "Something went wrong: " + error.message;
    }
}

// ============================================================================
// Tool Results
// ============================================================================

/**
 * @brief Outcome of executing one ToolCall
 *
 * Always serializable: a success carries the projected payload, a failure
 * carries a description. Failures never abort the round that produced them.
 */
struct ToolResult {
    bool success = false;
    nlohmann::json payload;   ///< Projected data on success, error text on failure

    static ToolResult ok(nlohmann::json data) {
        return ToolResult{true, std::move(data)};
    }

    static ToolResult failure(std::string description) {
        return ToolResult{false, nlohmann::json(std::move(description))};
    }

    /// JSON object handed to callbacks: success payloads gain "success": true,
    /// failures become {"success": false, "error": ...}.
    nlohmann::json to_json() const {
        if (!success) {
            return nlohmann::json{
                {"success", false},
                {"error", payload.is_string() ? payload.get<std::string>() : payload.dump()}
            };
        }
        if (payload.is_object()) {
            if (payload.contains("success")) {
                return payload;
            }
            nlohmann::json out = nlohmann::json{{"success", true}};
            out.update(payload);
            return out;
        }
        return nlohmann::json{{"success", true}, {"result", payload}};
    }

    /// Text placed in the tool-role transcript message.
    std::string to_transcript_content() const {
        return to_json().dump();
    }

    bool operator==(const ToolResult& other) const {
        return success == other.success && payload == other.payload;
    }
    bool operator!=(const ToolResult& other) const { return !(*this == other); }
};

// ============================================================================
// Agent Configuration
// ============================================================================

/**
 * @brief Complete configuration for an Agent
 *
 * Supplied by the caller; the engine never reads environment variables or
 * files. Must be validated via validate() before use.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    // Provider
    std::string api_key;                                          ///< Bearer credential (required)
    std::string base_url = "https://openrouter.ai/api/v1";        ///< Provider base URL
    std::string model = "anthropic/claude-3-haiku";               ///< Target model identifier
    std::string http_referer = "https://github.com/tacticus-chess"; ///< Attribution header
    std::string app_title = "Tacticus Chess Trainer";             ///< Attribution header

    // Loop
    int max_rounds = 5;                                           ///< Model-round budget per exchange (> 0)

    // Timeouts
    std::chrono::milliseconds request_timeout{120000};            ///< Whole-round network timeout
    std::chrono::milliseconds connect_timeout{10000};             ///< Connection establishment timeout
    std::chrono::milliseconds read_idle_timeout{30000};           ///< Abort when the stream stalls this long
    std::chrono::milliseconds tool_timeout{10000};                ///< Per tool execution

    // Sampling (sent only when set)
    std::optional<float> temperature;
    std::optional<int> max_tokens;

    // System prompt (empty = no system message)
    std::string system_prompt;

    // Threading
    size_t worker_threads = 1;                                    ///< Exchanges processed concurrently
    size_t request_queue_capacity = 0;                            ///< Pending exchange limit (0 = unlimited)

    // Validation
    Expected<void> validate() const {
        if (api_key.empty()) {
            return tl::unexpected(Error{ErrorCode::MissingApiKey, "API key cannot be empty"});
        }
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidModel, "Model identifier cannot be empty"});
        }
        if (base_url.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Base URL cannot be empty"});
        }
        if (max_rounds <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_rounds must be positive"});
        }
        if (request_timeout.count() <= 0 || connect_timeout.count() <= 0 ||
            read_idle_timeout.count() <= 0 || tool_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Timeouts must be positive"});
        }
        if (max_tokens.has_value() && *max_tokens <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_tokens must be positive"});
        }
        if (worker_threads == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "worker_threads must be at least 1"});
        }
        return {};
    }

    /// Full chat-completions endpoint.
    std::string completions_url() const {
        if (!base_url.empty() && base_url.back() == '/') {
            return base_url + "chat/completions";
        }
        return base_url + "/chat/completions";
    }
};

// ============================================================================
// Exchange Types
// ============================================================================

/**
 * @brief Agent Loop state machine states
 */
enum class ExchangeState {
    AwaitingModel,
    AwaitingToolResults,
    Done,
    Failed
};

[[nodiscard]] inline const char* state_to_string(ExchangeState state) {
    switch (state) {
        case ExchangeState::AwaitingModel: return "AwaitingModel";
        case ExchangeState::AwaitingToolResults: return "AwaitingToolResults";
        case ExchangeState::Done: return "Done";
        case ExchangeState::Failed: return "Failed";
    }
    return "unknown";
}

/**
 * @brief Caller-supplied callbacks for one exchange
 *
 * All callbacks run on the worker thread executing the exchange. Any may be
 * left empty. Exactly one of on_complete / on_error fires per exchange.
 */
struct ExchangeCallbacks {
    std::function<void(std::string_view)> on_chunk;                                   ///< Live assistant text
    std::function<void(const std::string&, const nlohmann::json&)> on_tool_start;     ///< Name + parsed arguments
    std::function<void(const std::string&, const nlohmann::json&)> on_tool_result;    ///< Name + result object
    std::function<void(const std::string&)> on_complete;                              ///< Final text
    std::function<void(const Error&)> on_error;                                       ///< Exchange failed
};

/**
 * @brief Token usage reported by the provider, summed over rounds
 */
struct TokenUsage {
    int prompt_tokens = 0;
    int completion_tokens = 0;
    int total_tokens = 0;

    bool operator==(const TokenUsage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const TokenUsage& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Timing data for one exchange
 */
struct Metrics {
    std::chrono::milliseconds latency_ms{0};             ///< Exchange start to terminal state
    std::chrono::milliseconds time_to_first_chunk_ms{0}; ///< Exchange start to first text chunk
};

/**
 * @brief Terminal outcome of one exchange
 *
 * new_messages holds everything the exchange appended to its transcript
 * (assistant tool-call messages, tool results, and the final assistant
 * message, or the failure explanation when state is Failed).
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ExchangeResult {
    ExchangeState state = ExchangeState::Done;
    std::string text;                       ///< Final text (best available on soft stop)
    std::vector<Message> new_messages;      ///< Transcript additions, in order
    int rounds_used = 0;                    ///< Model invocations performed
    int tool_invocations = 0;               ///< Tool calls executed
    bool budget_exhausted = false;          ///< Soft stop on round budget
    TokenUsage usage;
    Metrics metrics;
    std::optional<Error> error;             ///< Set when state is Failed
};

/// Unique identifier for an exchange, used for per-exchange cancellation.
using RequestId = uint64_t;

/// Shared cancellation flag checked at every suspension point.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief Handle returned from Agent::run_exchange()
 *
 * The future yields an error only when the exchange could not start
 * (agent stopped, queue full, invalid history); once started, the outcome
 * is an ExchangeResult in state Done or Failed.
 */
struct ExchangeHandle {
    RequestId id;
    std::future<Expected<ExchangeResult>> future;
    CancelToken cancel_token;

    // Move-only (std::future is not copyable)
    ExchangeHandle() : id(0) {}
    ExchangeHandle(RequestId id, std::future<Expected<ExchangeResult>> future, CancelToken token)
        : id(id), future(std::move(future)), cancel_token(std::move(token)) {}
    ExchangeHandle(ExchangeHandle&&) = default;
    ExchangeHandle& operator=(ExchangeHandle&&) = default;
    ExchangeHandle(const ExchangeHandle&) = delete;
    ExchangeHandle& operator=(const ExchangeHandle&) = delete;

    /// Request cancellation; takes effect at the next chunk read or tool wait.
    void cancel() const {
        if (cancel_token) {
            cancel_token->store(true, std::memory_order_release);
        }
    }
};

/**
 * @brief Internal request representation for the worker queue
 *
 * @note This type is internal to the engine and not part of the public API
 */
struct ExchangeRequest {
    std::vector<Message> history;                                        ///< Caller's prior turns (copied)
    Message user_message;                                                ///< New user message
    ExchangeCallbacks callbacks;
    std::chrono::steady_clock::time_point submitted_at;
    std::shared_ptr<std::promise<Expected<ExchangeResult>>> promise;     ///< Bundled promise for result delivery
    RequestId id = 0;
    CancelToken cancelled;

    ExchangeRequest(
        std::vector<Message> history_in,
        Message message,
        ExchangeCallbacks callbacks_in = {}
    )
        : history(std::move(history_in))
        , user_message(std::move(message))
        , callbacks(std::move(callbacks_in))
        , submitted_at(std::chrono::steady_clock::now())
        , cancelled(std::make_shared<std::atomic<bool>>(false))
    {}
};

} // namespace gurgeh
