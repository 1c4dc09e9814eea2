#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <string>
#include <vector>

namespace gurgeh {
namespace engine {

/**
 * @brief Builds the message sequence sent to the provider on each round.
 *
 * The transcript starts as [system prompt] + caller history + new user
 * message. Each tool round then appends one assistant message carrying the
 * round's calls, followed by exactly one tool message per call in the order
 * the calls were issued. Nothing already appended is ever reordered or
 * modified.
 *
 * @threadsafety Not thread-safe. Owned by a single exchange.
 */
class TranscriptBuilder {
public:
    explicit TranscriptBuilder(std::string system_prompt = {})
        : system_prompt_(std::move(system_prompt))
    {}

    /**
     * @brief Start a transcript for a new exchange.
     *
     * History may contain only user messages and plain assistant messages;
     * tool traffic from earlier exchanges is not replayed.
     *
     * @return InvalidMessageSequence if the history or user message is not acceptable
     */
    Expected<void> begin(const std::vector<Message>& history, Message user_message) {
        if (user_message.role != Role::User) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "New message must have the user role"
            });
        }
        for (size_t i = 0; i < history.size(); ++i) {
            const auto& msg = history[i];
            if ((msg.role != Role::User && msg.role != Role::Assistant) || !msg.tool_calls.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessageSequence,
                    "History may only contain user and assistant turns",
                    "index " + std::to_string(i) + " has role " + role_to_string(msg.role)
                });
            }
        }

        messages_.clear();
        pending_.clear();
        if (!system_prompt_.empty()) {
            messages_.push_back(Message::system(system_prompt_));
        }
        messages_.insert(messages_.end(), history.begin(), history.end());
        messages_.push_back(std::move(user_message));
        exchange_start_ = messages_.size();
        return {};
    }

    /**
     * @brief Append the assistant message that issued a round's tool calls.
     *
     * @param text Text generated before the calls (may be empty)
     * @param calls Completed calls in first-seen order
     */
    Expected<void> append_tool_calls(std::string text, std::vector<ToolCall> calls) {
        if (!pending_.empty()) {
            return tl::unexpected(Error{
                ErrorCode::UnmatchedToolCall,
                "Previous tool calls still await results",
                pending_.front()
            });
        }
        if (calls.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                "Tool-call message requires at least one call"
            });
        }
        for (size_t i = 0; i < calls.size(); ++i) {
            for (size_t j = 0; j < i; ++j) {
                if (calls[j].id == calls[i].id) {
                    return tl::unexpected(Error{
                        ErrorCode::UnmatchedToolCall,
                        "Duplicate tool call id in one round",
                        calls[i].id
                    });
                }
            }
        }
        for (const auto& call : calls) {
            pending_.push_back(call.id);
        }
        messages_.push_back(Message::assistant_with_calls(std::move(text), std::move(calls)));
        return {};
    }

    /**
     * @brief Append the result for the next outstanding call.
     *
     * Results must arrive in the order the calls were issued.
     */
    Expected<void> append_tool_result(const std::string& tool_call_id, std::string content) {
        if (pending_.empty()) {
            return tl::unexpected(Error{
                ErrorCode::UnmatchedToolCall,
                "No tool call awaits a result",
                tool_call_id
            });
        }
        if (pending_.front() != tool_call_id) {
            return tl::unexpected(Error{
                ErrorCode::UnmatchedToolCall,
                "Tool result out of order: expected " + pending_.front(),
                tool_call_id
            });
        }
        pending_.pop_front();
        messages_.push_back(Message::tool(std::move(content), tool_call_id));
        return {};
    }

    /// Append the final assistant answer (or a failure explanation).
    Expected<void> append_assistant(std::string text) {
        if (!pending_.empty()) {
            return tl::unexpected(Error{
                ErrorCode::UnmatchedToolCall,
                "Tool calls still await results",
                pending_.front()
            });
        }
        messages_.push_back(Message::assistant(std::move(text)));
        return {};
    }

    bool has_pending_calls() const { return !pending_.empty(); }

    const std::vector<Message>& messages() const { return messages_; }

    /// Messages appended after the user message that started the exchange.
    std::vector<Message> exchange_messages() const {
        if (exchange_start_ >= messages_.size()) {
            return {};
        }
        return std::vector<Message>(
            messages_.begin() + static_cast<std::ptrdiff_t>(exchange_start_), messages_.end());
    }

    /// The `messages` array of a chat-completions request.
    nlohmann::json to_wire_json() const {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& msg : messages_) {
            out.push_back(to_wire(msg));
        }
        return out;
    }

    static nlohmann::json to_wire(const Message& msg) {
        nlohmann::json j = {
            {"role", role_to_string(msg.role)},
            {"content", msg.content}
        };
        if (!msg.tool_calls.empty()) {
            nlohmann::json calls = nlohmann::json::array();
            for (const auto& call : msg.tool_calls) {
                calls.push_back({
                    {"id", call.id},
                    {"type", "function"},
                    {"function", {
                        {"name", call.name},
                        {"arguments", call.arguments}
                    }}
                });
            }
            j["tool_calls"] = std::move(calls);
        }
        if (msg.tool_call_id.has_value()) {
            j["tool_call_id"] = *msg.tool_call_id;
        }
        return j;
    }

private:
    std::string system_prompt_;
    std::vector<Message> messages_;
    std::deque<std::string> pending_;
    size_t exchange_start_ = 0;
};

} // namespace engine
} // namespace gurgeh
