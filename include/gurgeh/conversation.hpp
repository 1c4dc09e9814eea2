#pragma once

#include "types.hpp"
#include <mutex>
#include <vector>

namespace gurgeh {

/**
 * @brief Caller-owned, append-only chat history
 *
 * Holds the user/assistant turns a host shows and replays. Tool traffic of
 * an exchange is not kept; each exchange contributes the user message and
 * one assistant message (the final text, or a short explanation when the
 * exchange failed).
 *
 * Thread Safety: Internally synchronized via mutex. snapshot() returns a
 * copy, which is what run_exchange() expects as history.
 */
class Conversation {
public:
    Conversation() = default;

    explicit Conversation(std::vector<Message> messages)
        : messages_(std::move(messages))
    {}

    /**
     * @brief Append a plain user or assistant turn
     *
     * @return InvalidMessageSequence for system or tool messages, or
     *         assistant messages carrying tool calls
     */
    Expected<void> append(Message message) {
        if ((message.role != Role::User && message.role != Role::Assistant) ||
            !message.tool_calls.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessageSequence,
                std::string("Conversation only holds user and assistant turns, got ") +
                    role_to_string(message.role)
            });
        }
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(message));
        return {};
    }

    /**
     * @brief Record the outcome of one exchange
     *
     * Appends the user message and the exchange's last assistant message.
     * For a failed exchange that message is the user-facing explanation;
     * partial text already streamed is not part of it.
     */
    void record_exchange(const Message& user_message, const ExchangeResult& result) {
        Message reply = Message::assistant(result.text);
        if (result.state == ExchangeState::Failed && result.error.has_value()) {
            reply = Message::assistant(user_facing_message(*result.error));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(user_message);
        messages_.push_back(std::move(reply));
    }

    /// Record an exchange that never started (see ExchangeHandle).
    void record_rejected(const Message& user_message, const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(user_message);
        messages_.push_back(Message::assistant(user_facing_message(error)));
    }

    std::vector<Message> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.empty();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Message> messages_;
};

} // namespace gurgeh
