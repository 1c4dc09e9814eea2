#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace gurgeh {
namespace engine {

/** @brief One dispatched server-sent-event record. */
struct SseEvent {
    std::string event;  ///< Value of the last "event:" field, empty if none
    std::string data;   ///< "data:" field values joined with '\n'

    bool operator==(const SseEvent& other) const {
        return event == other.event && data == other.data;
    }
};

/**
 * @brief Incremental decoder for a `text/event-stream` body.
 *
 * Bytes may be fed at arbitrary boundaries, including inside a line or
 * between '\r' and '\n'. A record is dispatched on the blank line that ends
 * it. Comment lines (leading ':') count as heartbeats and are otherwise
 * ignored, as are "id:" and "retry:" fields.
 *
 * @threadsafety Not thread-safe. One decoder per response stream.
 */
class SseDecoder {
public:
    /**
     * @brief Consume a chunk of the response body.
     *
     * @return Records completed by this chunk, in stream order
     */
    std::vector<SseEvent> feed(std::string_view bytes) {
        std::vector<SseEvent> events;
        buffer_.append(bytes.data(), bytes.size());

        size_t start = 0;
        while (true) {
            size_t nl = buffer_.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            size_t end = nl;
            if (end > start && buffer_[end - 1] == '\r') {
                --end;
            }
            process_line(std::string_view(buffer_).substr(start, end - start), events);
            start = nl + 1;
        }
        buffer_.erase(0, start);
        return events;
    }

    /**
     * @brief Flush at end of stream.
     *
     * Providers sometimes close the connection without the final blank line;
     * any unterminated line and pending record are dispatched here.
     */
    std::optional<SseEvent> finish() {
        std::vector<SseEvent> events;
        if (!buffer_.empty()) {
            std::string_view line(buffer_);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            process_line(line, events);
            buffer_.clear();
        }
        dispatch(events);
        if (events.empty()) {
            return std::nullopt;
        }
        return std::move(events.back());
    }

    void reset() {
        buffer_.clear();
        data_.clear();
        event_.clear();
        has_data_ = false;
        heartbeats_ = 0;
    }

    size_t heartbeats() const { return heartbeats_; }

private:
    void process_line(std::string_view line, std::vector<SseEvent>& events) {
        if (line.empty()) {
            dispatch(events);
            return;
        }
        if (line.front() == ':') {
            ++heartbeats_;
            return;
        }

        std::string_view field = line;
        std::string_view value;
        size_t colon = line.find(':');
        if (colon != std::string_view::npos) {
            field = line.substr(0, colon);
            value = line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.remove_prefix(1);
            }
        }

        if (field == "data") {
            if (has_data_) {
                data_.push_back('\n');
            }
            data_.append(value.data(), value.size());
            has_data_ = true;
        } else if (field == "event") {
            event_.assign(value.data(), value.size());
        }
    }

    void dispatch(std::vector<SseEvent>& events) {
        if (has_data_) {
            events.push_back(SseEvent{std::move(event_), std::move(data_)});
        }
        data_.clear();
        event_.clear();
        has_data_ = false;
    }

    std::string buffer_;
    std::string data_;
    std::string event_;
    bool has_data_ = false;
    size_t heartbeats_ = 0;
};

} // namespace engine
} // namespace gurgeh
