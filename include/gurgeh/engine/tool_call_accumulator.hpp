#pragma once

#include "../types.hpp"
#include "../log.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace engine {

// ============================================================================
// ToolCallFragment
// ============================================================================

/**
 * @brief One incremental piece of a tool call as delivered on the wire.
 *
 * Every field is optional. An absent id means "continue the most recently
 * seen call in this response".
 */
struct ToolCallFragment {
    std::optional<std::string> id;
    std::optional<int> index;             ///< Provider-side slot index, if sent
    std::optional<std::string> name;      ///< Name fragment
    std::optional<std::string> arguments; ///< Arguments text fragment

    /**
     * @brief Read a fragment from one element of `choices[0].delta.tool_calls`.
     *
     * Empty-string ids are treated as absent. Non-string fields are ignored.
     */
    static ToolCallFragment from_delta(const nlohmann::json& j) {
        ToolCallFragment fragment;
        if (!j.is_object()) {
            return fragment;
        }
        auto id_it = j.find("id");
        if (id_it != j.end() && id_it->is_string() && !id_it->get_ref<const std::string&>().empty()) {
            fragment.id = id_it->get<std::string>();
        }
        auto index_it = j.find("index");
        if (index_it != j.end() && index_it->is_number_integer()) {
            fragment.index = index_it->get<int>();
        }
        auto fn_it = j.find("function");
        if (fn_it != j.end() && fn_it->is_object()) {
            auto name_it = fn_it->find("name");
            if (name_it != fn_it->end() && name_it->is_string()) {
                fragment.name = name_it->get<std::string>();
            }
            auto args_it = fn_it->find("arguments");
            if (args_it != fn_it->end() && args_it->is_string()) {
                fragment.arguments = args_it->get<std::string>();
            }
        }
        return fragment;
    }
};

/**
 * @brief A tool call whose round has ended, with its arguments parsed once.
 *
 * arguments holds the parsed object, or ToolArgumentParseFailed when the
 * concatenated text is not a JSON object. The failure is local to this call.
 */
struct CompletedToolCall {
    ToolCall call;
    Expected<nlohmann::json> arguments;
};

// ============================================================================
// ToolCallAccumulator
// ============================================================================

/**
 * @brief Merge buffer consolidating tool-call fragments over one round.
 *
 * Entries are kept in first-seen order. Merge rules:
 * - a fragment with an id not seen before creates a new entry;
 * - a fragment with an id seen before appends to that entry;
 * - a fragment without an id appends to the entry whose provider index
 *   matches, or else to the most recently created entry;
 * - a fragment without an id arriving before any entry exists creates one
 *   with a locally generated id.
 *
 * Argument text is appended verbatim and never parsed before complete().
 * A name fragment fills an empty name, is ignored when it repeats the
 * current name, and is appended otherwise.
 *
 * @threadsafety Not thread-safe. Owned by a single exchange.
 */
class ToolCallAccumulator {
public:
    void apply(const ToolCallFragment& fragment) {
        Slot* slot = resolve_slot(fragment);
        if (fragment.name.has_value() && !fragment.name->empty()) {
            auto& name = slot->call.name;
            if (name.empty()) {
                name = *fragment.name;
            } else if (name != *fragment.name) {
                name += *fragment.name;
            }
        }
        if (fragment.arguments.has_value()) {
            slot->call.arguments += *fragment.arguments;
        }
        ++fragments_applied_;
    }

    bool empty() const { return slots_.empty(); }
    size_t size() const { return slots_.size(); }
    size_t fragments_applied() const { return fragments_applied_; }

    /// Calls accumulated so far, in first-seen order; arguments still raw.
    std::vector<ToolCall> pending() const {
        std::vector<ToolCall> calls;
        calls.reserve(slots_.size());
        for (const auto& slot : slots_) {
            calls.push_back(slot.call);
        }
        return calls;
    }

    /**
     * @brief End the round: parse each call's arguments exactly once.
     *
     * Empty or whitespace-only argument text is treated as `{}`.
     */
    std::vector<CompletedToolCall> complete() const {
        std::vector<CompletedToolCall> completed;
        completed.reserve(slots_.size());
        for (const auto& slot : slots_) {
            completed.push_back(CompletedToolCall{slot.call, parse_arguments(slot.call.arguments)});
        }
        return completed;
    }

    void reset() {
        slots_.clear();
        fragments_applied_ = 0;
    }

    static Expected<nlohmann::json> parse_arguments(const std::string& text) {
        if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
            return nlohmann::json::object();
        }
        auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded()) {
            return tl::unexpected(Error{
                ErrorCode::ToolArgumentParseFailed,
                "Tool arguments are not valid JSON",
                text
            });
        }
        if (!parsed.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::ToolArgumentParseFailed,
                "Tool arguments must be a JSON object",
                text
            });
        }
        return parsed;
    }

    /// Identifier for calls the provider streamed without one.
    static std::string generate_id() {
        static std::atomic<int> counter{0};
        return "call_local_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
    }

private:
    struct Slot {
        ToolCall call;
        std::optional<int> index;
    };

    Slot* resolve_slot(const ToolCallFragment& fragment) {
        if (fragment.id.has_value()) {
            // Latest entry first: the common case is continuing the current call
            for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
                if (it->call.id == *fragment.id) {
                    return &*it;
                }
            }
            return create_slot(*fragment.id, fragment.index);
        }

        if (fragment.index.has_value()) {
            for (auto& slot : slots_) {
                if (slot.index == fragment.index) {
                    return &slot;
                }
            }
        }

        if (!slots_.empty()) {
            return &slots_.back();
        }

        std::string id = generate_id();
        GURGEH_LOG_DEBUG("tool-call fragment without id before any call; assigned " << id);
        return create_slot(std::move(id), fragment.index);
    }

    Slot* create_slot(std::string id, std::optional<int> index) {
        Slot slot;
        slot.call.id = std::move(id);
        slot.index = index;
        slots_.push_back(std::move(slot));
        return &slots_.back();
    }

    std::vector<Slot> slots_;
    size_t fragments_applied_ = 0;
};

} // namespace engine
} // namespace gurgeh
