#pragma once

#include "../types.hpp"
#include "argument_validator.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <limits>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <tuple>
#include <type_traits>

namespace gurgeh {
namespace engine {

// ============================================================================
// Tool Handler Type
// ============================================================================

/** @brief Callable type for tool execution; takes JSON arguments and returns a JSON payload or Error. */
using ToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

// ============================================================================
// Type Traits for JSON Schema Generation
// ============================================================================

namespace detail {

template<typename T>
struct json_type_name;

template<> struct json_type_name<int> {
    static constexpr const char* type = "integer";
};

template<> struct json_type_name<double> {
    static constexpr const char* type = "number";
};

template<> struct json_type_name<bool> {
    static constexpr const char* type = "boolean";
};

template<> struct json_type_name<std::string> {
    static constexpr const char* type = "string";
};

// Integer parameters carry their representable range so the validator
// rejects values that would not survive the conversion to T.
template<typename T>
nlohmann::json property_schema() {
    nlohmann::json prop{{"type", json_type_name<T>::type}};
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        prop["minimum"] = std::numeric_limits<T>::min();
        prop["maximum"] = std::numeric_limits<T>::max();
    }
    return prop;
}

template<typename T>
struct function_traits;

template<typename R, typename... Args>
struct function_traits<R(*)(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

// Lambdas and functors resolve through operator()
template<typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template<typename Tuple, size_t... Is>
nlohmann::json build_properties_impl(const std::vector<std::string>& param_names, std::index_sequence<Is...>) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    ((properties[param_names[Is]] = property_schema<std::tuple_element_t<Is, Tuple>>(),
      required.push_back(param_names[Is])), ...);

    return nlohmann::json{
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

template<typename Tuple>
nlohmann::json build_properties(const std::vector<std::string>& param_names) {
    constexpr size_t N = std::tuple_size_v<Tuple>;
    return build_properties_impl<Tuple>(param_names, std::make_index_sequence<N>{});
}

template<typename Func, typename Tuple, size_t... Is>
auto invoke_with_json_impl(const Func& func, const nlohmann::json& args,
                           const std::vector<std::string>& param_names,
                           std::index_sequence<Is...>) {
    return func(args.at(param_names[Is]).template get<std::tuple_element_t<Is, Tuple>>()...);
}

// JSON objects pass through as the payload; anything else is wrapped.
template<typename T>
nlohmann::json to_payload(T&& value) {
    nlohmann::json j = std::forward<T>(value);
    if (j.is_object()) {
        return j;
    }
    return nlohmann::json{{"result", std::move(j)}};
}

} // namespace detail

// ============================================================================
// Tool Definition
// ============================================================================

/** @brief Name, description and parameter schema of one tool. Immutable once registered. */
struct ToolDefinition {
    std::string name;                    ///< Unique tool name used for invocation
    std::string description;             ///< Human-readable description of what the tool does
    nlohmann::json parameters_schema;    ///< JSON Schema describing expected parameters

    /// Wire shape expected by OpenAI-compatible providers.
    nlohmann::json to_wire_json() const {
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", name},
                {"description", description},
                {"parameters", parameters_schema}
            }}
        };
    }
};

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief Registry of tool definitions and their executors.
 *
 * Supports template registration (schema derived from the callable's
 * signature) and manual registration with an explicit schema. Tools are
 * reported in registration order. Execution never throws: unknown names,
 * schema violations, handler errors and handler exceptions all become a
 * failed ToolResult.
 *
 * @threadsafety All public methods are thread-safe. Reads take a shared
 * lock, so one registry can serve any number of concurrent exchanges.
 */
class ToolRegistry {
public:
    /**
     * Template-based registration: extracts parameter types and generates schema.
     *
     * @param name Tool name
     * @param description Tool description
     * @param param_names Parameter names (must match function arity)
     * @param func Callable to invoke
     * @throws std::invalid_argument if param_names does not match the arity
     */
    template<typename Func>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func) {
        using traits = detail::function_traits<Func>;
        using args_tuple = typename traits::args_tuple;

        if (param_names.size() != traits::arity) {
            throw std::invalid_argument(
                "Parameter name count (" + std::to_string(param_names.size()) +
                ") does not match function arity (" + std::to_string(traits::arity) + ")");
        }

        nlohmann::json schema;
        if constexpr (traits::arity == 0) {
            schema = nlohmann::json{
                {"type", "object"},
                {"properties", nlohmann::json::object()},
                {"required", nlohmann::json::array()}
            };
        } else {
            schema = detail::build_properties<args_tuple>(param_names);
        }

        ToolHandler handler = [f = std::move(func), names = param_names](
            const nlohmann::json& args) -> Expected<nlohmann::json> {
            if constexpr (traits::arity == 0) {
                return detail::to_payload(f());
            } else {
                return detail::to_payload(detail::invoke_with_json_impl<decltype(f), args_tuple>(
                    f, args, names, std::make_index_sequence<traits::arity>{}));
            }
        };

        register_tool(name, description, std::move(schema), std::move(handler));
    }

    /**
     * @brief Manual registration with an explicit JSON schema and handler.
     *
     * Re-registering a name replaces the previous entry and keeps its position.
     */
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, ToolHandler handler) {
        std::unique_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            order_.push_back(name);
        }
        tools_.insert_or_assign(name, Entry{ToolDefinition{name, description, std::move(schema)},
                                            std::move(handler)});
    }

    /** @brief Look up a tool definition by name. */
    std::optional<ToolDefinition> lookup(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return it->second.definition;
    }

    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    /**
     * @brief Validate arguments and run the tool's executor.
     *
     * @param name Tool name
     * @param args Parsed argument object
     * @return ToolResult; success carries the handler's payload
     */
    ToolResult execute(const std::string& name, const nlohmann::json& args) const {
        auto payload = invoke(name, args);
        if (!payload) {
            return ToolResult::failure(payload.error().message);
        }
        return ToolResult::ok(std::move(*payload));
    }

    /** @brief Like execute(), but keeps the error code for callers that log or branch on it. */
    Expected<nlohmann::json> invoke(const std::string& name, const nlohmann::json& args) const {
        ToolHandler handler;
        {
            std::shared_lock lock(mutex_);
            auto it = tools_.find(name);
            if (it == tools_.end()) {
                return tl::unexpected(Error{ErrorCode::ToolNotFound, "Unknown tool: " + name});
            }
            auto valid = ArgumentValidator::validate(args, it->second.definition.parameters_schema);
            if (!valid) {
                return tl::unexpected(valid.error());
            }
            handler = it->second.handler;
        }

        // Handlers run outside the lock; they may be slow data queries.
        try {
            return handler(args);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("JSON argument error: ") + e.what()
            });
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("Tool execution failed: ") + e.what()
            });
        }
    }

    /** @brief Get the wire schema for a single tool, or empty JSON if not found. */
    nlohmann::json get_tool_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return nlohmann::json{};
        }
        return it->second.definition.to_wire_json();
    }

    /** @brief Wire schemas for all registered tools, in registration order. */
    nlohmann::json get_all_schemas() const {
        std::shared_lock lock(mutex_);
        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& name : order_) {
            schemas.push_back(tools_.at(name).definition.to_wire_json());
        }
        return schemas;
    }

    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        return order_;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

private:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
    };

    std::unordered_map<std::string, Entry> tools_;
    std::vector<std::string> order_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace gurgeh
