#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <string>
#include <string_view>

namespace gurgeh {
namespace engine {

/**
 * @brief Checks parsed tool arguments against a tool's parameter schema.
 *
 * Only the subset of JSON Schema that tool definitions actually use is
 * understood: an object with "properties" (each with a primitive "type",
 * optionally "minimum"/"maximum") and a "required" list. Unknown keywords are
 * ignored. Additional, undeclared arguments are accepted.
 *
 * @threadsafety Stateless; safe to call from any thread.
 */
class ArgumentValidator {
public:
    /**
     * @brief Validate arguments against a parameters schema.
     *
     * @param args Parsed arguments (must be a JSON object)
     * @param schema Parameters schema registered for the tool
     * @return Empty on success, ToolArgumentParseFailed describing the first violation otherwise
     */
    static Expected<void> validate(const nlohmann::json& args, const nlohmann::json& schema) {
        if (!args.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::ToolArgumentParseFailed,
                std::string("Arguments must be a JSON object, got ") + json_type_name(args)
            });
        }

        auto required_it = schema.find("required");
        if (required_it != schema.end() && required_it->is_array()) {
            for (const auto& req : *required_it) {
                if (!req.is_string()) {
                    continue;
                }
                const auto& field = req.get_ref<const std::string&>();
                if (!args.contains(field)) {
                    return tl::unexpected(Error{
                        ErrorCode::ToolArgumentParseFailed,
                        "Missing required argument: " + field
                    });
                }
            }
        }

        auto props_it = schema.find("properties");
        if (props_it == schema.end() || !props_it->is_object()) {
            return {};
        }

        for (const auto& [key, prop] : props_it->items()) {
            auto arg_it = args.find(key);
            if (arg_it == args.end()) {
                continue;
            }
            auto type_it = prop.find("type");
            if (type_it == prop.end() || !type_it->is_string()) {
                continue;
            }
            const auto& expected_type = type_it->get_ref<const std::string&>();
            if (!type_matches(*arg_it, expected_type)) {
                return tl::unexpected(Error{
                    ErrorCode::ToolArgumentParseFailed,
                    "Argument '" + key + "' has wrong type: expected " +
                        expected_type + ", got " + json_type_name(*arg_it)
                });
            }
            if (auto bounded = check_bounds(key, *arg_it, prop); !bounded) {
                return bounded;
            }
        }

        return {};
    }

    /// True when a JSON value satisfies a JSON Schema primitive type name.
    static bool type_matches(const nlohmann::json& val, std::string_view expected) {
        if (expected == "integer") {
            // Models frequently send 5.0 for integer fields
            if (val.is_number_integer()) return true;
            if (val.is_number_float()) {
                double d = val.get<double>();
                return std::isfinite(d) && std::trunc(d) == d;
            }
            return false;
        }
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        if (expected == "null") return val.is_null();
        return false;
    }

    /// Inclusive "minimum"/"maximum" check for numeric arguments.
    static Expected<void> check_bounds(const std::string& key, const nlohmann::json& val,
                                       const nlohmann::json& prop) {
        if (!val.is_number()) {
            return {};
        }
        const double d = val.get<double>();
        auto min_it = prop.find("minimum");
        if (min_it != prop.end() && min_it->is_number() && d < min_it->get<double>()) {
            return tl::unexpected(Error{
                ErrorCode::ToolArgumentParseFailed,
                "Argument '" + key + "' is below the minimum of " + min_it->dump()
            });
        }
        auto max_it = prop.find("maximum");
        if (max_it != prop.end() && max_it->is_number() && d > max_it->get<double>()) {
            return tl::unexpected(Error{
                ErrorCode::ToolArgumentParseFailed,
                "Argument '" + key + "' is above the maximum of " + max_it->dump()
            });
        }
        return {};
    }

    static const char* json_type_name(const nlohmann::json& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }
};

} // namespace engine
} // namespace gurgeh
