#pragma once

#include "../engine/tool_registry.hpp"
#include "data_source.hpp"
#include "projections.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <string>

namespace gurgeh {
namespace chess {

// ============================================================================
// Tool names
// ============================================================================

namespace tools {
inline constexpr const char* kGetRecentGames = "getRecentGames";
inline constexpr const char* kGetPlayerStats = "getPlayerStats";
inline constexpr const char* kGetWeaknessHistory = "getWeaknessHistory";
inline constexpr const char* kSearchGamesByOpening = "searchGamesByOpening";
inline constexpr const char* kGetGamesWithMistakes = "getGamesWithMistakes";
inline constexpr const char* kGetTrainingProgress = "getTrainingProgress";
inline constexpr const char* kGetImprovementTrend = "getImprovementTrend";
} // namespace tools

namespace detail {

inline nlohmann::json object_schema(nlohmann::json properties, nlohmann::json required) {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties", std::move(properties)}
    };
    if (!required.empty()) {
        schema["required"] = std::move(required);
    }
    return schema;
}

inline nlohmann::json number_param(const char* description) {
    return {{"type", "number"}, {"description", description}};
}

inline nlohmann::json string_param(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

/**
 * @brief Read a numeric argument, rounded and clamped into [lo, hi].
 *
 * Absent or non-finite values yield `fallback`. The validator has already
 * rejected non-numeric values for declared parameters.
 */
inline int clamped_int(const nlohmann::json& args, const char* key, int lo, int hi, int fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number()) {
        return fallback;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return fallback;
    }
    value = std::round(value);
    value = std::min(std::max(value, static_cast<double>(lo)), static_cast<double>(hi));
    return static_cast<int>(value);
}

template<typename T, typename Project>
Expected<nlohmann::json> project_or_error(Expected<T> data, Project project) {
    if (!data) {
        return tl::unexpected(data.error());
    }
    return project(*data);
}

} // namespace detail

/**
 * @brief Register the seven coach tools against a chess data source.
 *
 * Names, descriptions and parameter contracts are fixed; the model sees them
 * on every round. Handlers return the compact shapes of projections.hpp.
 * Data source failures surface as failed ToolResults carrying the error
 * message, never as exceptions.
 *
 * @param registry Registry to populate (existing entries with the same names are replaced)
 * @param source Data source shared by all handlers; must outlive the registry's use
 */
inline void register_coach_tools(engine::ToolRegistry& registry,
                                 std::shared_ptr<IChessDataSource> source) {
    using nlohmann::json;

    registry.register_tool(
        tools::kGetRecentGames,
        "Get the player's most recent games with analysis data",
        detail::object_schema(
            {{"count", detail::number_param("Number of recent games to retrieve (1-20)")}},
            json::array({"count"})),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            const int count = detail::clamped_int(args, "count", 1, 20, 5);
            return detail::project_or_error(source->recent_games(count),
                                            [](const auto& games) { return project_recent_games(games); });
        }));

    registry.register_tool(
        tools::kGetPlayerStats,
        "Get comprehensive player statistics including ELO, win rate, and identified weaknesses",
        detail::object_schema(json::object(), json::array()),
        engine::ToolHandler([source](const json&) -> Expected<json> {
            return detail::project_or_error(source->player_stats(),
                                            [](const auto& stats) { return project_player_stats(stats); });
        }));

    registry.register_tool(
        tools::kGetWeaknessHistory,
        "Get the player's weakness history showing exercise types where they struggle",
        detail::object_schema(
            {{"days", detail::number_param("Number of days to look back (1-365)")}},
            json::array({"days"})),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            const int days = detail::clamped_int(args, "days", 1, 365, 30);
            return detail::project_or_error(source->weakness_history(days),
                                            [](const auto& entries) { return project_weakness_history(entries); });
        }));

    registry.register_tool(
        tools::kSearchGamesByOpening,
        "Search the player's games by opening name",
        detail::object_schema(
            {{"openingName", detail::string_param("Name of the opening to search for")}},
            json::array({"openingName"})),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            const auto opening = args.at("openingName").get<std::string>();
            return detail::project_or_error(source->games_by_opening(opening),
                                            [](const auto& games) { return project_game_search(games); });
        }));

    registry.register_tool(
        tools::kGetGamesWithMistakes,
        "Get games where the player made significant mistakes",
        detail::object_schema(
            {{"minMistakes", detail::number_param("Minimum number of mistakes to filter by (1-10)")}},
            json::array({"minMistakes"})),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            const int min_mistakes = detail::clamped_int(args, "minMistakes", 1, 10, 1);
            return detail::project_or_error(source->games_with_mistakes(min_mistakes),
                                            [](const auto& games) { return project_game_search(games); });
        }));

    registry.register_tool(
        tools::kGetTrainingProgress,
        "Get the player's training exercise progress",
        detail::object_schema(
            {{"exerciseType", detail::string_param("Optional exercise type to filter by")}},
            json::array()),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            std::optional<std::string> exercise_type;
            auto it = args.find("exerciseType");
            if (it != args.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                exercise_type = it->get<std::string>();
            }
            return detail::project_or_error(source->training_progress(exercise_type),
                                            [](const auto& progress) { return project_training_progress(progress); });
        }));

    registry.register_tool(
        tools::kGetImprovementTrend,
        "Get the player's improvement trend over a period of time",
        detail::object_schema(
            {{"days", detail::number_param("Number of days to analyze (1-365)")}},
            json::array({"days"})),
        engine::ToolHandler([source](const json& args) -> Expected<json> {
            const int days = detail::clamped_int(args, "days", 1, 365, 30);
            return detail::project_or_error(source->improvement_trend(days),
                                            [](const auto& trend) { return project_improvement_trend(trend); });
        }));
}

} // namespace chess
} // namespace gurgeh
