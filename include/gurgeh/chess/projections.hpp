#pragma once

#include "records.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace chess {

// Compact, model-facing shapes of the data source records. Field names are
// camelCase and percentages are preformatted so the model never does
// arithmetic on raw ratios.

/// Longest game list a tool returns when it also reports totalGames.
constexpr size_t kMaxListedGames = 10;

/// One decimal place, as in "62.5".
inline std::string format_fixed1(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

/// One decimal place with a percent sign, as in "62.5%".
inline std::string format_percent(double value) {
    return format_fixed1(value) + "%";
}

namespace detail {

template<typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (value.has_value()) {
        return nlohmann::json(*value);
    }
    return nullptr;
}

inline nlohmann::json game_summary(const GameRecord& g) {
    return {
        {"id", g.id},
        {"result", g.result},
        {"playerColor", g.player_color},
        {"opening", optional_to_json(g.opening_name)},
        {"mistakes", g.mistakes},
        {"blunders", g.blunders},
        {"playedAt", g.created_at}
    };
}

} // namespace detail

inline nlohmann::json project_recent_games(const std::vector<GameRecord>& games) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& g : games) {
        list.push_back({
            {"id", g.id},
            {"result", g.result},
            {"playerColor", g.player_color},
            {"opponentType", g.opponent_type},
            {"opponentElo", detail::optional_to_json(g.opponent_elo)},
            {"moves", g.moves.size()},
            {"mistakes", g.mistakes},
            {"blunders", g.blunders},
            {"opening", detail::optional_to_json(g.opening_name)},
            {"playedAt", g.created_at}
        });
    }
    return {{"success", true}, {"games", std::move(list)}};
}

/// Game search results: total count plus the first kMaxListedGames summaries.
inline nlohmann::json project_game_search(const std::vector<GameRecord>& games) {
    nlohmann::json list = nlohmann::json::array();
    for (size_t i = 0; i < games.size() && i < kMaxListedGames; ++i) {
        list.push_back(detail::game_summary(games[i]));
    }
    return {
        {"success", true},
        {"totalGames", games.size()},
        {"games", std::move(list)}
    };
}

inline nlohmann::json project_player_stats(const PlayerStats& s) {
    return {
        {"success", true},
        {"stats", {
            {"currentElo", s.current_elo},
            {"peakElo", s.peak_elo},
            {"gamesPlayed", s.games_played},
            {"wins", s.wins},
            {"losses", s.losses},
            {"draws", s.draws},
            {"winRate", format_percent(s.win_rate)},
            {"exercisesCompleted", s.exercises_completed},
            {"exerciseSuccessRate", format_percent(s.exercise_success_rate)},
            {"streak", s.streak},
            {"style", s.style},
            {"weaknesses", s.weaknesses},
            {"strengths", s.strengths}
        }}
    };
}

inline nlohmann::json project_weakness_history(const std::vector<WeaknessEntry>& entries) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& w : entries) {
        list.push_back({
            {"exerciseType", w.exercise_type},
            {"attempts", w.total_attempts},
            {"successRate", format_percent(w.success_rate)},
            {"trend", w.recent_trend}
        });
    }
    return {{"success", true}, {"weaknesses", std::move(list)}};
}

inline nlohmann::json project_training_progress(const TrainingProgress& p) {
    return {
        {"success", true},
        {"progress", {
            {"totalAttempted", p.total_attempted},
            {"totalSolved", p.total_solved},
            {"successRate", format_percent(p.success_rate)},
            {"avgTimeSeconds", static_cast<long long>(std::llround(p.avg_time_seconds))},
            {"avgHintsUsed", format_fixed1(p.avg_hints_used)}
        }}
    };
}

inline nlohmann::json project_improvement_trend(const ImprovementTrend& t) {
    return {
        {"success", true},
        {"trend", {
            {"eloChange", t.elo_change},
            {"gamesPlayed", t.games_in_period},
            {"winRate", format_percent(t.win_rate_in_period)},
            {"exercisesCompleted", t.exercises_in_period},
            {"exerciseSuccessRate", format_percent(t.exercise_success_rate_in_period)}
        }}
    };
}

} // namespace chess
} // namespace gurgeh
