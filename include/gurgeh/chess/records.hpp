#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace chess {

// ============================================================================
// Records returned by the chess data collaborator
// ============================================================================

/** @brief One finished game of the player. */
struct GameRecord {
    long long id = 0;
    std::string result;                       ///< "win", "loss" or "draw"
    std::string player_color;                 ///< "white" or "black"
    std::string opponent_type;                ///< e.g. "engine", "human"
    std::optional<int> opponent_elo;
    std::vector<std::string> moves;           ///< SAN moves in play order
    int mistakes = 0;
    int blunders = 0;
    std::optional<std::string> opening_name;
    std::string created_at;                   ///< RFC 3339 timestamp
};

/** @brief Aggregate statistics for the active profile. */
struct PlayerStats {
    int current_elo = 0;
    int peak_elo = 0;
    int games_played = 0;
    int wins = 0;
    int losses = 0;
    int draws = 0;
    double win_rate = 0.0;                    ///< Percent, 0-100
    int exercises_completed = 0;
    int exercises_solved = 0;
    double exercise_success_rate = 0.0;       ///< Percent, 0-100
    int streak = 0;
    std::string style;
    std::vector<std::string> weaknesses;
    std::vector<std::string> strengths;
};

/** @brief Exercise performance for one exercise type over a period. */
struct WeaknessEntry {
    std::string exercise_type;
    int total_attempts = 0;
    double success_rate = 0.0;                ///< Percent, 0-100
    std::string recent_trend;                 ///< "declining", "stable" or "improving"
};

struct TrainingProgress {
    int total_attempted = 0;
    int total_solved = 0;
    double success_rate = 0.0;                ///< Percent, 0-100
    double avg_time_seconds = 0.0;
    double avg_hints_used = 0.0;
};

struct ImprovementTrend {
    int elo_change = 0;
    int games_in_period = 0;
    double win_rate_in_period = 0.0;          ///< Percent, 0-100
    int exercises_in_period = 0;
    double exercise_success_rate_in_period = 0.0;
};

} // namespace chess
} // namespace gurgeh
