#pragma once

#include "../types.hpp"
#include "records.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace chess {

/**
 * @brief Read-only access to the player's profile, games and exercises
 *
 * The coach tools depend only on this interface; storage details stay
 * behind it. All queries are scoped to the active profile.
 *
 * Implementations must be safe to call from several worker threads.
 * Failures are reported as DataSourceFailed or ProfileNotFound.
 */
class IChessDataSource {
public:
    virtual ~IChessDataSource() = default;

    /// Most recent games first.
    virtual Expected<std::vector<GameRecord>> recent_games(int limit) = 0;

    virtual Expected<PlayerStats> player_stats() = 0;

    /// Exercise types practised in the last `days` days, weakest first.
    virtual Expected<std::vector<WeaknessEntry>> weakness_history(int days) = 0;

    /// Games whose opening name contains `opening` (case-insensitive), newest first.
    virtual Expected<std::vector<GameRecord>> games_by_opening(const std::string& opening) = 0;

    /// Games with at least `min_mistakes` mistakes or any blunder, newest first.
    virtual Expected<std::vector<GameRecord>> games_with_mistakes(int min_mistakes) = 0;

    virtual Expected<TrainingProgress> training_progress(
        const std::optional<std::string>& exercise_type) = 0;

    virtual Expected<ImprovementTrend> improvement_trend(int days) = 0;
};

} // namespace chess
} // namespace gurgeh
