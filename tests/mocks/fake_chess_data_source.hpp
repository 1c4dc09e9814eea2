#pragma once

#include "gurgeh/chess/data_source.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gurgeh {
namespace testing {

/**
 * @brief In-memory IChessDataSource with canned answers.
 *
 * Records the arguments of the last call to each query so tests can check
 * clamping. Setting `failure` makes every query return that error.
 */
class FakeChessDataSource : public chess::IChessDataSource {
public:
    std::vector<chess::GameRecord> games;
    chess::PlayerStats stats;
    std::vector<chess::WeaknessEntry> weaknesses;
    chess::TrainingProgress progress;
    chess::ImprovementTrend trend;
    std::optional<Error> failure;

    // Arguments of the most recent calls
    int last_limit = -1;
    int last_days = -1;
    int last_min_mistakes = -1;
    std::string last_opening;
    std::optional<std::string> last_exercise_type;
    int calls = 0;

    Expected<std::vector<chess::GameRecord>> recent_games(int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_limit = limit;
        if (failure) return tl::unexpected(*failure);
        std::vector<chess::GameRecord> out;
        for (size_t i = 0; i < games.size() && static_cast<int>(i) < limit; ++i) {
            out.push_back(games[i]);
        }
        return out;
    }

    Expected<chess::PlayerStats> player_stats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        if (failure) return tl::unexpected(*failure);
        return stats;
    }

    Expected<std::vector<chess::WeaknessEntry>> weakness_history(int days) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_days = days;
        if (failure) return tl::unexpected(*failure);
        return weaknesses;
    }

    Expected<std::vector<chess::GameRecord>> games_by_opening(const std::string& opening) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_opening = opening;
        if (failure) return tl::unexpected(*failure);
        return games;
    }

    Expected<std::vector<chess::GameRecord>> games_with_mistakes(int min_mistakes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_min_mistakes = min_mistakes;
        if (failure) return tl::unexpected(*failure);
        return games;
    }

    Expected<chess::TrainingProgress> training_progress(
        const std::optional<std::string>& exercise_type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_exercise_type = exercise_type;
        if (failure) return tl::unexpected(*failure);
        return progress;
    }

    Expected<chess::ImprovementTrend> improvement_trend(int days) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_days = days;
        if (failure) return tl::unexpected(*failure);
        return trend;
    }

    /// A game with the given id and created_at; other fields get plausible values.
    static chess::GameRecord make_game(long long id, std::string created_at) {
        chess::GameRecord g;
        g.id = id;
        g.result = id % 2 == 0 ? "win" : "loss";
        g.player_color = "white";
        g.opponent_type = "engine";
        g.opponent_elo = 1200;
        g.moves = {"e4", "e5", "Nf3", "Nc6"};
        g.mistakes = 2;
        g.blunders = 0;
        g.opening_name = std::string("Italian Game");
        g.created_at = std::move(created_at);
        return g;
    }

private:
    std::mutex mutex_;
};

} // namespace testing
} // namespace gurgeh
