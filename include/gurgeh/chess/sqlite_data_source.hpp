#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "data_source.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace gurgeh {
namespace chess {

/// UTC timestamp in the RFC 3339 form the chess store writes, e.g. "2026-10-19T08:30:00+00:00".
inline std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm_utc);
    return buf;
}

/**
 * @brief IChessDataSource over the chess application's SQLite store.
 *
 * Opens the database read-only and scopes every query to the first profile
 * (lowest id). Tables used: profiles, games, exercise_results. The store is
 * written by the application itself; this class never modifies it.
 *
 * Thread Safety: queries are serialized on an internal mutex.
 */
class SqliteDataSource : public IChessDataSource {
public:
    ~SqliteDataSource() override {
        if (db_ != nullptr) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    SqliteDataSource(const SqliteDataSource&) = delete;
    SqliteDataSource& operator=(const SqliteDataSource&) = delete;

    static Expected<std::shared_ptr<SqliteDataSource>> open(const std::string& path) {
        if (path.empty()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Chess database path cannot be empty"
            });
        }

        sqlite3* db = nullptr;
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string message = "Failed to open chess database";
            if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
                message += std::string(": ") + sqlite3_errmsg(db);
            }
            if (db != nullptr) {
                sqlite3_close(db);
            }
            return tl::unexpected(Error{ErrorCode::DataSourceFailed, std::move(message), path});
        }
        sqlite3_busy_timeout(db, 2000);

        GURGEH_LOG_INFO("opened chess database " << path);
        return std::shared_ptr<SqliteDataSource>(new SqliteDataSource(db, path));
    }

    Expected<std::vector<GameRecord>> recent_games(int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        auto stmt = prepare(std::string(kGameColumns) +
                            "WHERE profile_id = ?1 ORDER BY created_at DESC LIMIT ?2");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, *profile);
        sqlite3_bind_int(stmt->get(), 2, limit);
        return read_games(stmt->get());
    }

    Expected<PlayerStats> player_stats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        PlayerStats stats;
        {
            auto stmt = prepare(
                "SELECT current_elo, peak_elo, streak, style, weaknesses, strengths "
                "FROM profiles WHERE id = ?1");
            if (!stmt) {
                return tl::unexpected(stmt.error());
            }
            sqlite3_bind_int64(stmt->get(), 1, *profile);
            if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
                return tl::unexpected(make_sql_error("Failed to read profile"));
            }
            stats.current_elo = sqlite3_column_int(stmt->get(), 0);
            stats.peak_elo = sqlite3_column_int(stmt->get(), 1);
            stats.streak = sqlite3_column_int(stmt->get(), 2);
            stats.style = column_text(stmt->get(), 3);
            stats.weaknesses = parse_string_array(column_text(stmt->get(), 4));
            stats.strengths = parse_string_array(column_text(stmt->get(), 5));
        }

        {
            auto stmt = prepare(
                "SELECT "
                "SUM(CASE WHEN result = 'win' THEN 1 ELSE 0 END), "
                "SUM(CASE WHEN result = 'loss' THEN 1 ELSE 0 END), "
                "SUM(CASE WHEN result = 'draw' THEN 1 ELSE 0 END) "
                "FROM games WHERE profile_id = ?1");
            if (!stmt) {
                return tl::unexpected(stmt.error());
            }
            sqlite3_bind_int64(stmt->get(), 1, *profile);
            if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
                return tl::unexpected(make_sql_error("Failed to aggregate games"));
            }
            stats.wins = sqlite3_column_int(stmt->get(), 0);
            stats.losses = sqlite3_column_int(stmt->get(), 1);
            stats.draws = sqlite3_column_int(stmt->get(), 2);
        }
        stats.games_played = stats.wins + stats.losses + stats.draws;
        stats.win_rate = percent(stats.wins, stats.games_played);

        {
            auto stmt = prepare(
                "SELECT COUNT(*), SUM(CASE WHEN solved = 1 THEN 1 ELSE 0 END) "
                "FROM exercise_results WHERE profile_id = ?1");
            if (!stmt) {
                return tl::unexpected(stmt.error());
            }
            sqlite3_bind_int64(stmt->get(), 1, *profile);
            if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
                return tl::unexpected(make_sql_error("Failed to aggregate exercises"));
            }
            stats.exercises_completed = sqlite3_column_int(stmt->get(), 0);
            stats.exercises_solved = sqlite3_column_int(stmt->get(), 1);
        }
        stats.exercise_success_rate = percent(stats.exercises_solved, stats.exercises_completed);

        return stats;
    }

    Expected<std::vector<WeaknessEntry>> weakness_history(int days) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        auto stmt = prepare(
            "SELECT exercise_type, COUNT(*) AS attempts, "
            "AVG(CASE WHEN solved = 1 THEN 1.0 ELSE 0.0 END) AS success_rate "
            "FROM exercise_results "
            "WHERE profile_id = ?1 AND created_at >= ?2 "
            "GROUP BY exercise_type "
            "ORDER BY success_rate ASC");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        const std::string cutoff = cutoff_for(days);
        sqlite3_bind_int64(stmt->get(), 1, *profile);
        sqlite3_bind_text(stmt->get(), 2, cutoff.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<WeaknessEntry> entries;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
            const double ratio = sqlite3_column_double(stmt->get(), 2);
            WeaknessEntry entry;
            entry.exercise_type = column_text(stmt->get(), 0);
            entry.total_attempts = sqlite3_column_int(stmt->get(), 1);
            entry.success_rate = ratio * 100.0;
            entry.recent_trend = trend_for(ratio);
            entries.push_back(std::move(entry));
        }
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to read weakness history"));
        }
        return entries;
    }

    Expected<std::vector<GameRecord>> games_by_opening(const std::string& opening) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        auto stmt = prepare(std::string(kGameColumns) +
                            "WHERE profile_id = ?1 AND opening_name LIKE ?2 ORDER BY created_at DESC");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        const std::string pattern = "%" + opening + "%";
        sqlite3_bind_int64(stmt->get(), 1, *profile);
        sqlite3_bind_text(stmt->get(), 2, pattern.c_str(), -1, SQLITE_TRANSIENT);
        return read_games(stmt->get());
    }

    Expected<std::vector<GameRecord>> games_with_mistakes(int min_mistakes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        auto stmt = prepare(std::string(kGameColumns) +
                            "WHERE profile_id = ?1 AND (mistakes >= ?2 OR blunders > 0) "
                            "ORDER BY created_at DESC");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, *profile);
        sqlite3_bind_int(stmt->get(), 2, min_mistakes);
        return read_games(stmt->get());
    }

    Expected<TrainingProgress> training_progress(
        const std::optional<std::string>& exercise_type) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }

        std::string sql =
            "SELECT COUNT(*), SUM(CASE WHEN solved = 1 THEN 1 ELSE 0 END), "
            "AVG(time_seconds), AVG(hints_used) "
            "FROM exercise_results WHERE profile_id = ?1";
        if (exercise_type.has_value()) {
            sql += " AND exercise_type = ?2";
        }

        auto stmt = prepare(sql);
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        sqlite3_bind_int64(stmt->get(), 1, *profile);
        if (exercise_type.has_value()) {
            sqlite3_bind_text(stmt->get(), 2, exercise_type->c_str(), -1, SQLITE_TRANSIENT);
        }
        if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
            return tl::unexpected(make_sql_error("Failed to aggregate training progress"));
        }

        TrainingProgress progress;
        progress.total_attempted = sqlite3_column_int(stmt->get(), 0);
        progress.total_solved = sqlite3_column_int(stmt->get(), 1);
        progress.avg_time_seconds = sqlite3_column_double(stmt->get(), 2);
        progress.avg_hints_used = sqlite3_column_double(stmt->get(), 3);
        progress.success_rate = percent(progress.total_solved, progress.total_attempted);
        return progress;
    }

    Expected<ImprovementTrend> improvement_trend(int days) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto profile = active_profile_id();
        if (!profile) {
            return tl::unexpected(profile.error());
        }
        const std::string cutoff = cutoff_for(days);

        ImprovementTrend trend;
        int wins = 0;
        {
            auto stmt = prepare(
                "SELECT COUNT(*), SUM(CASE WHEN result = 'win' THEN 1 ELSE 0 END) "
                "FROM games WHERE profile_id = ?1 AND created_at >= ?2");
            if (!stmt) {
                return tl::unexpected(stmt.error());
            }
            sqlite3_bind_int64(stmt->get(), 1, *profile);
            sqlite3_bind_text(stmt->get(), 2, cutoff.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
                return tl::unexpected(make_sql_error("Failed to aggregate recent games"));
            }
            trend.games_in_period = sqlite3_column_int(stmt->get(), 0);
            wins = sqlite3_column_int(stmt->get(), 1);
        }

        int solved = 0;
        {
            auto stmt = prepare(
                "SELECT COUNT(*), SUM(CASE WHEN solved = 1 THEN 1 ELSE 0 END) "
                "FROM exercise_results WHERE profile_id = ?1 AND created_at >= ?2");
            if (!stmt) {
                return tl::unexpected(stmt.error());
            }
            sqlite3_bind_int64(stmt->get(), 1, *profile);
            sqlite3_bind_text(stmt->get(), 2, cutoff.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
                return tl::unexpected(make_sql_error("Failed to aggregate recent exercises"));
            }
            trend.exercises_in_period = sqlite3_column_int(stmt->get(), 0);
            solved = sqlite3_column_int(stmt->get(), 1);
        }

        trend.win_rate_in_period = percent(wins, trend.games_in_period);
        trend.exercise_success_rate_in_period = percent(solved, trend.exercises_in_period);
        // Rough estimate: +15 per win, -15 per loss or draw
        trend.elo_change = (wins - (trend.games_in_period - wins)) * 15;
        return trend;
    }

    const std::string& path() const {
        return db_path_;
    }

private:
    using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    static constexpr const char* kGameColumns =
        "SELECT id, result, player_color, opponent_type, opponent_elo, moves, "
        "mistakes, blunders, opening_name, created_at FROM games ";

    SqliteDataSource(sqlite3* db, std::string db_path)
        : db_(db)
        , db_path_(std::move(db_path))
    {}

    Expected<Statement> prepare(const std::string& sql) const {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
            sqlite3_finalize(raw);
            return tl::unexpected(make_sql_error("Failed to prepare query"));
        }
        return Statement(raw, &sqlite3_finalize);
    }

    // Re-resolved on every query; the application may create the profile
    // after the coach starts.
    Expected<long long> active_profile_id() const {
        auto stmt = prepare("SELECT id FROM profiles ORDER BY id LIMIT 1");
        if (!stmt) {
            return tl::unexpected(stmt.error());
        }
        const int rc = sqlite3_step(stmt->get());
        if (rc == SQLITE_ROW) {
            return static_cast<long long>(sqlite3_column_int64(stmt->get(), 0));
        }
        if (rc == SQLITE_DONE) {
            return tl::unexpected(Error{
                ErrorCode::ProfileNotFound,
                "No player profile found",
                db_path_
            });
        }
        return tl::unexpected(make_sql_error("Failed to read profiles"));
    }

    Expected<std::vector<GameRecord>> read_games(sqlite3_stmt* stmt) const {
        std::vector<GameRecord> games;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            GameRecord game;
            game.id = sqlite3_column_int64(stmt, 0);
            game.result = column_text(stmt, 1);
            game.player_color = column_text(stmt, 2);
            game.opponent_type = column_text(stmt, 3);
            if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
                game.opponent_elo = sqlite3_column_int(stmt, 4);
            }
            game.moves = parse_string_array(column_text(stmt, 5));
            game.mistakes = sqlite3_column_int(stmt, 6);
            game.blunders = sqlite3_column_int(stmt, 7);
            if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
                game.opening_name = column_text(stmt, 8);
            }
            game.created_at = column_text(stmt, 9);
            games.push_back(std::move(game));
        }
        if (rc != SQLITE_DONE) {
            return tl::unexpected(make_sql_error("Failed to read games"));
        }
        return games;
    }

    static std::string column_text(sqlite3_stmt* stmt, int column) {
        const unsigned char* raw = sqlite3_column_text(stmt, column);
        return raw != nullptr ? std::string(reinterpret_cast<const char*>(raw)) : std::string();
    }

    // JSON text array columns (moves, weaknesses, strengths). Anything that
    // is not an array of strings reads as empty.
    static std::vector<std::string> parse_string_array(const std::string& text) {
        std::vector<std::string> values;
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array()) {
            return values;
        }
        for (const auto& item : parsed) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
        return values;
    }

    static double percent(int part, int total) {
        return total > 0 ? (static_cast<double>(part) / static_cast<double>(total)) * 100.0 : 0.0;
    }

    static const char* trend_for(double success_ratio) {
        if (success_ratio < 0.5) return "declining";
        if (success_ratio < 0.75) return "stable";
        return "improving";
    }

    static std::string cutoff_for(int days) {
        return format_rfc3339(std::chrono::system_clock::now() - std::chrono::hours(24) * days);
    }

    Error make_sql_error(const std::string& prefix) const {
        return Error{
            ErrorCode::DataSourceFailed,
            prefix + ": " + sqlite3_errmsg(db_),
            db_path_
        };
    }

    sqlite3* db_ = nullptr;
    std::string db_path_;
    mutable std::mutex mutex_;
};

} // namespace chess
} // namespace gurgeh
