#pragma once

#include <string>
#include <vector>

namespace gurgeh {
namespace chess {

/// System prompt for the Gurgeh coach persona. Lists the coach tools by name.
inline constexpr const char* kCoachSystemPrompt =
R"(You are Gurgeh, an AI chess coach named after the legendary game player from Iain M. Banks' Culture series "The Player of Games". You are wise, patient, and deeply knowledgeable about chess.

Your personality:
- Speak with quiet confidence and wisdom
- Use clear, concise explanations
- Reference chess concepts precisely
- Be encouraging but honest about mistakes
- Occasionally make subtle references to game theory or strategy from a broader perspective

Your capabilities:
- Explain chess concepts (forks, pins, skewers, tactics, strategy)
- Analyze positions and suggest moves
- Review games and find improvements
- Create custom exercises based on player weaknesses
- Teach openings, endgames, and middlegame strategy

You have access to tools that query the player's actual game history and statistics. ALWAYS use these tools to provide personalized, data-driven advice. Do not give generic advice - query the player's actual data first.

Available tools:
- getRecentGames: Get recent games to analyze patterns
- getPlayerStats: Get comprehensive player statistics
- getWeaknessHistory: Find exercise types where the player struggles
- searchGamesByOpening: Search games by opening name
- getGamesWithMistakes: Find games with mistakes for review
- getTrainingProgress: Get exercise completion statistics
- getImprovementTrend: Track improvement over time

Guidelines:
- NEVER use emojis in your responses
- Keep responses focused and practical
- Use algebraic notation for moves (e.g., e4, Nf3, O-O)
- When explaining concepts, give concrete examples
- Adapt your explanations to the player's level
- When asked about performance, ALWAYS use the tools to get real data
- Provide specific, actionable recommendations based on the player's actual weaknesses

Response format:
- Use plain text with clear paragraph breaks
- Use chess notation where appropriate
- Be direct and concise - players appreciate efficiency)";

// ============================================================================
// User-message builders
// ============================================================================

inline std::string position_analysis_prompt(const std::string& fen) {
    return "Analyze this chess position for the student.\n"
           "\n"
           "Position (FEN): " + fen + "\n"
           "\n"
           "Provide:\n"
           "1. Material evaluation\n"
           "2. King safety assessment for both sides\n"
           "3. Pawn structure analysis\n"
           "4. Key features and imbalances\n"
           "5. Best plan for the side to move\n"
           "6. Any immediate tactical opportunities\n"
           "\n"
           "Keep the analysis clear and instructive.";
}

/// @param moves SAN moves in play order, joined with single spaces
inline std::string game_review_prompt(const std::vector<std::string>& moves,
                                      const std::string& result,
                                      const std::string& player_color) {
    std::string joined;
    for (size_t i = 0; i < moves.size(); ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += moves[i];
    }
    return "Review this completed game for the student.\n"
           "\n"
           "Player color: " + player_color + "\n"
           "Result: " + result + "\n"
           "Moves: " + joined + "\n"
           "\n"
           "Provide:\n"
           "1. Opening assessment\n"
           "2. Critical moments where the game turned\n"
           "3. Mistakes and better alternatives\n"
           "4. What went well\n"
           "5. Key lessons to take away\n"
           "\n"
           "Focus on the most instructive moments rather than exhaustive move-by-move analysis.";
}

/// Request that makes the coach look up the player's stats before greeting.
inline std::string personalized_greeting_request(const std::string& user_name) {
    return "The player \"" + user_name + "\" just opened the app. Give them a brief, "
           "personalized greeting. Use the getPlayerStats tool to check their current "
           "rating and recent activity, then welcome them appropriately.";
}

/**
 * @brief Static welcome text shown without a model round.
 *
 * First-time players (no exercises yet) get the introduction; returning
 * players get a one-line summary.
 */
inline std::string welcome_message(const std::string& user_name, int elo, int exercises_completed) {
    if (exercises_completed == 0) {
        return "Welcome to Tacticus, " + user_name +
               ". I'm Gurgeh, your chess coach - named after the legendary game player from the Culture.\n"
               "\n"
               "I see you're starting at " + std::to_string(elo) +
               " ELO. Let's begin with some fundamentals and discover where your strengths lie. "
               "Together, we'll master this ancient game.";
    }
    return "Welcome back, " + user_name + ". You've completed " + std::to_string(exercises_completed) +
           " exercises so far. Your current rating is " + std::to_string(elo) +
           ". Ready to continue your training?";
}

} // namespace chess
} // namespace gurgeh
