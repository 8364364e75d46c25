#pragma once
#include "board.hh"
#include "move.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

enum class GameResult {
    IN_PROGRESS,
    WHITE_WINS,
    BLACK_WINS,
    DRAW_STALEMATE,
    DRAW_FIFTY_MOVE,
    DRAW_REPETITION,
    DRAW_INSUFFICIENT_MATERIAL
};

inline bool is_terminal(GameResult r)
{
    return r != GameResult::IN_PROGRESS;
}

// Winning colour for a checkmate result, nothing otherwise.
std::optional<Colour> winner(GameResult r);

std::string result_to_string(GameResult r);

// Turn-by-turn driver. Keeps every board reached so far, re-evaluates the
// result after each ply and refuses moves once the game is over.
class Game {
public:
    Game();
    explicit Game(const Board& start);

    static Game from_fen(const std::string& fen);

    const Board& board() const { return history_.back(); }
    GameResult result() const { return result_; }
    bool is_over() const { return is_terminal(result_); }

    // legal moves of the current position, empty once the game is over
    const std::vector<Move>& legal_moves() const { return legal_; }

    // throws GameOverError after a terminal result, IllegalMoveError for a
    // move not in legal_moves(); the game is unchanged when either is thrown
    void play(Move m);
    void play(const std::string& uci);

    // occurrences of the current position in the history, itself included
    int repetition_count() const;

    const std::vector<Board>& history() const { return history_; }
    const std::vector<Move>& moves() const { return moves_; }

private:
    void push_position(const Board& b);
    void update_result();

    std::vector<Board> history_;
    std::vector<std::uint64_t> keys_;
    std::vector<Move> moves_;
    std::vector<Move> legal_;
    GameResult result_{GameResult::IN_PROGRESS};
};

} // namespace arbiter
