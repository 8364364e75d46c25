#include "game.hh"
#include "fen.hh"
#include "move_do.hh"
#include "movegen.hh"
#include "notation.hh"
#include "zobrist.hh"

#include <algorithm>
#include <utility>

namespace arbiter {

std::optional<Colour> winner(GameResult r)
{
    if (r == GameResult::WHITE_WINS)
        return WHITE;
    if (r == GameResult::BLACK_WINS)
        return BLACK;
    return std::nullopt;
}

std::string result_to_string(GameResult r)
{
    switch (r) {
    case GameResult::IN_PROGRESS:
        return "in progress";
    case GameResult::WHITE_WINS:
        return "1-0 (checkmate)";
    case GameResult::BLACK_WINS:
        return "0-1 (checkmate)";
    case GameResult::DRAW_STALEMATE:
        return "1/2-1/2 (stalemate)";
    case GameResult::DRAW_FIFTY_MOVE:
        return "1/2-1/2 (fifty-move rule)";
    case GameResult::DRAW_REPETITION:
        return "1/2-1/2 (threefold repetition)";
    case GameResult::DRAW_INSUFFICIENT_MATERIAL:
        return "1/2-1/2 (insufficient material)";
    }
    return "unknown";
}

Game::Game() : Game(Board::startpos()) {}

Game::Game(const Board& start)
{
    push_position(start);
}

Game Game::from_fen(const std::string& fen)
{
    return Game(arbiter::from_fen(fen));
}

void Game::play(Move m)
{
    if (is_over())
        throw GameOverError("Game is over: " + result_to_string(result_));

    if (std::find(legal_.begin(), legal_.end(), m) == legal_.end())
        throw IllegalMoveError("Illegal move: " + move_to_uci(m));

    Board next = play_move(board(), m);
    moves_.reserve(moves_.size() + 1);
    push_position(next);
    moves_.push_back(m);
}

void Game::play(const std::string& uci)
{
    if (is_over())
        throw GameOverError("Game is over: " + result_to_string(result_));

    play(parse_uci_move(uci, board()));
}

int Game::repetition_count() const
{
    const Board& now = history_.back();
    const std::uint64_t key = keys_.back();

    int n = 0;
    for (std::size_t i = 0; i < history_.size(); ++i)
        if (keys_[i] == key && same_position(history_[i], now))
            ++n;
    return n;
}

// Everything that can throw happens before the first append, so a failure
// leaves the history, keys and moves in step.
void Game::push_position(const Board& b)
{
    std::vector<Move> legal = generate_legal_moves(b);
    history_.reserve(history_.size() + 1);
    keys_.reserve(keys_.size() + 1);

    history_.push_back(b);
    keys_.push_back(zobrist::compute(b));
    legal_ = std::move(legal);
    update_result();
}

// Mate and stalemate are decided before the clock and repetition draws.
void Game::update_result()
{
    const Board& b = board();

    if (legal_.empty()) {
        if (in_check(b))
            result_ = (b.side_to_move == WHITE) ? GameResult::BLACK_WINS : GameResult::WHITE_WINS;
        else
            result_ = GameResult::DRAW_STALEMATE;
    } else if (b.halfmove_clock >= 100) {
        result_ = GameResult::DRAW_FIFTY_MOVE;
    } else if (repetition_count() >= 3) {
        result_ = GameResult::DRAW_REPETITION;
    } else if (trivial_insufficient_material(b)) {
        result_ = GameResult::DRAW_INSUFFICIENT_MATERIAL;
    } else {
        result_ = GameResult::IN_PROGRESS;
    }

    if (is_over())
        legal_.clear();
}

} // namespace arbiter
