#pragma once
#include "board.hh"

#include <string>

// Extracts and converts between FEN strings and Board objects
namespace arbiter {
inline const char* const START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// throws FenError on malformed text or a position that breaks the board
// invariants (one king per side, no pawns on the back ranks)
Board from_fen(const std::string& fen);
std::string to_fen(const Board& board);
} // namespace arbiter
