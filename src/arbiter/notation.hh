#pragma once
#include "board.hh"
#include "move.hh"

#include <string>

namespace arbiter {

// Coordinate (UCI long algebraic) notation: "e2e4", "e1g1", "e7e8q".
std::string move_to_uci(Move m);

// Resolves `text` against the legal moves of `b`.
// Throws ParseError for malformed text, InvalidSquareError for squares off the
// board and IllegalMoveError when no legal move matches.
Move parse_uci_move(const std::string& text, const Board& b);

} // namespace arbiter
