#pragma once
#include "board.hh"
#include "move.hh"

namespace arbiter {

// Checked move application: throws IllegalMoveError unless `m` is in
// generate_legal_moves(b). `b` is left untouched either way.
Board apply_move(const Board& b, Move m);

// Unchecked move application - does not check legality.
// Shared by the legality filter and perft, where `m` comes straight from the generator.
Board play_move(const Board& b, Move m);

} // namespace arbiter
