#pragma once
#include "board.hh"
#include "move.hh"

#include <vector>

namespace arbiter {
// pseudo-legal generator (may include moves leaving king in check).
// Sorted by from-square, then to-square, then flag.
std::vector<Move> generate_moves(const Board&);

// legal generator (filters pseudo-legal moves by playing them on a copy + check test)
std::vector<Move> generate_legal_moves(const Board&);

// Keeps the candidates that are legal in `b`. Castles must also have a safe
// start, transit and destination square. Candidates are assumed pseudo-legal.
std::vector<Move> filter_legal(const Board& b, const std::vector<Move>& candidates);

// True if any piece of colour `by` attacks `sq`. Uses attack patterns only
// (pawn diagonals, never pushes) and ignores pins, so it never consults the
// legal generator.
bool is_square_attacked(const Board& b, int sq, Colour by);

// Side to move's king is attacked.
bool in_check(const Board& b);
} // namespace arbiter
