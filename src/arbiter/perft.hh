#pragma once
#include "board.hh"
#include "move.hh"

#include <cstdint>
#include <utility>
#include <vector>

namespace arbiter {
// Leaf count of the legal move tree; depth <= 0 counts the root once.
std::uint64_t perft(const Board& b, int depth);

std::vector<std::pair<Move, std::uint64_t>> perft_divide(const Board& b, int depth);
} // namespace arbiter
