#pragma once
#include "board.hh"

#include <cstdint>

namespace arbiter {
namespace zobrist {

// full recompute from board state. Covers placement, side to move, castling
// rights and the en-passant target; clocks are left out so that repeated
// positions share a key.
std::uint64_t compute(const Board& b);

// piece-square key
std::uint64_t psq(Colour c, PieceKind p, int sq);

// STM
std::uint64_t side();

// XOR of all activate castling rights
std::uint64_t castle_mask(const CastlingRights&);

// EP file
std::uint64_t ep_file(int file);

} // namespace zobrist
} // namespace arbiter
