#pragma once
#include "arbiter/board.hh"

#include <string>

namespace arbiter {
namespace app {

enum class Glyphs { UNICODE, ASCII };

// Single piece glyph; empty squares render as "·" (Unicode) or "." (ASCII).
std::string piece_glyph(Piece p, Glyphs g);

// Board drawn White at the bottom, framed by file letters and rank numbers:
//
//   a b c d e f g h
//  +---------------+
// 8|r n b q k b n r|8
// ...
std::string render_board(const Board& b, Glyphs g);

} // namespace app
} // namespace arbiter
