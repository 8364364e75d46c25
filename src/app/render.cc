#include "render.hh"

#include <sstream>

namespace arbiter {
namespace app {

std::string piece_glyph(Piece p, Glyphs g)
{
    if (p.empty())
        return g == Glyphs::UNICODE ? "·" : ".";

    if (g == Glyphs::ASCII) {
        const char* sym = "pnbrqk";
        char ch = sym[p.kind()];
        return std::string(1, p.is(WHITE) ? static_cast<char>(ch - 'a' + 'A') : ch);
    }

    // indexed by PieceKind: pawn, knight, bishop, rook, queen, king
    static const char* const white[6] = {"♙", "♘", "♗", "♖", "♕", "♔"};
    static const char* const black[6] = {"♟", "♞", "♝", "♜", "♛", "♚"};
    return p.is(WHITE) ? white[p.kind()] : black[p.kind()];
}

std::string render_board(const Board& b, Glyphs g)
{
    std::ostringstream out;

    out << "  a b c d e f g h\n";
    out << " +---------------+\n";

    for (int r = 7; r >= 0; --r) {
        out << (r + 1) << '|';
        for (int f = 0; f < 8; ++f) {
            out << piece_glyph(b.piece_at(r * 8 + f), g);
            if (f < 7)
                out << ' ';
        }
        out << '|' << (r + 1) << '\n';
    }

    out << " +---------------+\n";
    out << "  a b c d e f g h\n";
    out << (b.side_to_move == WHITE ? "White" : "Black") << " to move\n";

    return out.str();
}

} // namespace app
} // namespace arbiter
