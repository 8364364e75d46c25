#include "board.hh"

namespace arbiter {

Board Board::startpos()
{
    Board b{};

    static constexpr PieceKind back_rank[8] = {ROOK, KNIGHT, BISHOP, QUEEN, KING, BISHOP, KNIGHT, ROOK};

    for (int f = 0; f < 8; ++f) {
        /* White pieces */
        b.squares[A1 + f] = Piece(WHITE, back_rank[f]);
        b.squares[A2 + f] = Piece(WHITE, PAWN);

        /* Black pieces */
        b.squares[A7 + f] = Piece(BLACK, PAWN);
        b.squares[A8 + f] = Piece(BLACK, back_rank[f]);
    }

    b.side_to_move = WHITE;
    return b;
}

Piece Board::piece_at(int sq) const
{
    if (!on_board(sq))
        throw InvalidSquareError("Invalid square index: " + std::to_string(sq));
    return squares[sq];
}

int king_sq(const Board& b, Colour c)
{
    for (int sq = 0; sq < 64; ++sq)
        if (b.squares[sq].is(c, KING))
            return sq;
    return -1;
}

bool same_position(const Board& a, const Board& b)
{
    return a.squares == b.squares && a.side_to_move == b.side_to_move && a.castle == b.castle &&
           a.ep_square == b.ep_square;
}

bool trivial_insufficient_material(const Board& b)
{
    int minors = 0;

    for (const Piece& p : b.squares) {
        switch (p.kind()) {
        // any pawns, queens, rooks present? if so, not draw
        case PAWN:
        case ROOK:
        case QUEEN:
            return false;
        case KNIGHT:
        case BISHOP:
            ++minors;
            break;
        default:
            break;
        }
    }

    // KK, or exactly 1 minor on entire board
    // intentionally do not count K+N vs K+N or K+B vs K+B as draw
    return minors <= 1;
}

} // namespace arbiter
