#include "move_do.hh"
#include "movegen.hh"
#include "notation.hh"

#include <algorithm>

namespace arbiter
{
    static inline void clear_castle_for_corner(Board &b, int sq)
    {
        switch (sq)
        {
        case H1:
            b.castle.wk = false;
            break;
        case A1:
            b.castle.wq = false;
            break;
        case H8:
            b.castle.bk = false;
            break;
        case A8:
            b.castle.bq = false;
            break;
        default:
            break;
        }
    }

    Board play_move(const Board &in, Move m)
    {
        Board b = in;

        const Colour us = b.side_to_move;
        const Colour them = opponent(us);
        const int from = from_sq(m);
        const int to = to_sq(m);
        const int fl = flag(m);

        const Piece moved = b.squares[from];

        // defaults
        b.ep_square.reset();

        // Handle captures first (incl. promo captures & EP)
        bool any_capture = false;
        if (fl == EN_PASSANT)
        {
            int capSq = (us == WHITE) ? (to - 8) : (to + 8);
            b.squares[capSq] = Piece{};
            any_capture = true;
        }
        else if (!b.squares[to].empty())
        {
            // a rook taken on its corner takes the matching right with it
            clear_castle_for_corner(b, to);
            any_capture = true;
        }

        // Move our piece off 'from' and place it (or its promotion) on 'to'
        b.squares[from] = Piece{};
        if (auto promo = promotion(m))
            b.squares[to] = Piece(us, *promo);
        else
            b.squares[to] = moved;

        if (fl == KING_CASTLE || fl == QUEEN_CASTLE)
        {
            const int base = (us == WHITE) ? A1 : A8;
            const int rookFrom = (fl == KING_CASTLE) ? base + 7 : base;
            const int rookTo = (fl == KING_CASTLE) ? base + 5 : base + 3;
            b.squares[rookTo] = b.squares[rookFrom];
            b.squares[rookFrom] = Piece{};
        }
        else if (fl == DOUBLE_PUSH)
        {
            // EP square is the jumped-over square
            b.ep_square = (from + to) / 2;
        }

        // Update castling rights (king/rook move)
        if (moved.kind() == KING)
        {
            if (us == WHITE)
                b.castle.wk = b.castle.wq = false;
            else
                b.castle.bk = b.castle.bq = false;
        }
        else if (moved.kind() == ROOK)
        {
            clear_castle_for_corner(b, from);
        }

        // 50-move clock
        if (moved.kind() == PAWN || any_capture)
            b.halfmove_clock = 0;
        else
            b.halfmove_clock += 1;

        // move number and side to move
        if (us == BLACK)
            b.fullmove_number += 1;
        b.side_to_move = them;

        return b;
    }

    Board apply_move(const Board &b, Move m)
    {
        const auto legal = generate_legal_moves(b);
        if (std::find(legal.begin(), legal.end(), m) == legal.end())
            throw IllegalMoveError("Illegal move: " + move_to_uci(m));

        return play_move(b, m);
    }
}
