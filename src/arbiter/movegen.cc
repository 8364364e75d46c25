#include "movegen.hh"
#include "move_do.hh" // play_move for the legality filter

#include <algorithm>

namespace arbiter
{
    // {file delta, rank delta}
    static constexpr int KNIGHT_STEPS[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
    static constexpr int KING_STEPS[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
    static constexpr int ORTHO_RAYS[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    static constexpr int DIAG_RAYS[4][2] = {{1, 1}, {-1, 1}, {1, -1}, {-1, -1}};

    static inline void push(std::vector<Move> &out, int f, int t, int fl = QUIET)
    {
        out.push_back(make_move(f, t, fl));
    }

    static inline void push_promotions(std::vector<Move> &out, int f, int t, bool capture)
    {
        if (capture)
        {
            push(out, f, t, PROMO_Q_CAPTURE);
            push(out, f, t, PROMO_R_CAPTURE);
            push(out, f, t, PROMO_B_CAPTURE);
            push(out, f, t, PROMO_N_CAPTURE);
        }
        else
        {
            push(out, f, t, PROMO_Q);
            push(out, f, t, PROMO_R);
            push(out, f, t, PROMO_B);
            push(out, f, t, PROMO_N);
        }
    }

    static void gen_pawn(std::vector<Move> &out, const Board &b, int from, Colour us)
    {
        const Colour them = opponent(us);
        const int dir = (us == WHITE) ? 1 : -1;
        const int start_rank = (us == WHITE) ? 1 : 6;
        const int promo_rank = (us == WHITE) ? 7 : 0;

        // single + double pushes
        const int one = offset(from, 0, dir);
        if (one != SQ_NONE && b.squares[one].empty())
        {
            if (rank(one) == promo_rank)
                push_promotions(out, from, one, false);
            else
                push(out, from, one, QUIET);

            if (rank(from) == start_rank)
            {
                const int two = offset(one, 0, dir);
                if (b.squares[two].empty())
                    push(out, from, two, DOUBLE_PUSH);
            }
        }

        // captures (incl. en passant)
        for (int df : {-1, 1})
        {
            const int to = offset(from, df, dir);
            if (to == SQ_NONE)
                continue;

            if (b.squares[to].is(them))
            {
                if (rank(to) == promo_rank)
                    push_promotions(out, from, to, true);
                else
                    push(out, from, to, CAPTURE);
            }
            else if (b.ep_square && *b.ep_square == to && b.squares[to].empty())
            {
                // Ensure an enemy pawn actually double-pushed to create this ep square
                const int victim = offset(to, 0, -dir);
                if (victim != SQ_NONE && b.squares[victim].is(them, PAWN))
                    push(out, from, to, EN_PASSANT);
            }
        }
    }

    static void gen_steps(std::vector<Move> &out, const Board &b, int from, Colour us, const int (*steps)[2], int n)
    {
        for (int i = 0; i < n; ++i)
        {
            const int to = offset(from, steps[i][0], steps[i][1]);
            if (to == SQ_NONE || b.squares[to].is(us))
                continue;
            push(out, from, to, b.squares[to].empty() ? QUIET : CAPTURE);
        }
    }

    static void gen_sliding(std::vector<Move> &out, const Board &b, int from, Colour us, const int (*rays)[2], int n)
    {
        for (int i = 0; i < n; ++i)
        {
            int to = from;
            while (true)
            {
                to = offset(to, rays[i][0], rays[i][1]);
                if (to == SQ_NONE || b.squares[to].is(us))
                    break;

                if (!b.squares[to].empty())
                {
                    push(out, from, to, CAPTURE);
                    break;
                }

                push(out, from, to, QUIET);
            }
        }
    }

    // Castling needs the right, king and rook at home, an empty path between them,
    // and no attack on the king's start, transit or destination square.
    static void gen_castling(std::vector<Move> &out, const Board &b, Colour us)
    {
        const Colour them = opponent(us);
        const int base = (us == WHITE) ? A1 : A8;
        const int king_from = base + 4;

        if (!b.squares[king_from].is(us, KING))
            return;

        const bool kingside = (us == WHITE) ? b.castle.wk : b.castle.bk;
        const bool queenside = (us == WHITE) ? b.castle.wq : b.castle.bq;

        auto empty = [&](int sq)
        { return b.squares[sq].empty(); };
        auto safe = [&](int sq)
        { return !is_square_attacked(b, sq, them); };

        if (kingside && b.squares[base + 7].is(us, ROOK))
        {
            bool pathEmpty = empty(base + 5) && empty(base + 6);
            if (pathEmpty && safe(king_from) && safe(base + 5) && safe(base + 6))
                push(out, king_from, base + 6, KING_CASTLE);
        }
        if (queenside && b.squares[base].is(us, ROOK))
        {
            bool pathEmpty = empty(base + 1) && empty(base + 2) && empty(base + 3);
            if (pathEmpty && safe(king_from) && safe(base + 3) && safe(base + 2))
                push(out, king_from, base + 2, QUEEN_CASTLE);
        }
    }

    std::vector<Move> generate_moves(const Board &b)
    {
        std::vector<Move> moves;
        moves.reserve(64);
        const Colour us = b.side_to_move;

        for (int from = 0; from < 64; ++from)
        {
            const Piece p = b.squares[from];
            if (!p.is(us))
                continue;

            switch (p.kind())
            {
            case PAWN:
                gen_pawn(moves, b, from, us);
                break;
            case KNIGHT:
                gen_steps(moves, b, from, us, KNIGHT_STEPS, 8);
                break;
            case BISHOP:
                gen_sliding(moves, b, from, us, DIAG_RAYS, 4);
                break;
            case ROOK:
                gen_sliding(moves, b, from, us, ORTHO_RAYS, 4);
                break;
            case QUEEN:
                gen_sliding(moves, b, from, us, ORTHO_RAYS, 4);
                gen_sliding(moves, b, from, us, DIAG_RAYS, 4);
                break;
            case KING:
                gen_steps(moves, b, from, us, KING_STEPS, 8);
                break;
            default:
                break;
            }
        }

        gen_castling(moves, b, us);

        // canonical order: from, then to, then flag
        std::sort(moves.begin(), moves.end(), [](Move x, Move y)
                  {
                      const int kx = (from_sq(x) << 10) | (to_sq(x) << 4) | flag(x);
                      const int ky = (from_sq(y) << 10) | (to_sq(y) << 4) | flag(y);
                      return kx < ky; });

        return moves;
    }

    bool is_square_attacked(const Board &b, int sq, Colour by)
    {
        // pawns: look one rank back toward the attacker for a pawn on either diagonal
        const int back = (by == WHITE) ? -1 : 1;
        for (int df : {-1, 1})
        {
            const int s = offset(sq, df, back);
            if (s != SQ_NONE && b.squares[s].is(by, PAWN))
                return true;
        }

        // knights
        for (const auto &st : KNIGHT_STEPS)
        {
            const int s = offset(sq, st[0], st[1]);
            if (s != SQ_NONE && b.squares[s].is(by, KNIGHT))
                return true;
        }

        // kings (adjacent)
        for (const auto &st : KING_STEPS)
        {
            const int s = offset(sq, st[0], st[1]);
            if (s != SQ_NONE && b.squares[s].is(by, KING))
                return true;
        }

        // sliders: the first piece on each ray decides
        auto ray_hit = [&](const int (*rays)[2], PieceKind slider)
        {
            for (int i = 0; i < 4; ++i)
            {
                int s = sq;
                while (true)
                {
                    s = offset(s, rays[i][0], rays[i][1]);
                    if (s == SQ_NONE)
                        break;
                    const Piece p = b.squares[s];
                    if (p.empty())
                        continue;
                    if (p.is(by, slider) || p.is(by, QUEEN))
                        return true;
                    break;
                }
            }
            return false;
        };

        return ray_hit(ORTHO_RAYS, ROOK) || ray_hit(DIAG_RAYS, BISHOP);
    }

    bool in_check(const Board &b)
    {
        const Colour us = b.side_to_move;
        int ksq = king_sq(b, us);
        return ksq >= 0 && is_square_attacked(b, ksq, opponent(us));
    }

    // moves are legal if they dont result in the player moving to be
    // placed in check.
    std::vector<Move> filter_legal(const Board &b, const std::vector<Move> &candidates)
    {
        std::vector<Move> legal;

        const Colour us = b.side_to_move;
        const Colour them = opponent(us);

        for (Move m : candidates)
        {
            // castling: start, transit and destination must be safe before the move
            if (is_castle(m))
            {
                const int from = from_sq(m);
                const int to = to_sq(m);
                if (is_square_attacked(b, from, them) ||
                    is_square_attacked(b, (from + to) / 2, them) ||
                    is_square_attacked(b, to, them))
                    continue;
            }

            Board next = play_move(b, m);

            int ksq = king_sq(next, us);
            bool in_check = (ksq >= 0) && is_square_attacked(next, ksq, them);

            if (!in_check)
                legal.push_back(m);
        }

        return legal;
    }

    // uses pseudo-move generator to generate all possible moves.
    std::vector<Move> generate_legal_moves(const Board &b)
    {
        return filter_legal(b, generate_moves(b));
    }
}
