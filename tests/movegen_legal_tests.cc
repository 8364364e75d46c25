#include "arbiter/fen.hh"
#include "arbiter/move.hh"
#include "arbiter/move_do.hh"
#include "arbiter/movegen.hh"

#include <algorithm>
#include <iterator>
#include <catch2/catch_test_macros.hpp>
#include <random>

using namespace arbiter;

static std::size_t count_flag(const std::vector<Move>& ms, int f)
{
    std::size_t n = 0;
    for (auto m : ms)
        if (flag(m) == f)
            ++n;
    return n;
}

static const char* const SAMPLE_FENS[] = {
    START_FEN,
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
    "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
    "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1",
    "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8",
    "k3r3/8/8/3pP3/8/8/8/4K3 w - d6 0 1",
};

TEST_CASE("Startpos legal == 20")
{
    Board b = Board::startpos();
    auto legal = generate_legal_moves(b);
    REQUIRE(legal.size() == 20);
    REQUIRE(count_flag(legal, DOUBLE_PUSH) == 8);
    REQUIRE(count_flag(legal, QUIET) == 12); // 8 single pushes + 4 knight moves
}

TEST_CASE("Pinned rook: legal keeps only e-file rook moves; sideways are removed")
{
    // a8 black king, e8 black rook; e2 white rook pinned to K e1.
    Board b = from_fen("k3r3/8/8/8/8/8/4R3/4K3 w - - 0 1");

    auto pseudo = generate_moves(b);
    auto legal = generate_legal_moves(b);

    // Among moves that originate from e2 (the rook), pseudo has 13 rook moves.
    auto is_rook_from_e2 = [](Move m) { return from_sq(m) == E2; };
    std::vector<Move> pseudo_rook;
    std::copy_if(pseudo.begin(), pseudo.end(), std::back_inserter(pseudo_rook), is_rook_from_e2);
    REQUIRE(pseudo_rook.size() == 13);

    // Legal rook moves: only up the e-file (e3..e8)
    auto is_e_file = [](int sq) { return file(sq) == file(E1); }; // file 'e'
    std::vector<Move> legal_rook;
    std::copy_if(legal.begin(), legal.end(), std::back_inserter(legal_rook), is_rook_from_e2);

    // All legal rook moves must stay on e-file
    REQUIRE(std::all_of(legal_rook.begin(), legal_rook.end(), [&](Move m) { return is_e_file(to_sq(m)); }));

    // Count: exactly one capture (e2xe8), remaining five quiet pushes (e3..e7)
    REQUIRE(count_flag(legal_rook, CAPTURE) == 1);
    REQUIRE(count_flag(legal_rook, QUIET) == 5);
}

TEST_CASE("En passant that exposes check is removed by legal movegen")
{
    // White: Ke1, Pe5
    // Black: Ka8, Re8, Pd5; ep square d6 (black just played d7-d5).
    Board b = from_fen("k3r3/8/8/3pP3/8/8/8/4K3 w - d6 0 1");

    auto pseudo = generate_moves(b);
    auto legal = generate_legal_moves(b);

    REQUIRE(count_flag(pseudo, EN_PASSANT) == 1); // suggested
    REQUIRE(count_flag(legal, EN_PASSANT) == 0);  // filtered
}

TEST_CASE("Castling legal both sides in clear position (white to move)")
{
    Board b = from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    auto legal = generate_legal_moves(b);

    REQUIRE(count_flag(legal, KING_CASTLE) == 1);
    REQUIRE(count_flag(legal, QUEEN_CASTLE) == 1);
}

TEST_CASE("Castling illegal if any traversed squares attacked (white)")
{
    Board b = from_fen("r3k2r/8/8/8/1b6/8/8/R3K2R w KQkq - 0 1");
    auto legal = generate_legal_moves(b);

    REQUIRE(count_flag(legal, KING_CASTLE) == 0);
    REQUIRE(count_flag(legal, QUEEN_CASTLE) == 0);
}

TEST_CASE("Castling into an attacked square is illegal")
{
    // black bishop c5 covers g1
    Board b = from_fen("4k3/8/8/2b5/8/8/8/4K2R w K - 0 1");
    REQUIRE(count_flag(generate_legal_moves(b), KING_CASTLE) == 0);
}

TEST_CASE("Filter drops a castle through an attacked square")
{
    // black rook f8 covers f1; once castled, the rook on f1 would hide that
    Board b = from_fen("4kr2/8/8/8/8/8/8/4K2R w K - 0 1");
    const Move castle = make_move(E1, G1, KING_CASTLE);
    const Move step = make_move(E1, D1, QUIET);

    auto kept = filter_legal(b, {castle, step});
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0] == step);
    REQUIRE(filter_legal(b, {}).empty());
}

TEST_CASE("Filter drops a castle out of check")
{
    Board b = from_fen("4k3/8/8/8/8/8/8/r3K2R w K - 0 1");
    REQUIRE(in_check(b));
    REQUIRE(filter_legal(b, {make_move(E1, G1, KING_CASTLE)}).empty());
    REQUIRE(filter_legal(b, {make_move(E1, E2, QUIET)}).size() == 1);
}

TEST_CASE("Attack test counts pinned attackers")
{
    // The black knight on e5 is pinned to its king by Re1 but still gives check to Kf3.
    Board b = from_fen("4k3/8/8/4n3/8/5K2/8/4R3 w - - 0 1");

    REQUIRE(is_square_attacked(b, F3, BLACK));
    REQUIRE(in_check(b));

    // every legal reply deals with the check: the king steps off the knight's squares
    auto legal = generate_legal_moves(b);
    REQUIRE_FALSE(legal.empty());
    for (Move m : legal)
    {
        Board next = play_move(b, m);
        REQUIRE_FALSE(is_square_attacked(next, king_sq(next, WHITE), BLACK));
    }
}

TEST_CASE("Pawn pushes are not attacks")
{
    Board b = from_fen("4k3/8/8/8/8/8/4P3/4K3 b - - 0 1");
    REQUIRE_FALSE(is_square_attacked(b, E3, WHITE));
    REQUIRE(is_square_attacked(b, D3, WHITE));
    REQUIRE(is_square_attacked(b, F3, WHITE));
}

TEST_CASE("Slider attacks stop at the first blocker")
{
    Board b = from_fen("4k3/8/8/8/8/8/8/R2NK3 b - - 0 1");
    REQUIRE(is_square_attacked(b, A8, WHITE));
    REQUIRE(is_square_attacked(b, C1, WHITE));
    REQUIRE_FALSE(is_square_attacked(b, H1, BLACK));
    // rook on a1 is blocked by the knight on d1 before reaching e1..h1
    REQUIRE_FALSE(is_square_attacked(from_fen("4k3/8/8/8/8/8/8/R2N3K b - - 0 1"), F1, WHITE));
}

TEST_CASE("Legal moves never leave the mover's king attacked")
{
    for (const char* fen : SAMPLE_FENS)
    {
        Board b = from_fen(fen);
        const Colour us = b.side_to_move;

        for (Move m : generate_legal_moves(b))
        {
            Board next = apply_move(b, m);
            REQUIRE_FALSE(is_square_attacked(next, king_sq(next, us), opponent(us)));

            // the moved piece no longer stands on its old square
            REQUIRE(next.piece_at(from_sq(m)).empty());
            auto replies = generate_legal_moves(next);
            REQUIRE(std::none_of(replies.begin(), replies.end(), [&](Move r) { return from_sq(r) == from_sq(m); }));
        }
    }
}

TEST_CASE("Random playouts keep the board invariants")
{
    std::mt19937_64 rng(20240611);

    for (int game = 0; game < 20; ++game)
    {
        Board b = Board::startpos();
        for (int ply = 0; ply < 120; ++ply)
        {
            auto legal = generate_legal_moves(b);
            if (legal.empty())
                break;

            std::uniform_int_distribution<std::size_t> pick(0, legal.size() - 1);
            const Colour us = b.side_to_move;
            b = apply_move(b, legal[pick(rng)]);

            REQUIRE(king_sq(b, WHITE) >= 0);
            REQUIRE(king_sq(b, BLACK) >= 0);
            REQUIRE_FALSE(is_square_attacked(b, king_sq(b, us), opponent(us)));
            for (int f = 0; f < 8; ++f)
            {
                REQUIRE(b.piece_at(A1 + f).kind() != PAWN);
                REQUIRE(b.piece_at(A8 + f).kind() != PAWN);
            }

            // a FEN round trip reproduces the reached position exactly
            REQUIRE(to_fen(from_fen(to_fen(b))) == to_fen(b));
        }
    }
}
