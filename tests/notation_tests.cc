#include <catch2/catch_test_macros.hpp>
#include "arbiter/errors.hh"
#include "arbiter/fen.hh"
#include "arbiter/move.hh"
#include "arbiter/notation.hh"

using namespace arbiter;

TEST_CASE("move_to_uci")
{
    REQUIRE(move_to_uci(make_move(E2, E4, DOUBLE_PUSH)) == "e2e4");
    REQUIRE(move_to_uci(make_move(E1, G1, KING_CASTLE)) == "e1g1");
    REQUIRE(move_to_uci(make_move(E7, E8, PROMO_Q)) == "e7e8q");
    REQUIRE(move_to_uci(make_move(B2, A1, PROMO_N_CAPTURE)) == "b2a1n");
}

TEST_CASE("parse_uci_move resolves against the legal moves")
{
    Board start = Board::startpos();
    REQUIRE(parse_uci_move("e2e4", start) == make_move(E2, E4, DOUBLE_PUSH));
    REQUIRE(parse_uci_move("g1f3", start) == make_move(G1, F3));

    Board castle = from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    REQUIRE(parse_uci_move("e1g1", castle) == make_move(E1, G1, KING_CASTLE));
    REQUIRE(parse_uci_move("e1c1", castle) == make_move(E1, C1, QUEEN_CASTLE));

    Board promo = from_fen("1r2k3/P7/8/8/8/8/8/4K3 w - - 0 1");
    REQUIRE(parse_uci_move("a7a8n", promo) == make_move(A7, A8, PROMO_N));
    REQUIRE(parse_uci_move("a7b8Q", promo) == make_move(A7, B8, PROMO_Q_CAPTURE));
}

TEST_CASE("parse_uci_move errors")
{
    Board start = Board::startpos();

    REQUIRE_THROWS_AS(parse_uci_move("", start), ParseError);
    REQUIRE_THROWS_AS(parse_uci_move("e2", start), ParseError);
    REQUIRE_THROWS_AS(parse_uci_move("e2e4e5", start), ParseError);
    REQUIRE_THROWS_AS(parse_uci_move("i2i4", start), InvalidSquareError);
    REQUIRE_THROWS_AS(parse_uci_move("e2e9", start), InvalidSquareError);
    REQUIRE_THROWS_AS(parse_uci_move("e2e5", start), IllegalMoveError);
    REQUIRE_THROWS_AS(parse_uci_move("e7e5", start), IllegalMoveError);
    REQUIRE_THROWS_AS(parse_uci_move("e2e4q", start), IllegalMoveError);

    Board promo = from_fen("1r2k3/P7/8/8/8/8/8/4K3 w - - 0 1");
    REQUIRE_THROWS_AS(parse_uci_move("a7a8", promo), IllegalMoveError); // piece must be named
    REQUIRE_THROWS_AS(parse_uci_move("a7a8k", promo), ParseError);
}
