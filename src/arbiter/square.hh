#pragma once
#include "errors.hh"

#include <string>

namespace arbiter {

enum Square : int {
    A1,
    B1,
    C1,
    D1,
    E1,
    F1,
    G1,
    H1,
    A2,
    B2,
    C2,
    D2,
    E2,
    F2,
    G2,
    H2,
    A3,
    B3,
    C3,
    D3,
    E3,
    F3,
    G3,
    H3,
    A4,
    B4,
    C4,
    D4,
    E4,
    F4,
    G4,
    H4,
    A5,
    B5,
    C5,
    D5,
    E5,
    F5,
    G5,
    H5,
    A6,
    B6,
    C6,
    D6,
    E6,
    F6,
    G6,
    H6,
    A7,
    B7,
    C7,
    D7,
    E7,
    F7,
    G7,
    H7,
    A8,
    B8,
    C8,
    D8,
    E8,
    F8,
    G8,
    H8,
    SQ_NONE = 64
};

constexpr int file(int s)
{
    return s & 7;
}
constexpr int rank(int s)
{
    return s >> 3;
}
constexpr bool on_board(int s)
{
    return s >= 0 && s < 64;
}

// Square `df` files and `dr` ranks away from `s`, or SQ_NONE if that leaves the board.
constexpr int offset(int s, int df, int dr)
{
    const int f = file(s) + df;
    const int r = rank(s) + dr;
    return (f < 0 || f > 7 || r < 0 || r > 7) ? SQ_NONE : r * 8 + f;
}

// Checked constructors for input coming from outside the core.
Square make_square(int rank, int file);
Square square_from_index(int index);
Square parse_square(const std::string& text); // "e4"

inline std::string sq_to_str(int sq)
{
    if (!on_board(sq))
        return "??";

    char f = char('a' + file(sq));
    char r = char('1' + rank(sq));

    return std::string() + f + r;
}

} // namespace arbiter
