#pragma once
#include "board.hh"

#include <cstdint>
#include <optional>

namespace arbiter {

// 16-bit move: [0..5]=from, [6..11]=to, [12..15]=flags
using Move = std::uint16_t;

constexpr Move NULL_MOVE = 0;

enum MoveFlag : uint16_t {
    QUIET = 0,
    DOUBLE_PUSH = 1,
    KING_CASTLE = 2,
    QUEEN_CASTLE = 3,
    CAPTURE = 4,
    EN_PASSANT = 5,

    // Promotions (non-captures)
    PROMO_N = 8,
    PROMO_B = 9,
    PROMO_R = 10,
    PROMO_Q = 11,

    // Promotion captures
    PROMO_N_CAPTURE = 12,
    PROMO_B_CAPTURE = 13,
    PROMO_R_CAPTURE = 14,
    PROMO_Q_CAPTURE = 15
};

constexpr Move make_move(int from, int to, int flags = QUIET)
{
    return static_cast<Move>((from & 63) | ((to & 63) << 6) | ((flags & 15) << 12));
}
constexpr int from_sq(Move m)
{
    return m & 63;
}
constexpr int to_sq(Move m)
{
    return (m >> 6) & 63;
}
constexpr int flag(Move m)
{
    return (m >> 12) & 15;
}
constexpr bool is_capture(Move m)
{
    const int f = flag(m);
    return f == CAPTURE || f == EN_PASSANT || f >= PROMO_N_CAPTURE;
}
constexpr bool is_en_passant(Move m)
{
    return flag(m) == EN_PASSANT;
}
constexpr bool is_castle_kingside(Move m)
{
    return flag(m) == KING_CASTLE;
}
constexpr bool is_castle_queenside(Move m)
{
    return flag(m) == QUEEN_CASTLE;
}
constexpr bool is_castle(Move m)
{
    return is_castle_kingside(m) || is_castle_queenside(m);
}
constexpr bool is_promotion(Move m)
{
    return flag(m) >= PROMO_N;
}

inline std::optional<PieceKind> promotion(Move m)
{
    if (!is_promotion(m))
        return std::nullopt;

    // low two bits of the flag select N/B/R/Q in that order
    static constexpr PieceKind kinds[4] = {KNIGHT, BISHOP, ROOK, QUEEN};
    return kinds[flag(m) & 3];
}

inline char promotion_char(Move m)
{
    if (auto p = promotion(m)) {
        switch (*p) {
        case QUEEN:
            return 'q';
        case ROOK:
            return 'r';
        case BISHOP:
            return 'b';
        default:
            return 'n';
        }
    }
    return '\0';
}

} // namespace arbiter
