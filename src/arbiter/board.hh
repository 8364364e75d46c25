#pragma once
#include "square.hh"

#include <array>
#include <cstdint>
#include <optional>

namespace arbiter {

enum Colour : std::uint8_t { WHITE, BLACK };

enum PieceKind : std::uint8_t { PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING, NO_PIECE };

constexpr Colour opponent(Colour c)
{
    return c == WHITE ? BLACK : WHITE;
}

// Contents of one square: either empty, or a piece of some colour and kind.
// An empty square has no colour; all empty squares compare equal.
class Piece {
public:
    constexpr Piece() = default;
    constexpr Piece(Colour c, PieceKind k) : kind_(k), colour_(k == NO_PIECE ? WHITE : c) {}

    constexpr PieceKind kind() const { return kind_; }
    constexpr bool empty() const { return kind_ == NO_PIECE; }

    std::optional<Colour> colour() const
    {
        if (empty())
            return std::nullopt;
        return colour_;
    }

    constexpr bool is(Colour c) const { return !empty() && colour_ == c; }
    constexpr bool is(Colour c, PieceKind k) const { return kind_ == k && is(c); }

    friend constexpr bool operator==(Piece a, Piece b) { return a.kind_ == b.kind_ && a.colour_ == b.colour_; }
    friend constexpr bool operator!=(Piece a, Piece b) { return !(a == b); }

private:
    PieceKind kind_{NO_PIECE};
    Colour colour_{WHITE};
};

struct CastlingRights {
    bool wk{true};
    bool wq{true};
    bool bk{true};
    bool bq{true};
};

inline bool operator==(const CastlingRights& a, const CastlingRights& b)
{
    return a.wk == b.wk && a.wq == b.wq && a.bk == b.bk && a.bq == b.bq;
}
inline bool operator!=(const CastlingRights& a, const CastlingRights& b)
{
    return !(a == b);
}

// Position snapshot. Boards are values: the move applier returns a new one
// and never touches the board it was given.
struct Board {
    std::array<Piece, 64> squares{};
    Colour side_to_move{WHITE};
    CastlingRights castle{};
    std::optional<int> ep_square{}; // square jumped over by the last double push
    int halfmove_clock{0};
    int fullmove_number{1};

    static Board startpos();

    // throws InvalidSquareError for sq outside 0..63
    Piece piece_at(int sq) const;
};

// -1 if the colour has no king on the board.
int king_sq(const Board& b, Colour c);

// Placement, side to move, castling rights and en-passant target all equal.
// Clocks are not part of the position.
bool same_position(const Board& a, const Board& b);

// Returns true for trivial insufficient material draws
// KK, KBK, KNK
bool trivial_insufficient_material(const Board& b);

} // namespace arbiter
