#include "zobrist.hh"

namespace arbiter {
namespace zobrist {

namespace {

struct Keys {
    std::uint64_t psq[2][6][64]; // colour, piece, square
    std::uint64_t side;
    std::uint64_t castle_wk, castle_wq, castle_bk, castle_bq;
    std::uint64_t ep_file[8];
};

// SplitMix64: deterministic generator for table fill
inline std::uint64_t splitmix64(std::uint64_t& x)
{
    std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

Keys make_keys()
{
    Keys k{};
    std::uint64_t seed = 0xC0FFEE5EED5BADULL; // fixed seed for reproducibility
    for (int c = 0; c < 2; ++c)
        for (int p = 0; p < 6; ++p)
            for (int s = 0; s < 64; ++s)
                k.psq[c][p][s] = splitmix64(seed);

    k.side = splitmix64(seed);

    k.castle_wk = splitmix64(seed);
    k.castle_wq = splitmix64(seed);
    k.castle_bk = splitmix64(seed);
    k.castle_bq = splitmix64(seed);

    for (int f = 0; f < 8; ++f)
        k.ep_file[f] = splitmix64(seed);

    return k;
}

// built once, on first use
const Keys& keys()
{
    static const Keys table = make_keys();
    return table;
}

} // namespace

std::uint64_t compute(const Board& b)
{
    const Keys& z = keys();

    std::uint64_t k = 0;

    for (int sq = 0; sq < 64; ++sq) {
        const Piece p = b.squares[sq];
        if (!p.empty())
            k ^= z.psq[*p.colour()][p.kind()][sq];
    }

    // side to move
    if (b.side_to_move == BLACK)
        k ^= z.side;

    // castling rights
    k ^= castle_mask(b.castle);

    // en passant file
    if (b.ep_square)
        k ^= z.ep_file[*b.ep_square & 7];

    return k;
}

std::uint64_t psq(Colour c, PieceKind p, int sq)
{
    return keys().psq[c][p][sq];
}
std::uint64_t side()
{
    return keys().side;
}

std::uint64_t castle_mask(const CastlingRights& cr)
{
    const Keys& z = keys();
    std::uint64_t k = 0;
    if (cr.wk)
        k ^= z.castle_wk;
    if (cr.wq)
        k ^= z.castle_wq;
    if (cr.bk)
        k ^= z.castle_bk;
    if (cr.bq)
        k ^= z.castle_bq;
    return k;
}

std::uint64_t ep_file(int file)
{
    return keys().ep_file[file & 7];
}

} // namespace zobrist
} // namespace arbiter
