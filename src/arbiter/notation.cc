#include "notation.hh"
#include "movegen.hh"

#include <cctype>

namespace arbiter {

std::string move_to_uci(Move m)
{
    std::string s = sq_to_str(from_sq(m)) + sq_to_str(to_sq(m));
    if (char pc = promotion_char(m))
        s += pc;
    return s;
}

Move parse_uci_move(const std::string& text, const Board& b)
{
    if (text.size() != 4 && text.size() != 5)
        throw ParseError("Invalid move text: " + text);

    const int from = parse_square(text.substr(0, 2));
    const int to = parse_square(text.substr(2, 2));

    char promo = '\0';
    if (text.size() == 5) {
        promo = static_cast<char>(std::tolower(static_cast<unsigned char>(text[4])));
        if (promo != 'q' && promo != 'r' && promo != 'b' && promo != 'n')
            throw ParseError("Invalid promotion piece: " + text);
    }

    // a promotion move without its suffix matches nothing here, so it is
    // reported as illegal rather than silently picking a piece
    for (Move m : generate_legal_moves(b)) {
        if (from_sq(m) == from && to_sq(m) == to && promotion_char(m) == promo)
            return m;
    }

    throw IllegalMoveError("Illegal move: " + text);
}

} // namespace arbiter
