#include "square.hh"

namespace arbiter {

Square make_square(int r, int f)
{
    if (r < 0 || r > 7 || f < 0 || f > 7)
        throw InvalidSquareError("Invalid square: rank " + std::to_string(r) + ", file " + std::to_string(f));
    return static_cast<Square>(r * 8 + f);
}

Square square_from_index(int index)
{
    if (!on_board(index))
        throw InvalidSquareError("Invalid square index: " + std::to_string(index));
    return static_cast<Square>(index);
}

Square parse_square(const std::string& text)
{
    if (text.size() != 2)
        throw InvalidSquareError("Invalid square: " + text);

    const int f = text[0] - 'a';
    const int r = text[1] - '1';
    if (f < 0 || f > 7 || r < 0 || r > 7)
        throw InvalidSquareError("Invalid square: " + text);

    return static_cast<Square>(r * 8 + f);
}

} // namespace arbiter
