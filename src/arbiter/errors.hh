#pragma once
#include <stdexcept>
#include <string>

namespace arbiter {

// Move is not in the legal set of the position it was offered to.
struct IllegalMoveError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Coordinate outside 0..63 or outside the 8x8 rank/file grid.
struct InvalidSquareError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FenError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed move text.
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A move was offered after checkmate, stalemate or a draw.
struct GameOverError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace arbiter
