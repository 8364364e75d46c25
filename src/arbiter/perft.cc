#include "perft.hh"
#include "move_do.hh"
#include "movegen.hh"

namespace arbiter
{
    //  follows chess programming wiki for performance test (perft) function.
    // https://www.chessprogramming.org/Perft
    std::uint64_t perft(const Board &b, int depth)
    {
        if (depth <= 0)
            return 1;

        auto moves = generate_legal_moves(b);

        // can return early here as we know the number of legal moves
        // the number of legal moves with depth 1 is the number of states.
        if (depth == 1)
            return moves.size();

        std::uint64_t nodes = 0;

        for (auto m : moves)
            nodes += perft(play_move(b, m), depth - 1);
        return nodes;
    }

    // perft divide lists all moves and perft of the decremented depth.
    // returns a vector of pairs Moves/number of nodes.
    std::vector<std::pair<Move, std::uint64_t>> perft_divide(const Board &b, int depth)
    {
        std::vector<std::pair<Move, std::uint64_t>> out;
        if (depth < 1)
            return out;

        auto moves = generate_legal_moves(b);

        for (auto m : moves)
            out.emplace_back(m, perft(play_move(b, m), depth - 1));

        return out;
    }
}
