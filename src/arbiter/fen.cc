#include "fen.hh"
#include "movegen.hh"
#include <cctype>
#include <sstream>

namespace arbiter
{
    static inline int sq_index(int file, int rank)
    {
        return rank * 8 + file;
    }

    static inline PieceKind kind_from_symbol(char c)
    {
        switch (c)
        {
        case 'p':
            return PAWN;
        case 'r':
            return ROOK;
        case 'n':
            return KNIGHT;
        case 'b':
            return BISHOP;
        case 'q':
            return QUEEN;
        case 'k':
            return KING;
        default:
            return NO_PIECE;
        }
    }

    static int parse_counter(const std::string &field, const std::string &fen)
    {
        if (field.empty() || field.size() > 6)
            throw FenError("Invalid move counter in FEN: " + fen);
        for (char c : field)
            if (!std::isdigit(static_cast<unsigned char>(c)))
                throw FenError("Invalid move counter in FEN: " + fen);
        return std::stoi(field);
    }

    static void parse_placement(Board &b, const std::string &board, const std::string &fen)
    {
        int r = 7, f = 0;
        for (char c : board)
        {
            //  end of row in board fen string
            if (c == '/')
            {
                if (f != 8 || r == 0)
                    throw FenError("Invalid FEN: " + fen);
                --r;
                f = 0;
                continue;
            }

            if (c >= '1' && c <= '8')
            {
                // add 'c' empty squares to board
                f += c - '0';
                if (f > 8)
                    throw FenError("Invalid FEN: " + fen);
                continue;
            }

            // uppercase is white, else black
            Colour colour = std::isupper(static_cast<unsigned char>(c)) ? WHITE : BLACK;
            PieceKind p = kind_from_symbol(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            if (p == NO_PIECE)
                throw FenError("Invalid piece in FEN: " + std::string(1, c));
            if (f > 7)
                throw FenError("Invalid FEN: " + fen);

            b.squares[sq_index(f, r)] = Piece(colour, p);
            ++f;
        }

        if (r != 0 || f != 8)
            throw FenError("Invalid FEN: " + fen);
    }

    static void check_invariants(const Board &b, const std::string &fen)
    {
        int kings[2] = {0, 0};
        for (int sq = 0; sq < 64; ++sq)
        {
            const Piece p = b.squares[sq];
            if (p.kind() == KING)
                ++kings[*p.colour()];
            if (p.kind() == PAWN && (rank(sq) == 0 || rank(sq) == 7))
                throw FenError("Pawn on back rank in FEN: " + fen);
        }
        if (kings[WHITE] != 1 || kings[BLACK] != 1)
            throw FenError("FEN needs exactly one king per side: " + fen);

        // a castling right needs its king and rook still on their home squares
        auto at_home = [&](bool right, Colour c, int king, int rook)
        {
            return !right || (b.squares[king].is(c, KING) && b.squares[rook].is(c, ROOK));
        };
        if (!at_home(b.castle.wk, WHITE, E1, H1) || !at_home(b.castle.wq, WHITE, E1, A1) ||
            !at_home(b.castle.bk, BLACK, E8, H8) || !at_home(b.castle.bq, BLACK, E8, A8))
            throw FenError("Castling rights without king and rook at home in FEN: " + fen);

        const Colour stm = b.side_to_move;
        if (is_square_attacked(b, king_sq(b, opponent(stm)), stm))
            throw FenError("Side not to move is in check in FEN: " + fen);
    }

    Board from_fen(const std::string &fen)
    {
        Board b{};
        std::istringstream ss(fen);

        // variables to define
        std::string board, stm, cast, ep, half, full, extra;

        if (!(ss >> board >> stm >> cast >> ep >> half >> full) || (ss >> extra))
            throw FenError("Invalid FEN: " + fen);

        parse_placement(b, board, fen);

        if (stm != "w" && stm != "b")
            throw FenError("Invalid side to move in FEN: " + fen);
        b.side_to_move = (stm == "w") ? WHITE : BLACK;

        b.castle = {false, false, false, false};
        if (cast != "-")
        {
            for (char c : cast)
            {
                switch (c)
                {
                case 'K':
                    b.castle.wk = true;
                    break;
                case 'Q':
                    b.castle.wq = true;
                    break;
                case 'k':
                    b.castle.bk = true;
                    break;
                case 'q':
                    b.castle.bq = true;
                    break;
                default:
                    throw FenError("Invalid castling rights in FEN: " + fen);
                }
            }
        }

        if (ep != "-")
        {
            Square eps;
            try
            {
                eps = parse_square(ep);
            }
            catch (const InvalidSquareError &)
            {
                throw FenError("Invalid en passant square in FEN: " + fen);
            }
            // the jumped-over square sits on rank 6 when White moves, rank 3 when Black moves
            if (rank(eps) != (b.side_to_move == WHITE ? 5 : 2))
                throw FenError("Invalid en passant square in FEN: " + fen);
            b.ep_square = static_cast<int>(eps);
        }

        b.halfmove_clock = parse_counter(half, fen);
        b.fullmove_number = parse_counter(full, fen);
        if (b.fullmove_number < 1)
            throw FenError("Invalid fullmove number in FEN: " + fen);

        check_invariants(b, fen);
        return b;
    }

    std::string to_fen(const Board &b)
    {
        // Helper lambda to get the piece at a specific square
        auto piece_at = [&](int sq) -> char
        {
            const Piece p = b.squares[sq];
            if (p.empty())
                return ' ';
            const char *sym = "pnbrqk";
            char ch = sym[p.kind()];
            return p.is(WHITE) ? static_cast<char>(std::toupper(ch)) : ch;
        };

        std::ostringstream out;
        for (int r = 7; r >= 0; --r)
        {
            int empty = 0;
            for (int f = 0; f < 8; ++f)
            {
                char ch = piece_at(sq_index(f, r));
                if (ch == ' ')
                {
                    ++empty;
                }
                else
                {
                    if (empty)
                    {
                        out << empty;
                        empty = 0;
                    }
                    out << ch;
                }
            }
            if (empty)
                out << empty;
            if (r)
                out << '/';
        }

        out << ' ' << (b.side_to_move == WHITE ? 'w' : 'b') << ' ';
        std::string cr;

        if (b.castle.wk)
            cr.push_back('K');
        if (b.castle.wq)
            cr.push_back('Q');
        if (b.castle.bk)
            cr.push_back('k');
        if (b.castle.bq)
            cr.push_back('q');

        out << (cr.empty() ? "-" : cr) << ' ';
        if (b.ep_square)
            out << sq_to_str(*b.ep_square);
        else
            out << '-';
        out << ' ' << b.halfmove_clock << ' ' << b.fullmove_number;

        return out.str();
    }

}
