// --- src/app/main.cc ---
#include "arbiter/errors.hh"
#include "arbiter/fen.hh"
#include "arbiter/game.hh"
#include "arbiter/movegen.hh"
#include "arbiter/notation.hh"
#include "arbiter/perft.hh"
#include "render.hh"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

using namespace arbiter;

static app::Glyphs glyphs = app::Glyphs::UNICODE; // --ascii or ARBITER_ASCII=1
static std::string start_fen = START_FEN;         // --fen

static void usage(const char* argv0)
{
    std::cerr << "Usage:\n"
                 "  "
              << argv0
              << " [--fen FEN] [--ascii]\n"
                 "\n"
                 "Notes:\n"
                 "  FEN must be quoted (six fields). ARBITER_ASCII=1 also selects ASCII pieces.\n";
}

static void print_help()
{
    std::cout << "commands:\n"
                 "  <move>                         play a move in coordinate notation (e2e4, e7e8q)\n"
                 "  moves                          list legal moves\n"
                 "  show                           print the board\n"
                 "  fen                            print the current position as FEN\n"
                 "  new                            restart from the start position\n"
                 "  position startpos|fen <FEN> [moves <m1> <m2> ...]\n"
                 "  perft <depth>                  count leaf nodes of the legal move tree\n"
                 "  quit\n";
}

static void show(const Game& game)
{
    const Board& b = game.board();
    std::cout << app::render_board(b, glyphs);
    if (game.is_over())
        std::cout << "result " << result_to_string(game.result()) << "\n";
    else if (in_check(b))
        std::cout << "check\n";
}

static void handle_moves(const Game& game)
{
    const auto& legal = game.legal_moves();
    std::cout << legal.size() << " legal:";
    for (Move m : legal)
        std::cout << ' ' << move_to_uci(m);
    std::cout << "\n";
}

static void handle_position(const std::string& line, Game& game)
{
    std::istringstream ss(line);
    std::string word;
    ss >> word; // "position"

    std::string sub;
    if (!(ss >> sub)) {
        std::cout << "info string warning: position needs startpos or fen\n";
        return;
    }

    Game next;
    if (sub == "fen") {
        std::string f1, f2, f3, f4, f5, f6;
        ss >> f1 >> f2 >> f3 >> f4 >> f5 >> f6;
        next = Game::from_fen(f1 + " " + f2 + " " + f3 + " " + f4 + " " + f5 + " " + f6);
    } else if (sub != "startpos") {
        std::cout << "info string warning: unknown position type " << sub << "\n";
        return;
    }

    std::string w;
    if (ss >> w && w == "moves") {
        while (ss >> w)
            next.play(w);
    }

    game = next;
    show(game);
}

static void handle_perft(const std::string& line, const Game& game)
{
    std::istringstream ss(line);
    std::string word;
    int depth = 0;
    ss >> word >> depth;
    if (depth < 1) {
        std::cout << "info string warning: perft needs a depth >= 1\n";
        return;
    }

    auto t0 = std::chrono::steady_clock::now();
    std::uint64_t total = 0;
    for (const auto& kv : perft_divide(game.board(), depth)) {
        std::cout << move_to_uci(kv.first) << ": " << kv.second << "\n";
        total += kv.second;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "nodes " << total << " time " << ms << "ms\n";
}

static void handle_move(const std::string& text, Game& game)
{
    game.play(text);
    show(game);
}

// One command; core errors are reported and the game is left as it was.
static void dispatch(const std::string& line, Game& game)
{
    try {
        if (line == "help") {
            print_help();
        } else if (line == "moves") {
            handle_moves(game);
        } else if (line == "show" || line == "d") {
            show(game);
        } else if (line == "fen") {
            std::cout << to_fen(game.board()) << "\n";
        } else if (line == "new") {
            game = Game::from_fen(start_fen);
            show(game);
        } else if (line.rfind("position", 0) == 0) {
            handle_position(line, game);
        } else if (line.rfind("perft", 0) == 0) {
            handle_perft(line, game);
        } else {
            handle_move(line, game);
        }
    } catch (const IllegalMoveError& e) {
        std::cout << "info string warning: " << e.what() << "\n";
    } catch (const GameOverError& e) {
        std::cout << "info string " << e.what() << "\n";
    } catch (const ParseError& e) {
        std::cout << "info string warning: " << e.what() << " (type help for commands)\n";
    } catch (const InvalidSquareError& e) {
        std::cout << "info string warning: " << e.what() << "\n";
    } catch (const FenError& e) {
        std::cout << "info string warning: " << e.what() << "\n";
    }
}

static bool parse_args(int argc, char** argv)
{
    if (const char* env = std::getenv("ARBITER_ASCII")) {
        if (std::strcmp(env, "1") == 0)
            glyphs = app::Glyphs::ASCII;
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--ascii") == 0) {
            glyphs = app::Glyphs::ASCII;
        } else if (std::strcmp(argv[i], "--fen") == 0 && i + 1 < argc) {
            start_fen = argv[++i];
        } else {
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv)
{
    if (!parse_args(argc, argv)) {
        usage(argv[0]);
        return 1;
    }

    // Flushes after every insertion.
    std::cout << std::unitbuf;

    Game game;
    try {
        game = Game::from_fen(start_fen);
    } catch (const FenError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    show(game);

    std::string line;
    while (true) {
        std::cout << "your move: ";
        if (!std::getline(std::cin, line))
            break;

        if (line == "quit")
            break;
        if (line.empty())
            continue;

        dispatch(line, game);
    }
    return 0;
}
