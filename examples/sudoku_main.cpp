#include <cstdlib>
#include "log_setup.hpp"
#include "sudoku.hpp"

using namespace neighborgrid;

//integer argument, or fallback
long int_arg(int argc, char **argv, int i, long fallback) {
    if (argc <= i)
        return fallback;
    char *end = nullptr;
    long v = std::strtol(argv[i], &end, 10);
    if (*end != '\0') {
        spdlog::warn("ignoring argument '{}', using {}", argv[i], fallback);
        return fallback;
    }
    return v;
}

//sudoku [column row number]
int main(int argc, char **argv) {
    configure_logging();

    Coordinates cell = { int_arg(argc, argv, 1, 1), int_arg(argc, argv, 2, 1) };
    int number = static_cast<int>(int_arg(argc, argv, 3, 8));

    try {
        SudokuBoard board = make_board({
            { 5, 3, 0, 0, 7, 0, 0, 0, 0 },
            { 6, 0, 0, 1, 9, 5, 0, 0, 0 },
            { 0, 9, 8, 0, 0, 0, 0, 6, 0 },
            { 8, 0, 0, 0, 6, 0, 0, 0, 3 },
            { 4, 0, 0, 8, 0, 3, 0, 0, 1 },
            { 7, 0, 0, 0, 2, 0, 0, 0, 6 },
            { 0, 6, 0, 0, 0, 0, 2, 8, 0 },
            { 0, 0, 0, 4, 1, 9, 0, 0, 5 },
            { 0, 0, 0, 0, 8, 0, 0, 7, 9 },
        });
        spdlog::info("puzzle:\n{}", render_board(board));

        Conflict c = find_conflict(board, cell, number);
        if (c == Conflict::None) {
            spdlog::info("{} can go at ({}, {}), box {}", number, cell.x, cell.y,
                    board.nrant(cell, SUDOKU_BOX_DIVISOR));
        } else {
            spdlog::info("{} can't go at ({}, {}): its {} already has one",
                    number, cell.x, cell.y, conflict_name(c));
        }

        if (!solve(board)) {
            spdlog::error("puzzle has no solution");
            return EXIT_FAILURE;
        }
        spdlog::info("solution:\n{}", render_board(board));
    } catch (const GridError &e) {
        spdlog::error("({}, {}): {}", cell.x, cell.y, e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
