#include "sudoku.hpp"

using namespace neighborgrid;

const char* conflict_name(Conflict c) {
    switch (c) {
    case Conflict::None:
        return "none";
    case Conflict::Row:
        return "row";
    case Conflict::Column:
        return "column";
    case Conflict::Box:
        return "box";
    };
    return "unknown";
}

SudokuBoard make_board(std::vector<std::vector<int>> rows) {
    GridOptions options;
    options.origin = Origin::UpperLeft;
    options.inverted_y = true;
    options.neighbor_ybased = false;
    SudokuBoard board = SudokuBoard::from_rows(std::move(rows), options);
    const std::size_t side = SUDOKU_SIDE;
    if (board.rows() != side || board.columns() != side)
        throw GridError(GridErrorKind::InvalidSize);
    for (int v: board)
        if (v < 0 || v > SUDOKU_SIDE)
            throw GridError(GridErrorKind::InvalidSize);
    return board;
}

namespace {

//range holds number anywhere but at the skipped cell
template<typename Range>
bool holds(const Range &range, int number, const int *skip) {
    for (const int &v: range)
        if (&v != skip && v == number)
            return true;
    return false;
}

bool box_holds(const SudokuBoard &board, std::size_t offset, int number, const int *skip) {
    for (const int *v: board.nrant_iter(SUDOKU_BOX_DIVISOR, offset))
        if (v && v != skip && *v == number)
            return true;
    return false;
}

Conflict conflict_at(const SudokuBoard &board, std::size_t offset, int number) {
    const int *self = board.get(offset);
    if (holds(board.row_iter(offset), number, self))
        return Conflict::Row;
    if (holds(board.col_iter(offset), number, self))
        return Conflict::Column;
    if (box_holds(board, offset, number, self))
        return Conflict::Box;
    return Conflict::None;
}

bool fill_from(SudokuBoard &board, std::size_t offset) {
    while (offset < board.size() && board.at(offset) != 0)
        ++offset;
    if (offset == board.size())
        return true;

    for (int number = 1; number <= SUDOKU_SIDE; ++number) {
        if (conflict_at(board, offset, number) != Conflict::None)
            continue;
        board.set(offset, number);
        if (fill_from(board, offset + 1))
            return true;
    }
    board.set(offset, 0);
    return false;
}

} //namespace

Conflict find_conflict(const SudokuBoard &board, Coordinates cell, int number) {
    return conflict_at(board, board.resolve(cell), number);
}

bool is_solved(const SudokuBoard &board) {
    for (std::size_t i = 0; i < board.size(); ++i) {
        int v = board.at(i);
        if (v < 1 || v > SUDOKU_SIDE || conflict_at(board, i, v) != Conflict::None)
            return false;
    }
    return true;
}

bool solve(SudokuBoard &board) {
    for (std::size_t i = 0; i < board.size(); ++i) {
        int v = board.at(i);
        if (v != 0 && conflict_at(board, i, v) != Conflict::None)
            return false;
    }

    SudokuBoard original = board;
    if (fill_from(board, 0))
        return true;
    board = original;
    return false;
}

std::string render_board(const SudokuBoard &board) {
    std::string out;
    for (std::size_t j = 0; j < board.rows(); ++j) {
        if (j && j % SUDOKU_BOX_DIVISOR == 0)
            out += "------+-------+------\n";
        std::size_t i = 0;
        for (int v: board.row_iter(j * board.columns())) {
            if (i && i % SUDOKU_BOX_DIVISOR == 0)
                out += "| ";
            out.push_back(v ? static_cast<char>('0' + v) : '.');
            out.push_back(' ');
            ++i;
        }
        out.back() = '\n';
    }
    return out;
}
