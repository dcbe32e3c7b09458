#ifndef NEIGHBORGRID_EXAMPLES_SUDOKU_HPP
#define NEIGHBORGRID_EXAMPLES_SUDOKU_HPP

#include <string>
#include <vector>
#include "neighborgrid/grid.hpp"

//0 marks an empty square
using SudokuBoard = neighborgrid::Grid<int>;

const int SUDOKU_SIDE = 9;
const std::size_t SUDOKU_BOX_DIVISOR = 3;

enum class Conflict {
    None,
    Row,
    Column,
    Box,
};

const char* conflict_name(Conflict c);

//Upper left origin, y grows downward, neighbors follow storage rows, so
//(x, y) reads as (column, row). Throws GridError on a malformed board,
//including squares outside 0..9.
SudokuBoard make_board(std::vector<std::vector<int>> rows);

//first constraint that forbids number at cell, Row before Column before Box;
//the cell's own value is ignored. Throws GridError if cell is outside the board.
Conflict find_conflict(const SudokuBoard &board, neighborgrid::Coordinates cell, int number);

//true if the board holds 1..9 once in every row, column and box
bool is_solved(const SudokuBoard &board);

//Fills the empty squares by backtracking. Leaves the board untouched and
//returns false when there is no solution.
bool solve(SudokuBoard &board);

std::string render_board(const SudokuBoard &board);

#endif
