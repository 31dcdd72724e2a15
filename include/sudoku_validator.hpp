#pragma once

#include "../include/board.hpp"

namespace crosshatch {
namespace sudoku_validator {
// No digit repeats within any row, column or 3x3 quadrant. Empty cells are
// ignored.
bool IsValid(Board const& board);
// Valid and without empty cells.
bool IsSolved(Board const& board);
}
}
