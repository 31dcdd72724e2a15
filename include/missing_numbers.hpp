#pragma once

#include <array>
#include <set>

#include "../include/board.hpp"

namespace crosshatch {
using MissingSet = std::set<Board::FieldValue>;
// Indexed by row or by column number.
using MissingSets = std::array<MissingSet, Board::kBoardSize>;

// {1..9}, shared and never modified.
MissingSet const& AllDigits();

// Digits 1-9 absent from each row. Duplicated values are tolerated.
MissingSets MissingInRows(Board const& board);
// Digits 1-9 absent from each column.
MissingSets MissingInColumns(Board const& board);
}
