#include "../include/sudoku_validator.hpp"

#include <set>

namespace crosshatch {
namespace sudoku_validator {
namespace {
constexpr auto kQuadrantSize = Board::kQuadrantSize;
constexpr auto kBoardSize = Board::kBoardSize;

// Returns false when a non-empty value was already seen in this group.
bool Record(std::set<Board::FieldValue>& used_values, Board::FieldValue val) {
	if (val == Board::kEmpty)
		return true;
	return used_values.insert(val).second;
}

bool CheckRow(Board const& board, unsigned row) {
	std::set<Board::FieldValue> used_values;
	for (auto i = 0u; i < kBoardSize; ++i)
		if (!Record(used_values, board.At(row, i)))
			return false;
	return true;
}

bool CheckCol(Board const& board, unsigned col) {
	std::set<Board::FieldValue> used_values;
	for (auto i = 0u; i < kBoardSize; ++i)
		if (!Record(used_values, board.At(i, col)))
			return false;
	return true;
}

bool CheckQuadrant(Board const& board, unsigned row, unsigned col) {
	std::set<Board::FieldValue> used_values;
	for (auto i = 0u; i < kQuadrantSize; ++i)
		for (auto j = 0u; j < kQuadrantSize; ++j)
			if (!Record(used_values, board.At(row + i, col + j)))
				return false;
	return true;
}
} // namespace

bool IsValid(Board const& board) {
	for (auto i = 0u; i < kBoardSize; ++i)
		if (!CheckRow(board, i))
			return false;
	for (auto i = 0u; i < kBoardSize; ++i)
		if (!CheckCol(board, i))
			return false;
	for (auto i = 0u; i < kBoardSize; i += kQuadrantSize)
		for (auto j = 0u; j < kBoardSize; j += kQuadrantSize) {
			if (!CheckQuadrant(board, i, j))
				return false;
		}
	return true;
}

bool IsSolved(Board const& board) {
	return board.CountEmpty() == 0 && IsValid(board);
}
} // namespace sudoku_validator
} // namespace crosshatch
