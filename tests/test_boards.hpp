#pragma once

#include <utility>
#include <vector>

#include "../include/board.hpp"

namespace crosshatch {
namespace test {
inline Board SolvedBoard() {
	return Board(std::vector<Board::FieldValue> {
		5, 3, 4, 6, 7, 8, 9, 1, 2,
		6, 7, 2, 1, 9, 5, 3, 4, 8,
		1, 9, 8, 3, 4, 2, 5, 6, 7,
		8, 5, 9, 7, 6, 1, 4, 2, 3,
		4, 2, 6, 8, 5, 3, 7, 9, 1,
		7, 1, 3, 9, 2, 4, 8, 5, 6,
		9, 6, 1, 5, 3, 7, 2, 8, 4,
		2, 8, 7, 4, 1, 9, 6, 3, 5,
		3, 4, 5, 2, 8, 6, 1, 7, 9,
	});
}

inline Board ClassicPuzzle() {
	return Board(std::vector<Board::FieldValue> {
		5, 3, 0, 0, 7, 0, 0, 0, 0,
		6, 0, 0, 1, 9, 5, 0, 0, 0,
		0, 9, 8, 0, 0, 0, 0, 6, 0,
		8, 0, 0, 0, 6, 0, 0, 0, 3,
		4, 0, 0, 8, 0, 3, 0, 0, 1,
		7, 0, 0, 0, 2, 0, 0, 0, 6,
		0, 6, 0, 0, 0, 0, 2, 8, 0,
		0, 0, 0, 4, 1, 9, 0, 0, 5,
		0, 0, 0, 0, 8, 0, 0, 7, 9,
	});
}

// Row 0 lacks {1, 2}, column 0 lacks {1, 3}; only (0, 0) is forced.
inline Board CornerPuzzle() {
	return Board(std::vector<Board::FieldValue> {
		0, 0, 3, 4, 5, 6, 7, 8, 9,
		2, 0, 0, 0, 0, 0, 0, 0, 0,
		4, 0, 0, 0, 0, 0, 0, 0, 0,
		5, 0, 0, 0, 0, 0, 0, 0, 0,
		6, 0, 0, 0, 0, 0, 0, 0, 0,
		7, 0, 0, 0, 0, 0, 0, 0, 0,
		8, 0, 0, 0, 0, 0, 0, 0, 0,
		9, 0, 0, 0, 0, 0, 0, 0, 0,
		0, 0, 0, 0, 0, 0, 0, 0, 0,
	});
}

inline Board SwapRows(Board const& board, Board::Size a, Board::Size b) {
	Board swapped = board;
	for (auto col = 0u; col < Board::kBoardSize; ++col) {
		swapped.Set(a, col, board.At(b, col));
		swapped.Set(b, col, board.At(a, col));
	}
	return swapped;
}

inline Board SwapCols(Board const& board, Board::Size a, Board::Size b) {
	Board swapped = board;
	for (auto row = 0u; row < Board::kBoardSize; ++row) {
		swapped.Set(row, a, board.At(row, b));
		swapped.Set(row, b, board.At(row, a));
	}
	return swapped;
}

inline Board SwapBands(Board board, Board::Size a, Board::Size b) {
	for (auto i = 0u; i < Board::kQuadrantSize; ++i)
		board = SwapRows(board, a * Board::kQuadrantSize + i,
				b * Board::kQuadrantSize + i);
	return board;
}

inline Board SwapStacks(Board board, Board::Size a, Board::Size b) {
	for (auto i = 0u; i < Board::kQuadrantSize; ++i)
		board = SwapCols(board, a * Board::kQuadrantSize + i,
				b * Board::kQuadrantSize + i);
	return board;
}
} // namespace test
} // namespace crosshatch
