#include "../include/missing_numbers.hpp"

namespace crosshatch {
namespace {
MissingSet MakeAllDigits() {
	MissingSet digits;
	for (auto d = 1u; d <= Board::kBoardSize; ++d)
		digits.insert(static_cast<Board::FieldValue>(d));
	return digits;
}
} // namespace

MissingSet const& AllDigits() {
	static const MissingSet kAllDigits = MakeAllDigits();
	return kAllDigits;
}

MissingSets MissingInRows(Board const& board) {
	MissingSets missing;
	for (auto row = 0u; row < Board::kBoardSize; ++row) {
		missing[row] = AllDigits();
		for (auto col = 0u; col < Board::kBoardSize; ++col)
			missing[row].erase(board.At(row, col));
	}
	return missing;
}

MissingSets MissingInColumns(Board const& board) {
	MissingSets missing;
	for (auto col = 0u; col < Board::kBoardSize; ++col) {
		missing[col] = AllDigits();
		for (auto row = 0u; row < Board::kBoardSize; ++row)
			missing[col].erase(board.At(row, col));
	}
	return missing;
}
}
