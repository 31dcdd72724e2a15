#include "../include/board.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace crosshatch {
namespace {
constexpr Board::Size kCellCount = Board::kBoardSize * Board::kBoardSize;

void PrintBorder(std::ostream& out, char edge, char joint) {
	out << edge;
	for (auto q = 0u; q < Board::kQuadrantSize; ++q) {
		if (q > 0)
			out << joint;
		out << std::string(Board::kQuadrantSize * 2 + 1, '-');
	}
	out << edge << '\n';
}
} // namespace

Board::Board() :
		data_(kCellCount, kEmpty) {
}

Board::Board(std::vector<FieldValue> data) :
		data_(std::move(data)) {
	if (data_.size() != kCellCount)
		throw std::invalid_argument(
				"board needs " + std::to_string(kCellCount) + " cells, got "
						+ std::to_string(data_.size()));
	for (auto val : data_)
		if (val > kBoardSize)
			throw std::invalid_argument(
					"cell value " + std::to_string(val) + " is out of range");
}

Board::FieldValue Board::At(Size row, Size col) const {
	if (row >= kBoardSize || col >= kBoardSize)
		throw std::out_of_range("cell index out of range");
	return data_[row * kBoardSize + col];
}

void Board::Set(Size row, Size col, FieldValue value) {
	if (row >= kBoardSize || col >= kBoardSize)
		throw std::out_of_range("cell index out of range");
	if (value > kBoardSize)
		throw std::out_of_range(
				"cell value " + std::to_string(value) + " is out of range");
	data_[row * kBoardSize + col] = value;
}

std::vector<Board::FieldValue> const& Board::Get() const {
	return data_;
}

Board::Size Board::CountEmpty() const {
	return static_cast<Size>(std::count(data_.begin(), data_.end(), kEmpty));
}

bool operator==(Board const& lhs, Board const& rhs) {
	return lhs.Get() == rhs.Get();
}

std::ostream& operator<<(std::ostream& out, Board const& board) {
	auto const& data = board.Get();
	PrintBorder(out, '+', '+');
	for (auto row = 0u; row < Board::kBoardSize; ++row) {
		if (row > 0 && row % Board::kQuadrantSize == 0)
			PrintBorder(out, '|', '+');
		for (auto col = 0u; col < Board::kBoardSize; ++col) {
			if (col % Board::kQuadrantSize == 0)
				out << "| ";
			auto val = data[row * Board::kBoardSize + col];
			if (val == Board::kEmpty)
				out << '.';
			else
				out << static_cast<int>(val);
			out << ' ';
		}
		out << "|\n";
	}
	PrintBorder(out, '+', '+');
	return out;
}
}
