#pragma once

#include <cstdint>
#include <iostream>
#include <vector>

namespace crosshatch {
class Board {
public:
	using FieldValue = uint8_t;
	using Size = unsigned;
	static constexpr Size kQuadrantSize = 3;
	static constexpr Size kBoardSize = kQuadrantSize * kQuadrantSize;
	static constexpr FieldValue kEmpty = 0;
	Board();
	explicit Board(std::vector<FieldValue> data);
	FieldValue At(Size row, Size col) const;
	void Set(Size row, Size col, FieldValue value);
	std::vector<FieldValue> const& Get() const;
	Size CountEmpty() const;
private:
	std::vector<FieldValue> data_;
};
bool operator==(Board const& lhs, Board const& rhs);
std::ostream& operator<<(std::ostream& out, Board const& board);
}
