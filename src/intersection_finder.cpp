#include "../include/intersection_finder.hpp"

#include <algorithm>
#include <iterator>

namespace crosshatch {
bool operator==(Placement const& lhs, Placement const& rhs) {
	return lhs.row == rhs.row && lhs.col == rhs.col && lhs.value == rhs.value;
}

bool operator!=(Placement const& lhs, Placement const& rhs) {
	return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& out, Placement const& placement) {
	return out << '(' << placement.row << ", " << placement.col << ") = "
			<< static_cast<int>(placement.value);
}

std::vector<Placement> FindUniqueIntersections(Board const& board,
		MissingSets const& rows, MissingSets const& cols,
		PlacementListener const& on_found) {
	std::vector<Placement> found;
	MissingSet candidates;
	for (auto col = 0u; col < Board::kBoardSize; ++col)
		for (auto row = 0u; row < Board::kBoardSize; ++row) {
			if (board.At(row, col) != Board::kEmpty)
				continue;
			candidates.clear();
			std::set_intersection(rows[row].begin(), rows[row].end(),
					cols[col].begin(), cols[col].end(),
					std::inserter(candidates, candidates.end()));
			if (candidates.size() != 1)
				continue;
			found.push_back(Placement { row, col, *candidates.begin() });
			if (on_found)
				on_found(found.back());
		}
	return found;
}

std::vector<Placement> FindUniqueIntersections(Board const& board,
		PlacementListener const& on_found) {
	return FindUniqueIntersections(board, MissingInRows(board),
			MissingInColumns(board), on_found);
}
}
