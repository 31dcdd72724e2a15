#pragma once

#include <functional>
#include <iostream>
#include <vector>

#include "../include/board.hpp"
#include "../include/missing_numbers.hpp"

namespace crosshatch {
// A value deduced for an empty cell.
struct Placement {
	Board::Size row;
	Board::Size col;
	Board::FieldValue value;
};
bool operator==(Placement const& lhs, Placement const& rhs);
bool operator!=(Placement const& lhs, Placement const& rhs);
std::ostream& operator<<(std::ostream& out, Placement const& placement);

using PlacementListener = std::function<void(Placement const&)>;

// For every empty cell, intersects the digits missing from its row with the
// digits missing from its column and yields a placement when exactly one
// digit remains. Cells are visited column by column, top to bottom;
// placements are returned and reported to on_found in that order.
// rows and cols must have been computed from board.
std::vector<Placement> FindUniqueIntersections(Board const& board,
		MissingSets const& rows, MissingSets const& cols,
		PlacementListener const& on_found = {});
std::vector<Placement> FindUniqueIntersections(Board const& board,
		PlacementListener const& on_found = {});
}
