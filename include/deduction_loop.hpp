#pragma once

#include <functional>
#include <iostream>
#include <vector>

#include "../include/board.hpp"
#include "../include/intersection_finder.hpp"

namespace crosshatch {
enum class LoopState {
	kRunning, kStalled, kSolved
};
char const* ToString(LoopState state);
std::ostream& operator<<(std::ostream& out, LoopState state);

// Fills cells forced by row/column intersections, pass after pass, until a
// pass finds nothing. The board is borrowed and modified in place; it has to
// be valid (see sudoku_validator::IsValid) before Run() is called.
class DeductionLoop {
public:
	using Pass = std::vector<Placement>;
	// Called after a productive pass with its 1-based number.
	using PassListener =
			std::function<void(unsigned pass, Board const& board, Pass const& placements)>;

	explicit DeductionLoop(Board& board);
	void OnPlacement(PlacementListener listener);
	void OnPass(PassListener listener);

	// Runs a single pass; false means it stalled.
	bool Step();
	LoopState Run();

	LoopState State() const;
	unsigned Passes() const;
	std::vector<Pass> const& History() const;
	Board const& Current() const;
private:
	Board& board_;
	LoopState state_ = LoopState::kRunning;
	std::vector<Pass> history_;
	PlacementListener on_placement_;
	PassListener on_pass_;
};
}
