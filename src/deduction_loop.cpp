#include "../include/deduction_loop.hpp"

#include <utility>

#include "../include/missing_numbers.hpp"
#include "../include/sudoku_validator.hpp"

namespace crosshatch {
char const* ToString(LoopState state) {
	switch (state) {
	case LoopState::kRunning:
		return "running";
	case LoopState::kStalled:
		return "stalled";
	case LoopState::kSolved:
		return "solved";
	}
	return "unknown";
}

std::ostream& operator<<(std::ostream& out, LoopState state) {
	return out << ToString(state);
}

DeductionLoop::DeductionLoop(Board& board) :
		board_(board) {
}

void DeductionLoop::OnPlacement(PlacementListener listener) {
	on_placement_ = std::move(listener);
}

void DeductionLoop::OnPass(PassListener listener) {
	on_pass_ = std::move(listener);
}

bool DeductionLoop::Step() {
	// Missing sets are recomputed from scratch: one placement changes a whole
	// row and a whole column.
	auto const rows = MissingInRows(board_);
	auto const cols = MissingInColumns(board_);
	auto placements = FindUniqueIntersections(board_, rows, cols,
			on_placement_);
	if (placements.empty()) {
		state_ = sudoku_validator::IsSolved(board_) ?
				LoopState::kSolved : LoopState::kStalled;
		return false;
	}
	// Every placement targets a distinct cell, none sees the others.
	for (auto const& p : placements)
		board_.Set(p.row, p.col, p.value);
	history_.emplace_back(std::move(placements));
	if (on_pass_)
		on_pass_(Passes(), board_, history_.back());
	return true;
}

LoopState DeductionLoop::Run() {
	history_.clear();
	state_ = LoopState::kRunning;
	// Each productive pass fills at least one of the empty cells, so this
	// ends after at most 81 passes.
	while (board_.CountEmpty() > 0 && Step()) {
	}
	state_ = sudoku_validator::IsSolved(board_) ?
			LoopState::kSolved : LoopState::kStalled;
	return state_;
}

LoopState DeductionLoop::State() const {
	return state_;
}

unsigned DeductionLoop::Passes() const {
	return static_cast<unsigned>(history_.size());
}

std::vector<DeductionLoop::Pass> const& DeductionLoop::History() const {
	return history_;
}

Board const& DeductionLoop::Current() const {
	return board_;
}
}
