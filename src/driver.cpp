#include "../include/driver.hpp"

#include "../include/board.hpp"
#include "../include/deduction_loop.hpp"
#include "../include/sudoku_provider.hpp"
#include "../include/sudoku_validator.hpp"

namespace crosshatch {
namespace driver {
std::list<std::string> InputPaths(int argc, char const** argv) {
	std::list<std::string> paths;
	for (auto i = 1; i < argc; ++i)
		paths.emplace_back(argv[i]);
	if (paths.empty())
		paths.emplace_back(kDefaultPath);
	return paths;
}

bool Process(std::string const& path, std::ostream& out) {
	SudokuProvider provider;
	if (!provider.Read(path))
		return false;
	auto board = provider.Get();
	if (!sudoku_validator::IsValid(board)) {
		out << path << ": Invalid Sudoku puzzle\n";
		return false;
	}
	out << path << '\n' << board;

	DeductionLoop loop(board);
	loop.OnPlacement([&out](Placement const& p) {
		out << "Unique intersection found at row " << p.row << ", column "
				<< p.col << ": " << static_cast<int>(p.value) << '\n';
	});
	loop.OnPass([&out](unsigned pass, Board const& current,
			DeductionLoop::Pass const& placements) {
		out << "Pass " << pass << " filled " << placements.size()
				<< " cell(s)\n" << current;
	});
	auto state = loop.Run();
	// The loop only leaves cells empty when its last pass found nothing.
	if (board.CountEmpty() > 0)
		out << "No more unique intersections\n";
	if (state == LoopState::kSolved)
		out << "Sudoku solved!";
	else
		out << "Sudoku not solved by row/column intersection.";
	out << " (" << loop.Passes() << " pass(es), " << board.CountEmpty()
			<< " empty cell(s) left)\n";
	return true;
}

int Run(std::list<std::string> const& paths, std::ostream& out) {
	bool all_ok = true;
	for (auto const& path : paths)
		all_ok = Process(path, out) && all_ok;
	return all_ok ? 0 : 1;
}
} // namespace driver
} // namespace crosshatch
