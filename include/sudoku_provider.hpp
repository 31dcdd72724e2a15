#pragma once

#include <istream>
#include <string>
#include <string_view>

#include "../include/board.hpp"

namespace crosshatch {
// Reads a puzzle from comma-separated text: nine lines of nine fields,
// each field empty or a digit 0-9 (empty and 0 both mean an empty cell).
class SudokuProvider {
public:
	SudokuProvider();
	bool Read(std::string_view path);
	bool Parse(std::istream& in, std::string_view source = "<input>");
	Board const& Get() const;
	bool Correct() const;
	std::string const& Error() const;
private:
	bool Fail(std::string_view source, std::string message);

	Board board_;
	bool correct_ = false;
	std::string error_;
};
}
