#pragma once

#include <iostream>
#include <list>
#include <string>

namespace crosshatch {
namespace driver {
constexpr char const* kDefaultPath = "sudoku.csv";

// Paths given on the command line, or kDefaultPath when there are none.
std::list<std::string> InputPaths(int argc, char const** argv);

// Reads, validates and runs the deduction loop on one puzzle, reporting to
// out. False when the file could not be read or the puzzle is invalid; a
// puzzle that stalls still counts as processed.
bool Process(std::string const& path, std::ostream& out);

// Processes every path, even after a failure. Returns the exit status.
int Run(std::list<std::string> const& paths, std::ostream& out);
}
}
