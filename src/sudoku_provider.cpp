#include "../include/sudoku_provider.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace crosshatch {
namespace {
constexpr Board::Size kSudokuSize = Board::kBoardSize * Board::kBoardSize;

std::string Trim(std::string const& s) {
	auto const ws = " \t\r\n";
	auto begin = s.find_first_not_of(ws);
	if (begin == std::string::npos)
		return {};
	auto end = s.find_last_not_of(ws);
	return s.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitFields(std::string const& line) {
	std::vector<std::string> fields;
	std::string::size_type start = 0;
	while (true) {
		auto comma = line.find(',', start);
		if (comma == std::string::npos) {
			fields.emplace_back(line.substr(start));
			break;
		}
		fields.emplace_back(line.substr(start, comma - start));
		start = comma + 1;
	}
	return fields;
}

std::string Unquote(std::string field) {
	if (field.size() >= 2 && field.front() == '"' && field.back() == '"')
		field = Trim(field.substr(1, field.size() - 2));
	return field;
}

std::string Where(unsigned row, unsigned col) {
	return "row " + std::to_string(row) + ", column " + std::to_string(col);
}
} // namespace

SudokuProvider::SudokuProvider() = default;

bool SudokuProvider::Read(std::string_view path) {
	auto file = std::ifstream(std::string(path));
	if (!file.is_open())
		return Fail({}, "Could not open " + std::string(path));
	return Parse(file, path);
}

bool SudokuProvider::Parse(std::istream& in, std::string_view source) {
	correct_ = false;
	error_.clear();
	board_ = Board();

	std::vector<Board::FieldValue> data;
	data.reserve(kSudokuSize);
	auto row = 0u;
	std::string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (row >= Board::kBoardSize)
			return Fail(source,
					"file has more than " + std::to_string(Board::kBoardSize)
							+ " rows (extra row at index " + std::to_string(row)
							+ ")");
		auto fields = SplitFields(line);
		if (fields.size() != Board::kBoardSize)
			return Fail(source,
					"row " + std::to_string(row) + " has "
							+ std::to_string(fields.size()) + " columns, expected "
							+ std::to_string(Board::kBoardSize) + ": '" + line + "'");
		for (auto col = 0u; col < Board::kBoardSize; ++col) {
			auto cell = Unquote(Trim(fields[col]));
			if (cell.empty() || cell == "0") {
				data.emplace_back(Board::kEmpty);
				continue;
			}
			int val = 0;
			std::size_t used = 0;
			try {
				val = std::stoi(cell, &used);
			} catch (std::invalid_argument const&) {
				used = 0;
			} catch (std::out_of_range const&) {
				return Fail(source, "value out of range at " + Where(row, col)
						+ ": '" + cell + "', expected a number from 0 to 9");
			}
			if (used == 0 || used != cell.size())
				return Fail(source, "invalid value at " + Where(row, col) + ": '"
						+ cell + "', expected a number from 0 to 9");
			if (val < 0 || val > static_cast<int>(Board::kBoardSize))
				return Fail(source, "value out of range at " + Where(row, col)
						+ ": '" + cell + "', expected a number from 0 to 9");
			data.emplace_back(static_cast<Board::FieldValue>(val));
		}
		++row;
	}
	if (row != Board::kBoardSize)
		return Fail(source, "file has " + std::to_string(row)
				+ " rows, expected " + std::to_string(Board::kBoardSize));

	board_ = Board(std::move(data));
	correct_ = true;
	return true;
}

Board const& SudokuProvider::Get() const {
	return board_;
}

bool SudokuProvider::Correct() const {
	return correct_;
}

std::string const& SudokuProvider::Error() const {
	return error_;
}

bool SudokuProvider::Fail(std::string_view source, std::string message) {
	correct_ = false;
	board_ = Board();
	error_ = std::move(message);
	if (!source.empty())
		std::cerr << source << ": ";
	std::cerr << error_ << '\n';
	return false;
}
}
