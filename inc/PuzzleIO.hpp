#ifndef PUZZLE_IO_H
#define PUZZLE_IO_H

#include <iosfwd>
#include <string>
#include <vector>
#include "Search.hpp"
#include "SudokuGrid.hpp"

std::string trim(const std::string &s);

// Keeps '0', '-', ' ' (empty) and '1'..'9'; anything else is skipped.
// Returns 0 unless exactly 9 cells were found.
int parseRow(const std::string &line, Digit row[9]);

// Puzzle text format: 9 non-blank lines of 9 cells each.
// Returns 0 on a format error, with the message in *err.
int parsePuzzleLines(const std::vector<std::string> &lines, SudokuGrid &grid, std::string *err);

int readPuzzle(std::istream &in, SudokuGrid &grid, std::string *err);

int readPuzzleFile(const std::string &path, SudokuGrid &grid, std::string *err);

// 9 lines of 9 chars, ' ' for empty cells, no trailing newline
std::string renderGrid(const SudokuGrid &grid);

// one grid after the other, separated by a line of 9 '-'
void writeSolutions(std::ostream &out, const SolutionSet &solutions);

#endif // PUZZLE_IO_H
