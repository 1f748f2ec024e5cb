#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <string>

class SudokuGrid;

// True if none of the 27 units repeats a non-zero digit. A value outside 0..9
// is a broken grid, not a bad puzzle, and throws std::logic_error.
// On failure *why (if given) names the first offending unit.
bool isValidGrid(const SudokuGrid &grid, std::string *why = nullptr);

// solution is complete, valid and keeps every given of puzzle
bool isValidSolution(const SudokuGrid &puzzle, const SudokuGrid &solution, std::string *why = nullptr);

#endif // VALIDATOR_H
