#ifndef SUDOKU_GRID_H
#define SUDOKU_GRID_H

#include <array>
#include <cstdint>
#include "Unit.hpp"
#include "utils.hpp"

class SudokuGrid
{
public:
  // empty grid
  SudokuGrid();

  // 81 symbols: '1'..'9' givens, '0' or '.' empty, other characters skipped.
  // Returns 0 if fewer than 81 symbols were found, else 1.
  int importFromString(const char *values);

  // out81 must hold 82 chars ('.' = empty, NUL terminated)
  void exportToString(char *out81) const;

  // --- values API (flat index) ---
  Digit getValue(Index idx) const;

  bool isSolved(Index idx) const;

  // write-once: throws std::logic_error if the cell is already filled
  void setValue(Index idx, Digit digit);

  // --- values API (1-based coordinates) ---
  Digit get(int i, int j) const;

  void set(int i, int j, Digit digit);

  // --- candidates API (computed from the current values, never cached) ---
  Mask getCandidateMask(Index idx) const;

  Mask candidates(int i, int j) const;

  uint8_t countCandidates(Index idx) const;

  // --- units ---
  Unit row(int r);

  Unit column(int c);

  Unit box(int b);

  // row, column and box containing (i, j)
  std::array<Unit, 3> unitsCovering(int i, int j);

  // --- state ---
  int fillCount() const;

  bool isComplete() const;

  bool isValid() const;

  SudokuGrid clone() const;

  bool operator==(const SudokuGrid &other) const;

  bool operator!=(const SudokuGrid &other) const;

  // content order, used by SolutionSet
  bool operator<(const SudokuGrid &other) const;

private:
  Digit cells[81];

  Mask usedMask(Index idx) const;
};

#endif // SUDOKU_GRID_H
