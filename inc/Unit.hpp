#ifndef UNIT_H
#define UNIT_H

#include <array>
#include <cstdint>
#include "utils.hpp"

class SudokuGrid;

enum class UnitKind : uint8_t {
  Row = 0,
  Column = 1,
  Box = 2
};

// A row, column or box of a SudokuGrid. The unit owns no cells, it only maps
// its local indices 1..9 onto grid coordinates.
class Unit
{
public:
  Unit(SudokuGrid &grid, UnitKind kind, uint8_t index);

  SudokuGrid &getGrid() const;

  UnitKind kind() const;

  // 1..9
  uint8_t index() const;

  // --- mapping (pure) ---
  static Index cellOf(UnitKind kind, uint8_t index, int local);

  Index cellAt(int local) const;

  void coordsAt(int local, int &i, int &j) const;

  // --- values ---
  Digit get(int local) const;

  void set(int local, Digit digit);

  std::array<Digit, 9> values() const;

  // no non-zero digit repeats among the 9 values
  bool isValid() const;

  static bool isValid(const SudokuGrid &grid, UnitKind kind, uint8_t index);

private:
  SudokuGrid *grid;
  UnitKind unitKind;
  uint8_t unitIndex;
};

const char *unitKindName(UnitKind kind);

#endif // UNIT_H
