#include "Unit.hpp"
#include "SudokuGrid.hpp"

#include <stdexcept>

// =========================================================
// Unit
// =========================================================

Unit::Unit(SudokuGrid &grid, UnitKind kind, uint8_t index)
    : grid(&grid), unitKind(kind), unitIndex(index) {
  if (index < 1 || index > 9) {
    throw std::out_of_range("Unit index must be in 1..9");
  }
}

SudokuGrid &Unit::getGrid() const {
  return *grid;
}

UnitKind Unit::kind() const {
  return unitKind;
}

uint8_t Unit::index() const {
  return unitIndex;
}

Index Unit::cellOf(UnitKind kind, uint8_t index, int local) {
  if (index < 1 || index > 9 || local < 1 || local > 9) {
    throw std::out_of_range("Unit::cellOf() index out of 1..9");
  }

  switch (kind) {
    case UnitKind::Row:
      return ROW_CELLS[index - 1][local - 1];
    case UnitKind::Column:
      return COL_CELLS[index - 1][local - 1];
    case UnitKind::Box:
      return BOX_CELLS[index - 1][local - 1];
  }
  throw std::logic_error("Unit::cellOf() unknown unit kind");
}

Index Unit::cellAt(int local) const {
  return cellOf(unitKind, unitIndex, local);
}

void Unit::coordsAt(int local, int &i, int &j) const {
  const Index idx = cellAt(local);
  i = idxRow(idx) + 1;
  j = idxCol(idx) + 1;
}

Digit Unit::get(int local) const {
  return grid->getValue(cellAt(local));
}

void Unit::set(int local, Digit digit) {
  grid->setValue(cellAt(local), digit);
}

std::array<Digit, 9> Unit::values() const {
  std::array<Digit, 9> out;
  for (int k = 1; k <= 9; k++) {
    out[k - 1] = get(k);
  }
  return out;
}

bool Unit::isValid() const {
  return isValid(*grid, unitKind, unitIndex);
}

bool Unit::isValid(const SudokuGrid &grid, UnitKind kind, uint8_t index) {
  Mask seen = 0;
  for (int k = 1; k <= 9; k++) {
    const Digit v = grid.getValue(cellOf(kind, index, k));
    if (v == 0) {
      continue;
    }
    const Mask bit = digitToBit(v);
    if ((seen & bit) != 0) {
      return false;
    }
    seen = (Mask)(seen | bit);
  }
  return true;
}

const char *unitKindName(UnitKind kind) {
  switch (kind) {
    case UnitKind::Row:
      return "Row";
    case UnitKind::Column:
      return "Col";
    case UnitKind::Box:
      return "Box";
  }
  return "?";
}
