#include "SudokuGrid.hpp"
#include "Validator.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

// =========================================================
// SudokuGrid
// =========================================================

SudokuGrid::SudokuGrid() {
  std::memset(cells, 0, sizeof(cells));
}

int SudokuGrid::importFromString(const char *values) {
  if (values == nullptr) {
    return 0;
  }

  std::memset(cells, 0, sizeof(cells));

  // parse: digits 1..9 are values; 0 or '.' are empty; ignore others
  int tokens = 0;
  for (int i = 0; values[i] != '\0' && tokens < CELL_COUNT; i++) {
    const char ch = values[i];
    if (ch >= '1' && ch <= '9') {
      cells[tokens++] = (Digit)(ch - '0');
    } else if (ch == '0' || ch == '.') {
      cells[tokens++] = 0;
    }
  }

  if (tokens < CELL_COUNT) {
    return 0;
  }
  return 1;
}

void SudokuGrid::exportToString(char *out81) const {
  for (Index i = 0; i < CELL_COUNT; i++) {
    out81[i] = cells[i] ? (char)('0' + cells[i]) : '.';
  }
  out81[CELL_COUNT] = '\0';
}

// --- values API ---
Digit SudokuGrid::getValue(Index idx) const {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("SudokuGrid::getValue() index out of range");
  }
  return cells[idx];
}

bool SudokuGrid::isSolved(Index idx) const {
  return getValue(idx) != 0;
}

void SudokuGrid::setValue(Index idx, Digit digit) {
  if (!isValidIndex(idx)) {
    throw std::out_of_range("SudokuGrid::setValue() index out of range");
  }
  if (digit < 1 || digit > 9) {
    throw std::logic_error("SudokuGrid::setValue() digit out of 1..9");
  }
  if (cells[idx] != 0) {
    throw std::logic_error("SudokuGrid::setValue() on a filled cell");
  }
  cells[idx] = digit;
}

Digit SudokuGrid::get(int i, int j) const {
  if (!isValidCoord(i, j)) {
    throw std::out_of_range("SudokuGrid::get() coordinates out of 1..9");
  }
  return cells[coordToIdx(i, j)];
}

void SudokuGrid::set(int i, int j, Digit digit) {
  if (!isValidCoord(i, j)) {
    throw std::out_of_range("SudokuGrid::set() coordinates out of 1..9");
  }
  setValue(coordToIdx(i, j), digit);
}

// --- candidates API ---
Mask SudokuGrid::usedMask(Index idx) const {
  const int r = idxRow(idx);
  const int c = idxCol(idx);
  const int b = idxBox(idx);

  Mask used = 0;
  for (int k = 0; k < 9; k++) {
    const Digit vr = cells[ROW_CELLS[r][k]];
    const Digit vc = cells[COL_CELLS[c][k]];
    const Digit vb = cells[BOX_CELLS[b][k]];
    if (vr) {
      used |= digitToBit(vr);
    }
    if (vc) {
      used |= digitToBit(vc);
    }
    if (vb) {
      used |= digitToBit(vb);
    }
  }
  return used;
}

Mask SudokuGrid::getCandidateMask(Index idx) const {
  if (isSolved(idx)) {
    return 0;
  }
  return (Mask)(ALL_DIGITS & ~usedMask(idx));
}

Mask SudokuGrid::candidates(int i, int j) const {
  if (!isValidCoord(i, j)) {
    throw std::out_of_range("SudokuGrid::candidates() coordinates out of 1..9");
  }
  return getCandidateMask(coordToIdx(i, j));
}

uint8_t SudokuGrid::countCandidates(Index idx) const {
  return countBits9(getCandidateMask(idx));
}

// --- units ---
Unit SudokuGrid::row(int r) {
  return Unit(*this, UnitKind::Row, (uint8_t)r);
}

Unit SudokuGrid::column(int c) {
  return Unit(*this, UnitKind::Column, (uint8_t)c);
}

Unit SudokuGrid::box(int b) {
  return Unit(*this, UnitKind::Box, (uint8_t)b);
}

std::array<Unit, 3> SudokuGrid::unitsCovering(int i, int j) {
  if (!isValidCoord(i, j)) {
    throw std::out_of_range("SudokuGrid::unitsCovering() coordinates out of 1..9");
  }
  const int b = ((i - 1) / 3) * 3 + ((j - 1) / 3) + 1;
  return {{ row(i), column(j), box(b) }};
}

// --- state ---
int SudokuGrid::fillCount() const {
  return (int)std::count_if(cells, cells + CELL_COUNT, [](Digit v) { return v != 0; });
}

bool SudokuGrid::isComplete() const {
  return fillCount() == CELL_COUNT;
}

bool SudokuGrid::isValid() const {
  return isValidGrid(*this);
}

SudokuGrid SudokuGrid::clone() const {
  return *this;
}

bool SudokuGrid::operator==(const SudokuGrid &other) const {
  return std::equal(cells, cells + CELL_COUNT, other.cells);
}

bool SudokuGrid::operator!=(const SudokuGrid &other) const {
  return !(*this == other);
}

bool SudokuGrid::operator<(const SudokuGrid &other) const {
  return std::lexicographical_compare(cells, cells + CELL_COUNT,
                                      other.cells, other.cells + CELL_COUNT);
}
