#include "Validator.hpp"
#include "SudokuGrid.hpp"
#include "Unit.hpp"
#include "utils.hpp"

#include <sstream>
#include <stdexcept>

// =========================================================
// Validation
// =========================================================

static void checkShape(const SudokuGrid &grid) {
  for (Index idx = 0; idx < CELL_COUNT; idx++) {
    if (grid.getValue(idx) > 9) {
      std::ostringstream oss;
      oss << "Grid value out of range at idx=" << idx;
      throw std::logic_error(oss.str());
    }
  }
}

static bool checkUnit(const SudokuGrid &grid, UnitKind kind, uint8_t u, std::string *why) {
  if (Unit::isValid(grid, kind, u)) {
    return true;
  }

  if (why) {
    // find the repeated digit for the message
    Mask seen = 0;
    Digit dup = 0;
    for (int k = 1; k <= 9 && dup == 0; k++) {
      const Digit v = grid.getValue(Unit::cellOf(kind, u, k));
      if (v == 0) {
        continue;
      }
      if ((seen & digitToBit(v)) != 0) {
        dup = v;
      }
      seen = (Mask)(seen | digitToBit(v));
    }

    std::ostringstream oss;
    oss << unitKindName(kind) << " " << (int)u << " invalid: duplicate digit " << (int)dup;
    *why = oss.str();
  }
  return false;
}

bool isValidGrid(const SudokuGrid &grid, std::string *why) {
  checkShape(grid);

  static constexpr UnitKind KINDS[] = { UnitKind::Row, UnitKind::Column, UnitKind::Box };
  for (UnitKind kind : KINDS) {
    for (uint8_t u = 1; u <= 9; u++) {
      if (!checkUnit(grid, kind, u, why)) {
        return false;
      }
    }
  }
  return true;
}

bool isValidSolution(const SudokuGrid &puzzle, const SudokuGrid &solution, std::string *why) {
  if (!solution.isComplete()) {
    if (why) {
      std::ostringstream oss;
      oss << "Solution has " << (CELL_COUNT - solution.fillCount()) << " empty cells";
      *why = oss.str();
    }
    return false;
  }

  // Check givens are preserved
  for (Index i = 0; i < CELL_COUNT; i++) {
    const Digit in = puzzle.getValue(i);
    const Digit out = solution.getValue(i);
    if (in != 0 && in != out) {
      if (why) {
        std::ostringstream oss;
        oss << "Given mismatch at idx=" << i << " (in=" << (int)in << ", out=" << (int)out << ")";
        *why = oss.str();
      }
      return false;
    }
  }

  return isValidGrid(solution, why);
}
