#include "Search.hpp"
#include "utils.hpp"

#include <stdexcept>

// =========================================================
// Backtracking search
// =========================================================

Status chooseBranchCell(const SudokuGrid &grid, Index &idx, Mask &cands) {
  Index bestIdx = -1;
  Mask bestMask = 0;
  uint8_t bestCount = 10;

  for (Index i = 0; i < CELL_COUNT; i++) {
    if (grid.isSolved(i)) {
      continue;
    }

    const Mask m = grid.getCandidateMask(i);
    const uint8_t n = countBits9(m);
    if (n == 0) {
      return Status::Contradiction;
    }
    if (n == 2) {
      // good enough, stop scanning
      bestIdx = i;
      bestMask = m;
      break;
    }
    if (n < bestCount) {
      bestIdx = i;
      bestMask = m;
      bestCount = n;
    }
  }

  if (bestIdx < 0) {
    throw std::logic_error("chooseBranchCell() on a complete grid");
  }

  idx = bestIdx;
  cands = bestMask;
  return Status::Ok;
}

Status dynamicSolve(SudokuGrid &grid, SolutionSet &out, EventLog *log, uint8_t depth) {
  int filled = 0;
  if (simpleFill(grid, filled, log, depth) == Status::Contradiction) {
    return Status::Contradiction;
  }
  if (!grid.isValid()) {
    return Status::Contradiction;
  }
  if (grid.isComplete()) {
    out.insert(grid);
    return Status::Ok;
  }

  Index idx = -1;
  Mask cands = 0;
  if (chooseBranchCell(grid, idx, cands) == Status::Contradiction) {
    return Status::Contradiction;
  }

  SolutionSet found;
  for (Digit d = 1; d <= 9; d++) {
    if ((cands & digitToBit(d)) == 0) {
      continue;
    }

    SudokuGrid branch = grid.clone();
    branch.setValue(idx, d);
    if (log != nullptr) {
      log->record(idx, d, ReasonId::Branch, (uint8_t)(depth + 1));
    }

    SolutionSet sub;
    if (dynamicSolve(branch, sub, log, (uint8_t)(depth + 1)) == Status::Contradiction) {
      // dead end, try the next digit
      continue;
    }
    found.insert(sub.begin(), sub.end());
  }

  if (found.empty()) {
    return Status::Contradiction;
  }
  out.insert(found.begin(), found.end());
  return Status::Ok;
}

SolutionSet solveAll(const SudokuGrid &puzzle, EventLog *log) {
  SudokuGrid grid = puzzle.clone();
  SolutionSet solutions;
  if (dynamicSolve(grid, solutions, log) == Status::Contradiction) {
    return SolutionSet();
  }
  return solutions;
}
