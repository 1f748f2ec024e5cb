#ifndef SEARCH_H
#define SEARCH_H

#include <set>
#include "EventLog.hpp"
#include "Propagator.hpp"
#include "SudokuGrid.hpp"

// distinct complete grids, ordered by content
typedef std::set<SudokuGrid> SolutionSet;

// Picks the empty cell to guess on: the first cell with two candidates in
// row-major order, else the first cell with the fewest candidates.
// Contradiction if an empty cell has no candidate at all.
Status chooseBranchCell(const SudokuGrid &grid, Index &idx, Mask &cands);

// Propagates, then branches on a clone per candidate and recurses.
// grid is consumed (filled in place). On Ok, out receives every completion
// of this subtree; Contradiction means there is none.
Status dynamicSolve(SudokuGrid &grid, SolutionSet &out, EventLog *log = nullptr, uint8_t depth = 0);

// All completions of puzzle; empty if it has none.
SolutionSet solveAll(const SudokuGrid &puzzle, EventLog *log = nullptr);

#endif // SEARCH_H
