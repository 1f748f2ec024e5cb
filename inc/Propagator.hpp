#ifndef PROPAGATOR_H
#define PROPAGATOR_H

#include <cstdint>
#include "EventLog.hpp"
#include "SudokuGrid.hpp"
#include "Unit.hpp"

enum class Status : uint8_t {
  Ok = 0,
  // some cell or digit has no legal placement left
  Contradiction = 1
};

// Places the naked and hidden singles of one unit into its grid.
// filled receives the number of placements made by this call.
Status fillUnit(Unit &unit, int &filled, EventLog *log = nullptr, uint8_t depth = 0);

// Runs fillUnit over rows, columns and boxes until a full round places nothing.
// filled receives the total number of placements.
Status simpleFill(SudokuGrid &grid, int &filled, EventLog *log = nullptr, uint8_t depth = 0);

#endif // PROPAGATOR_H
