#include "Propagator.hpp"
#include "utils.hpp"

// =========================================================
// Propagation (naked singles + hidden singles)
// =========================================================

static void logPlacement(EventLog *log, const Unit &unit, int local, Digit digit, ReasonId reason, uint8_t depth) {
  if (log != nullptr) {
    log->record(unit.cellAt(local), digit, reason, depth);
  }
}

Status fillUnit(Unit &unit, int &filled, EventLog *log, uint8_t depth) {
  const SudokuGrid &grid = unit.getGrid();

  filled = 0;
  Mask seen = 0;
  // candidates of the cells left open by the forward pass, 0 = not deferred
  Mask deferred[9] = {0};

  // 1) forward pass: record givens, place naked singles, defer the rest
  for (int k = 1; k <= 9; k++) {
    const Digit v = unit.get(k);
    if (v != 0) {
      seen |= digitToBit(v);
      continue;
    }

    const Mask cands = grid.getCandidateMask(unit.cellAt(k));
    if (cands == 0) {
      return Status::Contradiction;
    }
    if (countBits9(cands) > 1) {
      deferred[k - 1] = cands;
      continue;
    }

    const Digit d = bitToDigitSingle(cands);
    unit.set(k, d);
    seen |= digitToBit(d);
    filled++;
    logPlacement(log, unit, k, d, ReasonId::NakedSingle, depth);
  }

  // 2) every missing digit needs a home among the deferred cells.
  // The candidate sets are the ones captured above, not recomputed.
  for (Digit d = 1; d <= 9; d++) {
    const Mask bit = digitToBit(d);
    if ((seen & bit) != 0) {
      continue;
    }

    int foundK = -1;
    for (int k = 1; k <= 9; k++) {
      if ((deferred[k - 1] & bit) == 0) {
        continue;
      }
      if (foundK != -1) {
        foundK = -2; // multiple places
        break;
      }
      foundK = k;
    }

    if (foundK == -1) {
      return Status::Contradiction;
    }
    if (foundK == -2) {
      continue;
    }

    // the only home was taken by another hidden single of this pass
    if (unit.get(foundK) != 0) {
      return Status::Contradiction;
    }

    unit.set(foundK, d);
    filled++;
    logPlacement(log, unit, foundK, d, ReasonId::HiddenSingle, depth);
  }

  return Status::Ok;
}

static constexpr UnitKind PASS_ORDER[] = {
  UnitKind::Row,
  UnitKind::Column,
  UnitKind::Box
};

Status simpleFill(SudokuGrid &grid, int &filled, EventLog *log, uint8_t depth) {
  filled = 0;

  while (true) {
    int round = 0;
    for (UnitKind kind : PASS_ORDER) {
      for (uint8_t u = 1; u <= 9; u++) {
        Unit unit(grid, kind, u);
        int n = 0;
        if (fillUnit(unit, n, log, depth) == Status::Contradiction) {
          return Status::Contradiction;
        }
        round += n;
      }
    }

    if (round == 0) {
      return Status::Ok;
    }
    filled += round;
  }
}
