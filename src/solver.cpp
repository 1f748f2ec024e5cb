// Sudoset Solver C API
// Enumerates every completion of a 9x9 Sudoku. Usable natively or from WASM.
//
// Exported functions:
//   int sudoset_solver_count(const char *in81);
//   int sudoset_solver_all(const char *in81, char *out, uint32_t maxSolutions);
//
// Input string:
//   in81[81]   : char      ('0' or '.' = empty, '1'..'9' = digit, other chars skipped)
//
// Output buffer (sudoset_solver_all):
//   out[81 * k + 1] : char   (k = min(count, maxSolutions) solutions of 81 digits each,
//                             in solution set order, NUL terminated)
//
// Return value:
//   number of solutions (0 = unsolvable), -1 on null pointers or unparseable input.
//   The count is always the full count, even when maxSolutions truncates the output.
//
// Notes:
//   - No state is kept between calls.
//   - Every returned solution is checked against the input; a failing check is a bug
//     and is logged.

#include <cstdint>
#include <cstddef>
#include <string>

#include "solver.hpp"
#include "Search.hpp"
#include "SudokuGrid.hpp"
#include "Validator.hpp"
#include "log.hpp"

// shared by all interface functions
static int solve_input(const char *in81, SolutionSet &solutions) {
  SudokuGrid puzzle;
  if (!puzzle.importFromString(in81)) {
    emscripten_log(EM_LOG_WARN, "sudoset: input has fewer than 81 cells");
    return -1;
  }

  solutions = solveAll(puzzle);

  for (const SudokuGrid &s : solutions) {
    std::string why;
    if (!isValidSolution(puzzle, s, &why)) {
      emscripten_log(EM_LOG_ERROR, "sudoset: bad solution: %s", why.c_str());
    }
  }
  return (int)solutions.size();
}

// =========================================================
// Public API
// =========================================================

extern "C"
{
  // Counts the solutions of the given Sudoku.
  EMSCRIPTEN_KEEPALIVE
  int sudoset_solver_count(const char *in81) {
    if (in81 == nullptr) {
      return -1;
    }

    SolutionSet solutions;
    return solve_input(in81, solutions);
  }

  // Solves the given Sudoku and exports up to maxSolutions solutions.
  EMSCRIPTEN_KEEPALIVE
  int sudoset_solver_all(const char *in81, char *out, uint32_t maxSolutions) {
    if (in81 == nullptr || out == nullptr) {
      return -1;
    }

    SolutionSet solutions;
    const int count = solve_input(in81, solutions);
    if (count < 0) {
      out[0] = '\0';
      return count;
    }

    // Export
    uint32_t k = 0;
    char buf[82];
    for (const SudokuGrid &s : solutions) {
      if (k == maxSolutions) {
        break;
      }
      s.exportToString(buf);
      for (int i = 0; i < 81; i++) {
        out[(size_t)k * 81 + i] = buf[i];
      }
      k++;
    }
    out[(size_t)k * 81] = '\0';

    return count;
  }
} // extern "C"
