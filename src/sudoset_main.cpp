#include <iostream>
#include <stdexcept>
#include <string>

#include "EventLog.hpp"
#include "PuzzleIO.hpp"
#include "Search.hpp"
#include "Validator.hpp"
#include "log.hpp"

struct Options {
  std::string path;
  bool countOnly = false;
  bool check = false;
  bool trace = false;
};

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " <puzzle_file> [--count] [--check] [--trace]\n"
      << "  The file holds 9 non-empty lines of 9 cells: digits 1-9, or '0', '-' or ' ' for empty.\n"
      << "  --count  print only the number of solutions\n"
      << "  --check  verify every solution against the puzzle\n"
      << "  --trace  log every placement to stderr\n";
}

static int parseOptions(int argc, char **argv, Options &opts) {
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--count") {
      opts.countOnly = true;
    } else if (a == "--check") {
      opts.check = true;
    } else if (a == "--trace") {
      opts.trace = true;
    } else if (a.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << a << "\n";
      return 0;
    } else if (opts.path.empty()) {
      opts.path = a;
    } else {
      std::cerr << "Only one puzzle file expected\n";
      return 0;
    }
  }
  return opts.path.empty() ? 0 : 1;
}

static int run(const Options &opts) {
  SudokuGrid puzzle;
  std::string err;
  if (!readPuzzleFile(opts.path, puzzle, &err)) {
    emscripten_log(EM_LOG_ERROR, "%s", err.c_str());
    return 2;
  }

  EventLog log;
  const SolutionSet solutions = solveAll(puzzle, opts.trace ? &log : nullptr);

  if (opts.trace) {
    for (const Event &ev : log.getEvents()) {
      emscripten_log(EM_LOG_CONSOLE, "%s", ev.describe().c_str());
    }
    emscripten_log(EM_LOG_CONSOLE, "naked=%zu hidden=%zu branch=%zu solutions=%zu",
                   log.countByReason(ReasonId::NakedSingle),
                   log.countByReason(ReasonId::HiddenSingle),
                   log.countByReason(ReasonId::Branch),
                   solutions.size());
  }

  if (opts.check) {
    for (const SudokuGrid &s : solutions) {
      std::string why;
      if (!isValidSolution(puzzle, s, &why)) {
        emscripten_log(EM_LOG_ERROR, "Invalid solution: %s", why.c_str());
        return 3;
      }
    }
  }

  if (opts.countOnly) {
    std::cout << solutions.size() << "\n";
  } else {
    writeSolutions(std::cout, solutions);
  }
  return 0;
}

int main(int argc, char **argv) {
  Options opts;
  if (!parseOptions(argc, argv, opts)) {
    usage(argv[0]);
    return 2;
  }

  try {
    return run(opts);
  } catch (const std::logic_error &e) {
    emscripten_log(EM_LOG_ERROR, "internal error: %s", e.what());
    return 3;
  }
}
