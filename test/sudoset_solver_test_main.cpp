#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "PuzzleIO.hpp"
#include "SudokuGrid.hpp"
#include "Validator.hpp"
#include "solver.hpp"

static inline bool isDigitChar(char c) {
  return c >= '0' && c <= '9';
}

static inline bool isValidSudokuChar(char c) {
  return (c == '.') || isDigitChar(c);
}

struct TestCase {
  std::string in81;
  int expectedCount = -1;   // -1 = not given
  std::string expected81;   // empty = not given
};

static bool parseCase(const std::string &line, TestCase *tc, std::string *err) {
  std::istringstream iss(line);
  std::string cells;
  iss >> cells;

  if (cells.size() != 81) {
    if (err) {
      std::ostringstream oss;
      oss << "Expected 81 chars, got " << cells.size();
      *err = oss.str();
    }
    return false;
  }

  for (char &c : cells) {
    if (!isValidSudokuChar(c)) {
      if (err) {
        *err = "Invalid character (allowed: 0-9 or .)";
      }
      return false;
    }
    if (c == '.') {
      c = '0';
    }
  }
  tc->in81 = cells;

  std::string count;
  if (iss >> count) {
    tc->expectedCount = std::atoi(count.c_str());
  }
  iss >> tc->expected81;
  return true;
}

static int runSolveOne(const TestCase &tc, std::vector<std::string> *out, std::string *why) {
  const int count = sudoset_solver_count(tc.in81.c_str());
  if (count < 0) {
    *why = "sudoset_solver_count returned -1 (failure)";
    return 0;
  }

  std::vector<char> buf((size_t)count * 81 + 1, '\0');
  const int again = sudoset_solver_all(tc.in81.c_str(), buf.data(), (uint32_t)count);
  if (again != count) {
    std::ostringstream oss;
    oss << "sudoset_solver_all returned " << again << ", count was " << count;
    *why = oss.str();
    return 0;
  }
  if (std::strlen(buf.data()) != (size_t)count * 81) {
    *why = "Output length != 81 * count";
    return 0;
  }

  out->clear();
  for (int k = 0; k < count; k++) {
    out->push_back(std::string(buf.data() + (size_t)k * 81, 81));
  }

  if (tc.expectedCount >= 0 && count != tc.expectedCount) {
    std::ostringstream oss;
    oss << "Expected " << tc.expectedCount << " solutions, got " << count;
    *why = oss.str();
    return 0;
  }

  SudokuGrid puzzle;
  puzzle.importFromString(tc.in81.c_str());

  std::set<std::string> distinct;
  for (const std::string &s : *out) {
    SudokuGrid solution;
    if (!solution.importFromString(s.c_str())) {
      *why = "Solution is not 81 cells";
      return 0;
    }

    std::string w;
    if (!isValidSolution(puzzle, solution, &w)) {
      *why = w;
      return 0;
    }

    // text round trip
    SudokuGrid reparsed;
    std::istringstream text(renderGrid(solution));
    if (!readPuzzle(text, reparsed, &w) || reparsed != solution) {
      *why = "Rendered solution does not parse back: " + w;
      return 0;
    }

    if (!distinct.insert(s).second) {
      *why = "Duplicate solution " + s;
      return 0;
    }
  }

  if (!tc.expected81.empty() && distinct.count(tc.expected81) == 0) {
    *why = "Expected solution not found: " + tc.expected81;
    return 0;
  }

  return 1;
}

static void usage(const char *argv0) {
  std::cerr
      << "Usage: " << argv0 << " <puzzle_file.txt>\n"
      << "  Each non-empty, non-comment line: 81 chars (0-9 or '.'), then optionally\n"
      << "  the expected number of solutions and one expected solution.\n";
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(argv[0]);
    return 2;
  }

  std::string path = argv[1];
  std::ifstream fin(path);
  if (!fin) {
    std::cerr << "Failed to open file: " << path << "\n";
    return 2;
  }

  size_t total = 0;
  size_t passed = 0;
  size_t failed = 0;

  std::string line;
  size_t lineNo = 0;

  while (std::getline(fin, line)) {
    lineNo++;

    std::string t = trim(line);
    if (t.empty() || t[0] == '#') {
      continue;
    }

    total++;

    TestCase tc;
    std::string why;
    std::vector<std::string> out;

    int ok = 0;
    if (parseCase(t, &tc, &why)) {
      ok = runSolveOne(tc, &out, &why);
    }

    std::cout << "[#" << total << " line " << lineNo << "] " << "\n"
              << "INPUT:  " << tc.in81 << "\n";
    for (const std::string &s : out) {
      std::cout << "OUTPUT: " << s << "\n";
    }
    if (ok) {
      passed++;
      std::cout << "RESULT: PASSED\n\n";
    } else {
      failed++;
      std::cout << "RESULT: FAILED (" << why << ")\n\n";
    }
  }

  std::cout << "SUMMARY: total=" << total << " passed=" << passed << " failed=" << failed << "\n";

  return failed == 0 ? 0 : 1;
}
