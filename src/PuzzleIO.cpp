#include "PuzzleIO.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>

static inline bool isSpaceChar(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

static inline bool isEmptyCellChar(char c) {
  return c == '0' || c == '-' || c == ' ';
}

std::string trim(const std::string &s) {
  size_t a = 0;
  while (a < s.size() && isSpaceChar(s[a])) {
    a++;
  }
  size_t b = s.size();
  while (b > a && isSpaceChar(s[b - 1])) {
    b--;
  }
  return s.substr(a, b - a);
}

int parseRow(const std::string &line, Digit row[9]) {
  int n = 0;
  for (char c : line) {
    Digit v;
    if (c >= '1' && c <= '9') {
      v = (Digit)(c - '0');
    } else if (isEmptyCellChar(c)) {
      v = 0;
    } else {
      continue;
    }

    if (n == 9) {
      return 0; // too many cells
    }
    row[n++] = v;
  }
  return n == 9 ? 1 : 0;
}

int parsePuzzleLines(const std::vector<std::string> &lines, SudokuGrid &grid, std::string *err) {
  std::vector<std::string> rows;
  for (const std::string &line : lines) {
    std::string t = trim(line);
    if (!t.empty()) {
      rows.push_back(t);
    }
  }

  Digit values[9][9];
  for (size_t n = 0; n < rows.size(); n++) {
    Digit row[9];
    if (!parseRow(rows[n], row)) {
      if (err) {
        std::ostringstream oss;
        oss << "Could not interpret line " << (n + 1) << ": " << rows[n];
        *err = oss.str();
      }
      return 0;
    }
    if (n < 9) {
      std::copy(row, row + 9, values[n]);
    }
  }

  if (rows.size() != 9) {
    if (err) {
      std::ostringstream oss;
      oss << "Found " << rows.size() << " rows, expected 9";
      *err = oss.str();
    }
    return 0;
  }

  SudokuGrid parsed;
  for (int i = 1; i <= 9; i++) {
    for (int j = 1; j <= 9; j++) {
      const Digit v = values[i - 1][j - 1];
      if (v != 0) {
        parsed.set(i, j, v);
      }
    }
  }
  grid = parsed;
  return 1;
}

int readPuzzle(std::istream &in, SudokuGrid &grid, std::string *err) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return parsePuzzleLines(lines, grid, err);
}

int readPuzzleFile(const std::string &path, SudokuGrid &grid, std::string *err) {
  std::ifstream fin(path);
  if (!fin) {
    if (err) {
      *err = "Failed to open file: " + path;
    }
    return 0;
  }
  return readPuzzle(fin, grid, err);
}

std::string renderGrid(const SudokuGrid &grid) {
  std::string out;
  out.reserve(90);
  for (int i = 1; i <= 9; i++) {
    if (i > 1) {
      out.push_back('\n');
    }
    for (int j = 1; j <= 9; j++) {
      const Digit v = grid.get(i, j);
      out.push_back(v ? (char)('0' + v) : ' ');
    }
  }
  return out;
}

void writeSolutions(std::ostream &out, const SolutionSet &solutions) {
  bool first = true;
  for (const SudokuGrid &s : solutions) {
    if (!first) {
      out << std::string(9, '-') << "\n";
    }
    out << renderGrid(s) << "\n";
    first = false;
  }
}
