#ifndef UTILS_H
#define UTILS_H

#include <cstdint>

typedef int Index;       // flat cell index 0..80, row-major
typedef uint8_t Digit;   // 0 = empty, 1..9 = value
typedef uint16_t Mask;   // bit (d-1) set <=> digit d

static constexpr int CELL_COUNT = 81;
static constexpr Mask ALL_DIGITS = 0x01FF;

// =========================================================
// Precomputed indices (rows / cols / boxes)
// =========================================================

static constexpr Index ROW_CELLS[9][9] = {
    { 0, 1, 2, 3, 4, 5, 6, 7, 8 },
    { 9, 10, 11, 12, 13, 14, 15, 16, 17 },
    { 18, 19, 20, 21, 22, 23, 24, 25, 26 },
    { 27, 28, 29, 30, 31, 32, 33, 34, 35 },
    { 36, 37, 38, 39, 40, 41, 42, 43, 44 },
    { 45, 46, 47, 48, 49, 50, 51, 52, 53 },
    { 54, 55, 56, 57, 58, 59, 60, 61, 62 },
    { 63, 64, 65, 66, 67, 68, 69, 70, 71 },
    { 72, 73, 74, 75, 76, 77, 78, 79, 80 }
  };

static constexpr Index COL_CELLS[9][9] = {
    { 0, 9, 18, 27, 36, 45, 54, 63, 72 },
    { 1, 10, 19, 28, 37, 46, 55, 64, 73 },
    { 2, 11, 20, 29, 38, 47, 56, 65, 74 },
    { 3, 12, 21, 30, 39, 48, 57, 66, 75 },
    { 4, 13, 22, 31, 40, 49, 58, 67, 76 },
    { 5, 14, 23, 32, 41, 50, 59, 68, 77 },
    { 6, 15, 24, 33, 42, 51, 60, 69, 78 },
    { 7, 16, 25, 34, 43, 52, 61, 70, 79 },
    { 8, 17, 26, 35, 44, 53, 62, 71, 80 }
  };

// box b (0-based) covers rows 3*(b/3).. and cols 3*(b%3).., read row by row
static constexpr Index BOX_CELLS[9][9] = {
    { 0, 1, 2, 9, 10, 11, 18, 19, 20 },
    { 3, 4, 5, 12, 13, 14, 21, 22, 23 },
    { 6, 7, 8, 15, 16, 17, 24, 25, 26 },
    { 27, 28, 29, 36, 37, 38, 45, 46, 47 },
    { 30, 31, 32, 39, 40, 41, 48, 49, 50 },
    { 33, 34, 35, 42, 43, 44, 51, 52, 53 },
    { 54, 55, 56, 63, 64, 65, 72, 73, 74 },
    { 57, 58, 59, 66, 67, 68, 75, 76, 77 },
    { 60, 61, 62, 69, 70, 71, 78, 79, 80 }
  };

inline uint8_t idxRow(Index idx) {
  return (uint8_t)(idx / 9);
}

inline uint8_t idxCol(Index idx) {
  return (uint8_t)(idx % 9);
}

inline uint8_t idxBox(Index idx) {
  const uint8_t r = idxRow(idx);
  const uint8_t c = idxCol(idx);
  return (uint8_t)((r / 3) * 3 + (c / 3));
}

// (i, j) are 1-based grid coordinates
inline Index coordToIdx(int i, int j) {
  return (Index)((i - 1) * 9 + (j - 1));
}

inline bool isValidIndex(Index idx) {
  return idx >= 0 && idx < CELL_COUNT;
}

inline bool isValidCoord(int i, int j) {
  return i >= 1 && i <= 9 && j >= 1 && j <= 9;
}

// =========================================================
// Helpers (bitmasks)
// =========================================================

inline Mask digitToBit(Digit d) {
  // d: 1..9 -> bit (d-1)
  return (Mask)(1u << (d - 1u));
}

inline uint8_t countBits9(Mask mask) {
  return (uint8_t)__builtin_popcount((unsigned)(mask & ALL_DIGITS));
}

inline Digit bitToDigitSingle(Mask mask) {
  // assumes exactly one bit set (1..9)
  return (Digit)(__builtin_ctz((unsigned)mask) + 1u);
}

#endif // UTILS_H
