#include "Event.hpp"

#include <sstream>

// =========================================================
// Events
// =========================================================

Event::Event(Index idx, Digit digit, ReasonId reason, uint8_t depth)
    : idx(idx), digit(digit), reason(reason), depth(depth) { }

std::string Event::describe() const {
  std::ostringstream oss;
  oss << "r" << (int)idxRow(idx) + 1 << "c" << (int)idxCol(idx) + 1
      << "=" << (int)digit
      << " (" << reasonName(reason) << ", depth " << (int)depth << ")";
  return oss.str();
}

const char *reasonName(ReasonId reason) {
  switch (reason) {
    case ReasonId::NakedSingle:
      return "naked single";
    case ReasonId::HiddenSingle:
      return "hidden single";
    case ReasonId::Branch:
      return "branch";
  }
  return "?";
}
