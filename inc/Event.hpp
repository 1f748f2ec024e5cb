#ifndef EVENT_H
#define EVENT_H

#include <cstdint>
#include <string>
#include "utils.hpp"

enum class ReasonId : uint8_t {
  NakedSingle = 0,
  HiddenSingle = 1,
  Branch = 2
};

// one placement made while solving
class Event
{
public:
  Event(Index idx, Digit digit, ReasonId reason, uint8_t depth);

  Index idx;
  Digit digit;
  ReasonId reason;
  // search depth of the node that made the placement (0 = root)
  uint8_t depth;

  // e.g. "r3c5=7 (hidden single, depth 2)"
  std::string describe() const;
};

const char *reasonName(ReasonId reason);

#endif // EVENT_H
