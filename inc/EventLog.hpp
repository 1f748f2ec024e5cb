#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <vector>
#include "Event.hpp"

// Append-only trace of placements, in the order they were made.
class EventLog
{
public:
  EventLog();

  void record(Index idx, Digit digit, ReasonId reason, uint8_t depth);

  const Event &at(std::size_t i) const;

  const std::vector<Event> &getEvents() const;

  std::size_t countByReason(ReasonId reason) const;

  std::size_t size() const noexcept;

  bool empty() const noexcept;

private:
  std::vector<Event> events;
};

#endif // EVENT_LOG_H
