#include "EventLog.hpp"

#include <algorithm>
#include <stdexcept>

// =========================================================
// Event log
// =========================================================

EventLog::EventLog() = default;

void EventLog::record(Index idx, Digit digit, ReasonId reason, uint8_t depth) {
  events.emplace_back(idx, digit, reason, depth);
}

const Event &EventLog::at(std::size_t i) const {
  if (i >= events.size()) {
    throw std::logic_error("EventLog::at() index out of range");
  }
  return events[i];
}

const std::vector<Event> &EventLog::getEvents() const {
  return events;
}

std::size_t EventLog::countByReason(ReasonId reason) const {
  return (std::size_t)std::count_if(events.begin(), events.end(),
                                    [reason](const Event &e) { return e.reason == reason; });
}

std::size_t EventLog::size() const noexcept {
  return events.size();
}

bool EventLog::empty() const noexcept {
  return events.empty();
}
