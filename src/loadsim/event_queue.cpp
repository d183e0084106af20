#include "loadsim/event_queue.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace loadsim {

const char* EventKindName(EventKind k) {
  switch (k) {
    case EventKind::Arrival: return "Arrival";
    case EventKind::ServiceStart: return "ServiceStart";
    case EventKind::Timeout: return "Timeout";
    case EventKind::ServiceComplete: return "ServiceComplete";
    case EventKind::Sample: return "Sample";
  }
  return "Unknown";
}

void EventQueue::Schedule(double time, EventKind kind, RequestId request_id) {
  if (std::isnan(time) || time < now_) {
    throw std::logic_error(std::string("EventQueue: ") + EventKindName(kind) +
                           " scheduled at t=" + std::to_string(time) +
                           " before current time t=" + std::to_string(now_));
  }
  heap_.push(Event{time, kind, request_id, next_seq_++});
}

std::size_t EventQueue::Run(double until, const Handler& handler) {
  std::size_t count = 0;
  while (!heap_.empty() && heap_.top().time <= until) {
    const Event ev = heap_.top();
    heap_.pop();
    if (ev.time < now_) {
      throw std::logic_error("EventQueue: non-monotonic dispatch");
    }
    now_ = ev.time;
    ++dispatched_;
    ++count;
    handler(ev);
  }
  return count;
}

}  // namespace loadsim
