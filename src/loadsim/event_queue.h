#pragma once

#include "loadsim/types.h"

#include <cstdint>
#include <functional>
#include <queue>
#include <vector>

namespace loadsim {

// Declaration order is the tie-break priority for events at the same timestamp.
enum class EventKind {
  Arrival,
  ServiceStart,
  Timeout,
  ServiceComplete,
  Sample,
};

const char* EventKindName(EventKind k);

struct Event {
  double time = 0.0;
  EventKind kind = EventKind::Arrival;
  RequestId request_id = 0;  // unused for Sample
  std::uint64_t seq = 0;     // insertion order, last tie-break
};

struct EventLater {
  bool operator()(const Event& a, const Event& b) const {
    if (a.time != b.time) return a.time > b.time;
    if (a.kind != b.kind) return static_cast<int>(a.kind) > static_cast<int>(b.kind);
    return a.seq > b.seq;
  }
};

// Simulation clock plus the time-ordered event queue it owns.
// Time only moves forward: dispatch order is (time, kind, seq).
class EventQueue {
 public:
  using Handler = std::function<void(const Event&)>;

  double Now() const { return now_; }
  bool Empty() const { return heap_.empty(); }
  std::size_t Size() const { return heap_.size(); }
  double NextTime() const { return heap_.empty() ? kNever : heap_.top().time; }
  std::uint64_t dispatched() const { return dispatched_; }

  // Throws std::logic_error when time is earlier than Now().
  void Schedule(double time, EventKind kind, RequestId request_id = 0);

  // Dispatches events in order until the queue is empty or the next event is later than until.
  // Later events stay queued. Returns the number of events dispatched.
  std::size_t Run(double until, const Handler& handler);

 private:
  std::priority_queue<Event, std::vector<Event>, EventLater> heap_;
  double now_ = 0.0;
  std::uint64_t next_seq_ = 0;
  std::uint64_t dispatched_ = 0;
};

}  // namespace loadsim
