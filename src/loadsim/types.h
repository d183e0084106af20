#pragma once

#include <cstdint>
#include <limits>

namespace loadsim {

using RequestId = std::uint64_t;
using ServerId = std::uint32_t;

constexpr ServerId kNoServer = std::numeric_limits<ServerId>::max();
constexpr double kNever = std::numeric_limits<double>::infinity();

enum class RequestOutcome {
  Pending,
  Success,
  TimedOut,
  Error,
};

// Lifecycle of a request inside the server it was routed to.
enum class RequestState {
  Created,
  Queued,
  Active,
  Completed,
  TimedOut,
};

inline bool IsTerminal(RequestOutcome o) {
  return o != RequestOutcome::Pending;
}

inline const char* OutcomeName(RequestOutcome o) {
  switch (o) {
    case RequestOutcome::Pending: return "pending";
    case RequestOutcome::Success: return "success";
    case RequestOutcome::TimedOut: return "timed_out";
    case RequestOutcome::Error: return "error";
  }
  return "unknown";
}

struct Request {
  RequestId id = 0;
  double arrival_time = 0.0;
  ServerId server = kNoServer;

  double enqueue_time = 0.0;
  // Negative until the request takes a worker slot / finishes.
  double service_start_time = -1.0;
  double completion_time = -1.0;

  RequestState state = RequestState::Created;
  RequestOutcome outcome = RequestOutcome::Pending;

  // Planned at Active entry: network delay before processing, then processing itself (seconds).
  double network_latency = 0.0;
  double service_duration = 0.0;
  // Set when the sampled service time was negative and had to be clamped.
  bool clamped = false;

  bool started() const { return service_start_time >= 0.0; }
  double response_time() const { return completion_time - arrival_time; }
  double queue_wait() const {
    return (started() ? service_start_time : completion_time) - enqueue_time;
  }
};

}  // namespace loadsim
