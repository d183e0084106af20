#pragma once

#include "loadsim/event_queue.h"
#include "loadsim/types.h"

#include <ostream>

namespace loadsim {

// Writes every dispatched event as one element of a JSON array.
// Output only; the run behaves the same with or without a writer.
class TraceWriter {
 public:
  explicit TraceWriter(std::ostream& out);
  ~TraceWriter();

  void Emit(const Event& ev, ServerId server, RequestOutcome outcome = RequestOutcome::Pending);

  std::uint64_t emitted() const { return emitted_; }

 private:
  std::ostream& out_;
  std::uint64_t emitted_ = 0;
};

}  // namespace loadsim
