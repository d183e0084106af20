#include "loadsim/trace.h"

namespace loadsim {

TraceWriter::TraceWriter(std::ostream& out) : out_(out) {
  out_ << "[\n";
}

TraceWriter::~TraceWriter() {
  out_ << "\n]\n";
}

void TraceWriter::Emit(const Event& ev, ServerId server, RequestOutcome outcome) {
  if (emitted_ > 0) out_ << ",\n";
  ++emitted_;
  out_ << "  {\"ev\":\"" << EventKindName(ev.kind) << "\",\"t\":" << ev.time;
  if (ev.kind != EventKind::Sample) out_ << ",\"req\":" << ev.request_id;
  if (server != kNoServer) out_ << ",\"server\":" << server;
  if (outcome != RequestOutcome::Pending) out_ << ",\"outcome\":\"" << OutcomeName(outcome) << "\"";
  out_ << "}";
}

}  // namespace loadsim
