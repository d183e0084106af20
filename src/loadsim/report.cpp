#include "loadsim/report.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace loadsim {

namespace {

using Row = std::vector<std::string>;

std::string Num(double v) {
  std::ostringstream os;
  os.precision(std::numeric_limits<double>::max_digits10);
  os << v;
  return os.str();
}

std::string Num(std::uint64_t v) { return std::to_string(v); }
std::string Num(int v) { return std::to_string(v); }

// RFC 4180: fields holding a separator, quote or line break are quoted, inner quotes doubled.
std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void WriteCsvRow(std::ostream& out, const Row& row) {
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i > 0) out << ",";
    out << CsvField(row[i]);
  }
  out << "\n";
}

void WriteCsv(std::ostream& out, const Row& headers, const std::vector<Row>& rows) {
  WriteCsvRow(out, headers);
  for (const auto& row : rows) WriteCsvRow(out, row);
}

std::string JsonString(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

// JSON has no inf/nan.
std::string JsonNum(double v) { return std::isfinite(v) ? Num(v) : "null"; }

// Streams the members of one JSON object; Key() writes the separator and the quoted key.
class JsonObject {
 public:
  explicit JsonObject(std::ostream& out) : out_(out) { out_ << "{"; }
  ~JsonObject() { out_ << "}"; }
  JsonObject(const JsonObject&) = delete;
  JsonObject& operator=(const JsonObject&) = delete;

  std::ostream& Key(const char* key) {
    if (!first_) out_ << ",";
    first_ = false;
    return out_ << "\"" << key << "\":";
  }
  void Put(const char* key, double v) { Key(key) << JsonNum(v); }
  void Put(const char* key, std::uint64_t v) { Key(key) << v; }
  void Put(const char* key, int v) { Key(key) << v; }
  void Put(const char* key, const std::string& v) { Key(key) << JsonString(v); }

 private:
  std::ostream& out_;
  bool first_ = true;
};

void PutCounts(JsonObject& obj, const char* key, const OutcomeCounts& c) {
  std::ostream& out = obj.Key(key);
  JsonObject counts(out);
  counts.Put("total", c.total);
  counts.Put("success", c.success);
  counts.Put("timed_out", c.timed_out);
  counts.Put("error", c.error);
}

void PutPercentiles(JsonObject& obj, const char* key, const Percentiles& p) {
  std::ostream& out = obj.Key(key);
  JsonObject pct(out);
  pct.Put("p50", p.p50);
  pct.Put("p95", p.p95);
  pct.Put("p99", p.p99);
  pct.Put("p999", p.p999);
}

void PutSnapshotMembers(JsonObject& obj, const MetricsSnapshot& m) {
  obj.Put("scenario", m.scenario);
  obj.Put("duration_s", m.duration);
  PutCounts(obj, "requests", m.counts);
  obj.Put("truncated_requests", m.truncated_requests);
  obj.Put("success_rate", m.success_rate);
  obj.Put("avg_response_ms", m.avg_response_ms);
  obj.Put("min_response_ms", m.min_response_ms);
  obj.Put("max_response_ms", m.max_response_ms);
  obj.Put("stddev_response_ms", m.response_stddev_ms);
  PutPercentiles(obj, "response_percentiles_ms", m.response_percentiles_ms);
  obj.Put("avg_queue_wait_ms", m.avg_queue_wait_ms);
  obj.Put("min_queue_wait_ms", m.min_queue_wait_ms);
  obj.Put("max_queue_wait_ms", m.max_queue_wait_ms);
  PutPercentiles(obj, "queue_wait_percentiles_ms", m.queue_wait_percentiles_ms);
  obj.Put("successful_throughput", m.successful_throughput);
  obj.Put("total_throughput", m.total_throughput);
  obj.Put("avg_utilization", m.avg_server_utilization);
  obj.Put("max_utilization", m.max_server_utilization);
  obj.Put("avg_queue_depth", m.avg_queue_depth);
  obj.Put("max_queue_depth", m.max_queue_depth);

  std::ostream& servers = obj.Key("servers");
  servers << "[";
  for (std::size_t i = 0; i < m.servers.size(); ++i) {
    const ServerStats& s = m.servers[i];
    if (i > 0) servers << ",";
    servers << "\n    ";
    JsonObject o(servers);
    o.Put("server_id", static_cast<std::uint64_t>(s.server_id));
    PutCounts(o, "requests", s.counts);
    o.Put("avg_response_ms", s.avg_response_ms);
    o.Put("min_response_ms", s.min_response_ms);
    o.Put("max_response_ms", s.max_response_ms);
    PutPercentiles(o, "response_percentiles_ms", s.response_percentiles_ms);
    o.Put("avg_queue_wait_ms", s.avg_queue_wait_ms);
    o.Put("max_queue_wait_ms", s.max_queue_wait_ms);
    o.Put("avg_utilization", s.avg_utilization);
    o.Put("max_utilization", s.max_utilization);
    o.Put("avg_queue_depth", s.avg_queue_depth);
  }
  servers << "]";

  std::ostream& series = obj.Key("timeseries");
  series << "[";
  for (std::size_t i = 0; i < m.timeseries.size(); ++i) {
    const TimeseriesSample& t = m.timeseries[i];
    if (i > 0) series << ",";
    series << "\n    ";
    JsonObject o(series);
    o.Put("time_s", t.time);
    o.Put("completions", t.completions);
    o.Put("mean_response_ms", t.mean_response_ms);
    o.Put("mean_queue_wait_ms", t.mean_queue_wait_ms);
    o.Put("queue_depth", t.queue_depth);
    o.Put("in_flight", t.in_flight);
    o.Put("mean_utilization", t.mean_utilization);
  }
  series << "]";
}

double PercentOf(double value, double best) {
  return best > 0.0 ? (value - best) / best * 100.0 : 0.0;
}

std::ofstream OpenOutput(const std::string& path) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to open '" + path + "' for writing");
  return out;
}

const Row& SummaryHeaders() {
  static const Row headers = {
      "scenario",          "duration_s",        "total_requests",    "successful_requests",
      "timed_out_requests", "error_requests",   "truncated_requests", "success_rate",
      "avg_response_ms",   "min_response_ms",   "max_response_ms",   "stddev_response_ms",
      "p50_response_ms",   "p95_response_ms",   "p99_response_ms",   "p999_response_ms",
      "avg_queue_wait_ms", "max_queue_wait_ms", "p95_queue_wait_ms", "successful_throughput",
      "total_throughput",  "avg_utilization",   "max_utilization",   "avg_queue_depth",
      "max_queue_depth"};
  return headers;
}

Row SummaryRow(const MetricsSnapshot& m) {
  return {m.scenario,
          Num(m.duration),
          Num(m.counts.total),
          Num(m.counts.success),
          Num(m.counts.timed_out),
          Num(m.counts.error),
          Num(m.truncated_requests),
          Num(m.success_rate),
          Num(m.avg_response_ms),
          Num(m.min_response_ms),
          Num(m.max_response_ms),
          Num(m.response_stddev_ms),
          Num(m.response_percentiles_ms.p50),
          Num(m.response_percentiles_ms.p95),
          Num(m.response_percentiles_ms.p99),
          Num(m.response_percentiles_ms.p999),
          Num(m.avg_queue_wait_ms),
          Num(m.max_queue_wait_ms),
          Num(m.queue_wait_percentiles_ms.p95),
          Num(m.successful_throughput),
          Num(m.total_throughput),
          Num(m.avg_server_utilization),
          Num(m.max_server_utilization),
          Num(m.avg_queue_depth),
          Num(m.max_queue_depth)};
}

}  // namespace

const char* ToString(ExportFormat f) {
  switch (f) {
    case ExportFormat::Json: return "json";
    case ExportFormat::Csv: return "csv";
    case ExportFormat::Both: return "both";
  }
  return "unknown";
}

std::optional<ExportFormat> ParseExportFormat(std::string_view s) {
  if (s == "json") return ExportFormat::Json;
  if (s == "csv") return ExportFormat::Csv;
  if (s == "both") return ExportFormat::Both;
  return std::nullopt;
}

ComparisonSummary CompareRuns(const std::vector<MetricsSnapshot>& runs) {
  if (runs.empty()) throw std::runtime_error("CompareRuns: no runs to compare");
  ComparisonSummary c;
  for (std::size_t i = 1; i < runs.size(); ++i) {
    if (runs[i].avg_response_ms < runs[c.best_response].avg_response_ms) c.best_response = i;
    if (runs[i].successful_throughput > runs[c.best_throughput].successful_throughput) {
      c.best_throughput = i;
    }
    if (runs[i].success_rate > runs[c.best_success_rate].success_rate) c.best_success_rate = i;
  }
  const double best_response = runs[c.best_response].avg_response_ms;
  const double best_throughput = runs[c.best_throughput].successful_throughput;
  for (const auto& m : runs) {
    c.response_vs_best_pct.push_back(PercentOf(m.avg_response_ms, best_response));
    c.throughput_vs_best_pct.push_back(PercentOf(m.successful_throughput, best_throughput));
  }
  return c;
}

void WriteSummaryCsv(std::ostream& out, const MetricsSnapshot& m) {
  WriteCsv(out, SummaryHeaders(), {SummaryRow(m)});
}

void WriteServersCsv(std::ostream& out, const MetricsSnapshot& m) {
  const Row headers = {"server_id",       "total_requests",  "successful_requests",
                       "timed_out_requests", "error_requests", "avg_response_ms",
                       "min_response_ms", "max_response_ms", "p95_response_ms",
                       "avg_queue_wait_ms", "max_queue_wait_ms", "avg_utilization",
                       "max_utilization", "avg_queue_depth"};
  std::vector<Row> rows;
  rows.reserve(m.servers.size());
  for (const auto& s : m.servers) {
    rows.push_back({std::to_string(s.server_id), Num(s.counts.total), Num(s.counts.success),
                    Num(s.counts.timed_out), Num(s.counts.error), Num(s.avg_response_ms),
                    Num(s.min_response_ms), Num(s.max_response_ms),
                    Num(s.response_percentiles_ms.p95), Num(s.avg_queue_wait_ms),
                    Num(s.max_queue_wait_ms), Num(s.avg_utilization), Num(s.max_utilization),
                    Num(s.avg_queue_depth)});
  }
  WriteCsv(out, headers, rows);
}

void WriteTimeseriesCsv(std::ostream& out, const MetricsSnapshot& m) {
  const Row headers = {"time_s",        "completions", "mean_response_ms", "mean_queue_wait_ms",
                       "queue_depth",   "in_flight",   "mean_utilization"};
  std::vector<Row> rows;
  rows.reserve(m.timeseries.size());
  for (const auto& t : m.timeseries) {
    rows.push_back({Num(t.time), Num(t.completions), Num(t.mean_response_ms),
                    Num(t.mean_queue_wait_ms), Num(t.queue_depth), Num(t.in_flight),
                    Num(t.mean_utilization)});
  }
  WriteCsv(out, headers, rows);
}

void WriteComparisonCsv(std::ostream& out, const std::vector<MetricsSnapshot>& runs) {
  Row headers = SummaryHeaders();
  headers.push_back("response_vs_best_pct");
  headers.push_back("throughput_vs_best_pct");
  std::vector<Row> rows;
  rows.reserve(runs.size());
  if (!runs.empty()) {
    const ComparisonSummary c = CompareRuns(runs);
    for (std::size_t i = 0; i < runs.size(); ++i) {
      Row row = SummaryRow(runs[i]);
      row.push_back(Num(c.response_vs_best_pct[i]));
      row.push_back(Num(c.throughput_vs_best_pct[i]));
      rows.push_back(std::move(row));
    }
  }
  WriteCsv(out, headers, rows);
}

void WriteSnapshotJson(std::ostream& out, const MetricsSnapshot& m) {
  {
    JsonObject obj(out);
    PutSnapshotMembers(obj, m);
  }
  out << "\n";
}

void WriteComparisonJson(std::ostream& out, const std::vector<MetricsSnapshot>& runs) {
  const ComparisonSummary c = CompareRuns(runs);
  {
    JsonObject obj(out);
    std::ostream& list = obj.Key("scenarios");
    list << "[";
    for (std::size_t i = 0; i < runs.size(); ++i) {
      if (i > 0) list << ",";
      list << "\n  ";
      JsonObject run(list);
      PutSnapshotMembers(run, runs[i]);
      run.Put("response_vs_best_pct", c.response_vs_best_pct[i]);
      run.Put("throughput_vs_best_pct", c.throughput_vs_best_pct[i]);
    }
    list << "]";
    obj.Put("best_response_time_scenario", runs[c.best_response].scenario);
    obj.Put("best_throughput_scenario", runs[c.best_throughput].scenario);
    obj.Put("best_success_rate_scenario", runs[c.best_success_rate].scenario);
  }
  out << "\n";
}

std::vector<std::string> WriteRunOutputs(const std::string& out_dir, const MetricsSnapshot& m,
                                         ExportFormat format) {
  std::vector<std::string> written;
  if (format != ExportFormat::Csv) {
    const std::string path = out_dir + "/results.json";
    auto out = OpenOutput(path);
    WriteSnapshotJson(out, m);
    written.push_back(path);
  }
  if (format != ExportFormat::Json) {
    const std::string summary = out_dir + "/summary.csv";
    const std::string servers = out_dir + "/servers.csv";
    const std::string series = out_dir + "/timeseries.csv";
    {
      auto out = OpenOutput(summary);
      WriteSummaryCsv(out, m);
    }
    {
      auto out = OpenOutput(servers);
      WriteServersCsv(out, m);
    }
    auto out = OpenOutput(series);
    WriteTimeseriesCsv(out, m);
    written.insert(written.end(), {summary, servers, series});
  }
  return written;
}

std::vector<std::string> WriteComparisonOutputs(const std::string& out_dir,
                                                const std::vector<MetricsSnapshot>& runs,
                                                ExportFormat format) {
  std::vector<std::string> written;
  if (format != ExportFormat::Csv) {
    const std::string path = out_dir + "/comparison.json";
    auto out = OpenOutput(path);
    WriteComparisonJson(out, runs);
    written.push_back(path);
  }
  if (format != ExportFormat::Json) {
    const std::string path = out_dir + "/comparison.csv";
    auto out = OpenOutput(path);
    WriteComparisonCsv(out, runs);
    written.push_back(path);
  }
  return written;
}

void PrintSummary(std::ostream& out, const MetricsSnapshot& m) {
  out << "summary (" << m.scenario << "):\n"
      << "  requests=" << m.counts.total << " success=" << m.counts.success
      << " timed_out=" << m.counts.timed_out << " error=" << m.counts.error
      << " truncated=" << m.truncated_requests << "\n"
      << "  success_rate=" << m.success_rate << "\n"
      << "  response_ms avg=" << m.avg_response_ms << " p50=" << m.response_percentiles_ms.p50
      << " p95=" << m.response_percentiles_ms.p95 << " p99=" << m.response_percentiles_ms.p99
      << " max=" << m.max_response_ms << "\n"
      << "  queue_wait_ms avg=" << m.avg_queue_wait_ms << " max=" << m.max_queue_wait_ms << "\n"
      << "  throughput_rps success=" << m.successful_throughput
      << " total=" << m.total_throughput << "\n"
      << "  utilization avg=" << m.avg_server_utilization
      << " max=" << m.max_server_utilization << "\n";
}

void PrintComparison(std::ostream& out, const std::vector<MetricsSnapshot>& runs) {
  if (runs.empty()) return;
  const ComparisonSummary c = CompareRuns(runs);
  for (std::size_t i = 0; i < runs.size(); ++i) {
    const MetricsSnapshot& m = runs[i];
    out << "  " << m.scenario << ": avg_response_ms=" << m.avg_response_ms
        << " (+" << c.response_vs_best_pct[i] << "%)"
        << " p95_ms=" << m.response_percentiles_ms.p95
        << " throughput=" << m.successful_throughput
        << " (" << c.throughput_vs_best_pct[i] << "%)"
        << " success_rate=" << m.success_rate << "\n";
  }
  out << "best response time: " << runs[c.best_response].scenario << "\n"
      << "best throughput: " << runs[c.best_throughput].scenario << "\n"
      << "best success rate: " << runs[c.best_success_rate].scenario << "\n";
}

}  // namespace loadsim
