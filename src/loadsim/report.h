#pragma once

#include "loadsim/metrics.h"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace loadsim {

enum class ExportFormat {
  Json,
  Csv,
  Both,
};

const char* ToString(ExportFormat f);
std::optional<ExportFormat> ParseExportFormat(std::string_view s);

// Winners of a comparison set plus each run's distance from them, in percent of the best value.
// Ties go to the earlier run.
struct ComparisonSummary {
  std::size_t best_response = 0;      // lowest avg_response_ms
  std::size_t best_throughput = 0;    // highest successful_throughput
  std::size_t best_success_rate = 0;  // highest success_rate
  std::vector<double> response_vs_best_pct;    // >= 0; 0 when the best is 0
  std::vector<double> throughput_vs_best_pct;  // <= 0; 0 when the best is 0
};

// Throws std::runtime_error when `runs` is empty.
ComparisonSummary CompareRuns(const std::vector<MetricsSnapshot>& runs);

// CSV export. Numbers are written with full round-trip precision, so equal snapshots give
// byte-identical files. Text fields holding a comma, quote or line break are quoted.
void WriteSummaryCsv(std::ostream& out, const MetricsSnapshot& m);
void WriteServersCsv(std::ostream& out, const MetricsSnapshot& m);
void WriteTimeseriesCsv(std::ostream& out, const MetricsSnapshot& m);
// One summary row per snapshot, followed by the vs-best columns.
void WriteComparisonCsv(std::ostream& out, const std::vector<MetricsSnapshot>& runs);

// JSON export: the whole snapshot (servers and time series included) as one object.
void WriteSnapshotJson(std::ostream& out, const MetricsSnapshot& m);
// {"scenarios": [...], "best_*_scenario": ...}; each scenario carries its vs-best fields.
void WriteComparisonJson(std::ostream& out, const std::vector<MetricsSnapshot>& runs);

// Write the files for `format` into out_dir and return their paths:
// results.json and/or summary.csv, servers.csv, timeseries.csv for a run;
// comparison.json and/or comparison.csv for a comparison set.
// Throw std::runtime_error when a file cannot be opened.
std::vector<std::string> WriteRunOutputs(const std::string& out_dir, const MetricsSnapshot& m,
                                         ExportFormat format);
std::vector<std::string> WriteComparisonOutputs(const std::string& out_dir,
                                                const std::vector<MetricsSnapshot>& runs,
                                                ExportFormat format);

// Short human-readable summaries for the console.
void PrintSummary(std::ostream& out, const MetricsSnapshot& m);
void PrintComparison(std::ostream& out, const std::vector<MetricsSnapshot>& runs);

}  // namespace loadsim
