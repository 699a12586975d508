#pragma once

#include "config.hpp"
#include "stats.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace respbench {

constexpr double kKillSwitchOpsPerSec = 30000.0;
constexpr double kTargetOpsPerSec = 50000.0;

enum class Verdict {
  BelowKillSwitch,
  Pass,
  Success,
};

struct RunSummary {
  std::vector<OperationResult> results;
  std::vector<std::string> failed_operations;
  double average_ops_per_sec = 0.0;
};

// Unweighted mean of the per-operation throughputs; 0 for no results.
double average_throughput(const std::vector<OperationResult>& results);

RunSummary summarize(std::vector<OperationResult> results, std::vector<std::string> failed_operations);

Verdict classify_throughput(double average_ops_per_sec);

// Rounds to the nearest integer and groups digits: 12345.6 -> "12,346".
std::string format_thousands(double value);

void render_banner(const BenchConfig& config, std::ostream& out);
void render_progress_start(const std::string& operation, std::ostream& out);
void render_progress_done(const OperationResult& result, std::ostream& out);
void render_progress_failed(std::ostream& out);
void render_results(const RunSummary& summary, std::ostream& out);
void render_verdict(Verdict verdict, std::ostream& out);

} // namespace respbench
