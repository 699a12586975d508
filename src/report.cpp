#include "report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace respbench {

namespace {

const std::string kRule(70, '=');

std::string fixed1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

}  // namespace

double average_throughput(const std::vector<OperationResult>& results) {
  if (results.empty()) return 0.0;
  double total = 0.0;
  for (const auto& r : results) total += r.ops_per_sec;
  return total / static_cast<double>(results.size());
}

RunSummary summarize(std::vector<OperationResult> results, std::vector<std::string> failed_operations) {
  RunSummary summary;
  summary.average_ops_per_sec = average_throughput(results);
  summary.results = std::move(results);
  summary.failed_operations = std::move(failed_operations);
  return summary;
}

Verdict classify_throughput(double average_ops_per_sec) {
  if (average_ops_per_sec < kKillSwitchOpsPerSec) return Verdict::BelowKillSwitch;
  if (average_ops_per_sec >= kTargetOpsPerSec) return Verdict::Success;
  return Verdict::Pass;
}

std::string format_thousands(double value) {
  const bool negative = value < 0;
  const auto rounded = static_cast<unsigned long long>(std::llround(std::fabs(value)));
  const std::string digits = std::to_string(rounded);

  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) out.push_back(',');
    out.push_back(digits[i]);
  }
  return negative && rounded != 0 ? "-" + out : out;
}

void render_banner(const BenchConfig& config, std::ostream& out) {
  out << kRule << "\n"
      << "RESP Server Benchmark\n"
      << kRule << "\n\n"
      << "Configuration:\n"
      << "  Host: " << config.host << ":" << config.port << "\n"
      << "  Iterations: " << config.iterations << "\n"
      << "  Operations: " << operation_list_string(config.operations) << "\n";
  if (config.clients > 1) out << "  Clients: " << config.clients << "\n";
  if (config.timeout_ms > 0) out << "  Timeout: " << config.timeout_ms << " ms\n";
  out << "\nRunning benchmarks...\n\n";
}

void render_progress_start(const std::string& operation, std::ostream& out) {
  out << "Benchmarking " << operation << "... " << std::flush;
}

void render_progress_done(const OperationResult& result, std::ostream& out) {
  out << "✓ " << format_thousands(result.ops_per_sec) << " ops/sec\n";
}

void render_progress_failed(std::ostream& out) { out << "FAILED\n"; }

void render_results(const RunSummary& summary, std::ostream& out) {
  out << "\n" << kRule << "\nRESULTS\n" << kRule << "\n\n";

  for (const auto& r : summary.results) {
    out << std::left << std::setw(10) << r.operation << std::right << " | " << std::setw(10)
        << format_thousands(r.ops_per_sec) << " ops/sec | "
        << "Avg: " << std::setw(6) << fixed1(r.latency.mean) << " µs | "
        << "P50: " << std::setw(6) << fixed1(r.latency.p50) << " µs | "
        << "P95: " << std::setw(6) << fixed1(r.latency.p95) << " µs | "
        << "P99: " << std::setw(6) << fixed1(r.latency.p99) << " µs\n";
  }

  for (const auto& r : summary.results) {
    if (r.empty_replies > 0) {
      out << "  note: " << r.operation << " saw " << r.empty_replies
          << " empty reads (server closed the connection)\n";
    }
    if (r.error_replies > 0) {
      out << "  note: " << r.operation << " received " << r.error_replies << " error replies\n";
    }
  }
  for (const auto& name : summary.failed_operations) {
    out << "  failed: " << name << " (connection error, see log)\n";
  }

  out << "\n" << kRule << "\n";

  if (summary.results.empty()) {
    out << "\nNo operation completed.\n";
    return;
  }

  out << "\nBenchmark complete!\n";
  out << "\nAverage throughput: " << format_thousands(summary.average_ops_per_sec) << " ops/sec\n";
  render_verdict(classify_throughput(summary.average_ops_per_sec), out);
}

void render_verdict(Verdict verdict, std::ostream& out) {
  switch (verdict) {
    case Verdict::BelowKillSwitch:
      out << "\nWARNING: Performance below 30k ops/sec kill switch!\n"
          << "   Recommendation: Ship embedded library only\n";
      break;
    case Verdict::Pass:
      out << "\nPASS: Above 30k ops/sec kill switch\n";
      break;
    case Verdict::Success:
      out << "\nSUCCESS: Exceeded 50k ops/sec target!\n";
      break;
  }
}

}  // namespace respbench
