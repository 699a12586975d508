#include "stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace respbench {

std::size_t percentile_index(std::size_t count, double fraction) {
  if (count == 0) return 0;
  const auto raw = static_cast<std::size_t>(std::floor(fraction * static_cast<double>(count)));
  return std::min(raw, count - 1);
}

double percentile(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  return sorted[percentile_index(sorted.size(), fraction)];
}

double median(const std::vector<double>& sorted) {
  if (sorted.empty()) return 0.0;
  const std::size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 1) return sorted[mid];
  return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

LatencyStats compute_latency_stats(const LatencySamples& samples) {
  LatencyStats stats;
  if (samples.empty()) return stats;

  std::vector<double> sorted(samples);
  std::sort(sorted.begin(), sorted.end());

  const double sum = std::accumulate(sorted.begin(), sorted.end(), 0.0);
  stats.mean = sum / static_cast<double>(sorted.size());
  stats.p50 = median(sorted);
  stats.p95 = percentile(sorted, 0.95);
  stats.p99 = percentile(sorted, 0.99);
  stats.min = sorted.front();
  stats.max = sorted.back();
  return stats;
}

double throughput(std::uint64_t iterations, double total_seconds) {
  if (total_seconds <= 0.0) return 0.0;
  return static_cast<double>(iterations) / total_seconds;
}

}  // namespace respbench
