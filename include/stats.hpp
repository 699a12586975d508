#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace respbench {

// Round-trip durations in microseconds, in issuance order.
using LatencySamples = std::vector<double>;

struct LatencyStats {
  double mean = 0.0;
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double min = 0.0;
  double max = 0.0;
};

struct OperationResult {
  std::string operation;
  std::uint64_t iterations = 0;
  double total_seconds = 0.0;
  double ops_per_sec = 0.0;
  LatencyStats latency;
  std::uint64_t empty_replies = 0;
  std::uint64_t error_replies = 0;
  std::uint64_t lossy_replies = 0;
};

// floor(fraction * count), clamped to the last valid index. 0 for an empty sequence.
std::size_t percentile_index(std::size_t count, double fraction);

// Nearest-rank percentile over ascending `sorted`; no interpolation.
double percentile(const std::vector<double>& sorted, double fraction);

// Middle value, or mean of the two middle values for an even count.
double median(const std::vector<double>& sorted);

LatencyStats compute_latency_stats(const LatencySamples& samples);

double throughput(std::uint64_t iterations, double total_seconds);

} // namespace respbench
