#pragma once

#include "connection.hpp"
#include "operation.hpp"
#include "stats.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace respbench {

// Everything one operation benchmark produced: the raw samples and the result derived from them.
struct OperationRun {
  LatencySamples samples;
  OperationResult result;
};

// Runs one operation kind for a number of iterations and measures every round trip.
// Implementations own their connections for the duration of run(). A false
// return means a connection failure described by `err`; `out` is then unspecified.
class OperationDriver {
 public:
  virtual ~OperationDriver() = default;

  virtual bool run(Operation op, std::uint64_t iterations, OperationRun& out, std::string& err) = 0;
};

// One connection, one outstanding request at a time.
class SequentialDriver : public OperationDriver {
 public:
  explicit SequentialDriver(ConnectOptions options);

  bool run(Operation op, std::uint64_t iterations, OperationRun& out, std::string& err) override;

 private:
  ConnectOptions options_;
};

// `clients` threads, each with its own connection and contiguous slice of
// iteration indices. Samples are merged in client order.
class ConcurrentDriver : public OperationDriver {
 public:
  ConcurrentDriver(ConnectOptions options, int clients);

  bool run(Operation op, std::uint64_t iterations, OperationRun& out, std::string& err) override;

 private:
  ConnectOptions options_;
  int clients_;
};

std::unique_ptr<OperationDriver> make_driver(const ConnectOptions& options, int clients);

} // namespace respbench
