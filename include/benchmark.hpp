#pragma once

#include "config.hpp"
#include "driver.hpp"
#include "report.hpp"

#include <ostream>

namespace respbench {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitBelowKillSwitch = 2;

// Runs every configured operation in order through `driver`, renders the
// report to `out` and returns the process exit code. `summary` receives what
// was rendered.
int run_benchmark(const BenchConfig& config, OperationDriver& driver, std::ostream& out, RunSummary& summary);

// Same, with the driver chosen from config.clients.
int run_benchmark(const BenchConfig& config, std::ostream& out);

ConnectOptions connect_options(const BenchConfig& config);

} // namespace respbench
