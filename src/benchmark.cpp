#include "benchmark.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace respbench {

ConnectOptions connect_options(const BenchConfig& config) {
  ConnectOptions options;
  options.host = config.host;
  options.port = config.port;
  options.timeout_ms = config.timeout_ms;
  options.user = config.user;
  options.password = config.password;
  return options;
}

int run_benchmark(const BenchConfig& config, OperationDriver& driver, std::ostream& out, RunSummary& summary) {
  log(LogLevel::Info, "benchmarking " + endpoint_string(config.host, config.port) + " with " +
                          std::to_string(config.iterations) + " iterations per operation");
  render_banner(config, out);

  std::vector<OperationResult> results;
  std::vector<std::string> failed;
  for (const auto op : config.operations) {
    const std::string name = operation_name(op);
    render_progress_start(name, out);

    OperationRun run;
    std::string err;
    if (!driver.run(op, config.iterations, run, err)) {
      render_progress_failed(out);
      log(LogLevel::Error, name + " benchmark failed: " + err);
      if (config.on_error == FailurePolicy::Abort) {
        log(LogLevel::Error, "aborting run (on-error abort)");
        summary = summarize(std::move(results), {name});
        return kExitFailure;
      }
      failed.push_back(name);
      continue;
    }

    render_progress_done(run.result, out);
    log(LogLevel::Debug, name + ": " + std::to_string(run.samples.size()) + " samples in " +
                             std::to_string(run.result.total_seconds) + " s");
    results.push_back(std::move(run.result));
  }

  summary = summarize(std::move(results), std::move(failed));
  render_results(summary, out);

  if (summary.results.empty()) return kExitFailure;
  if (config.strict && classify_throughput(summary.average_ops_per_sec) == Verdict::BelowKillSwitch) {
    return kExitBelowKillSwitch;
  }
  return kExitOk;
}

int run_benchmark(const BenchConfig& config, std::ostream& out) {
  auto driver = make_driver(connect_options(config), config.clients);
  RunSummary summary;
  return run_benchmark(config, *driver, out, summary);
}

}  // namespace respbench
