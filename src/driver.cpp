#include "driver.hpp"

#include "logger.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace respbench {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_micros(Clock::time_point start, Clock::time_point end) {
  return std::chrono::duration<double, std::micro>(end - start).count();
}

double elapsed_seconds(Clock::time_point start, Clock::time_point end) {
  return std::chrono::duration<double>(end - start).count();
}

struct ReplyCounters {
  std::uint64_t empty = 0;
  std::uint64_t errors = 0;
  std::uint64_t lossy = 0;
};

// Issues iterations [begin, end) on `conn`, appending one sample per iteration.
bool run_iterations(Connection& conn, Operation op, std::uint64_t begin, std::uint64_t end,
                    LatencySamples& samples, ReplyCounters& counters, std::string& err) {
  DecodedReply reply;
  for (std::uint64_t i = begin; i < end; ++i) {
    const auto op_start = Clock::now();
    if (!conn.round_trip(build_command(op, i), reply, err)) {
      err = std::string(operation_name(op)) + " iteration " + std::to_string(i) + ": " + err;
      return false;
    }
    const auto op_end = Clock::now();
    samples.push_back(elapsed_micros(op_start, op_end));

    if (reply.kind == ReplyKind::Empty) {
      if (counters.empty == 0) {
        log(LogLevel::Warn, std::string(operation_name(op)) + ": server closed the connection at iteration " +
                                std::to_string(i) + "; latencies after this point are not round trips");
      }
      ++counters.empty;
    } else if (reply.kind == ReplyKind::Error) {
      if (counters.errors == 0) {
        log(LogLevel::Warn, std::string(operation_name(op)) + ": error reply " + reply.text.substr(0, 80));
      }
      ++counters.errors;
    }
    if (reply.lossy) ++counters.lossy;
  }
  return true;
}

bool check_iterations(std::uint64_t iterations, std::string& err) {
  if (iterations > kMaxIterations) {
    err = "iteration count " + std::to_string(iterations) + " exceeds the limit of " +
          std::to_string(kMaxIterations);
    return false;
  }
  return true;
}

OperationResult make_result(Operation op, std::uint64_t iterations, double total_seconds,
                            const LatencySamples& samples, const ReplyCounters& counters) {
  OperationResult r;
  r.operation = operation_name(op);
  r.iterations = iterations;
  r.total_seconds = total_seconds;
  r.ops_per_sec = throughput(iterations, total_seconds);
  r.latency = compute_latency_stats(samples);
  r.empty_replies = counters.empty;
  r.error_replies = counters.errors;
  r.lossy_replies = counters.lossy;
  return r;
}

}  // namespace

SequentialDriver::SequentialDriver(ConnectOptions options) : options_(std::move(options)) {}

bool SequentialDriver::run(Operation op, std::uint64_t iterations, OperationRun& out, std::string& err) {
  if (!check_iterations(iterations, err)) return false;

  Connection conn;
  if (!conn.open(options_, err)) return false;

  LatencySamples samples;
  samples.reserve(static_cast<std::size_t>(iterations));
  ReplyCounters counters;

  const auto start = Clock::now();
  if (!run_iterations(conn, op, 0, iterations, samples, counters, err)) return false;
  const auto end = Clock::now();
  conn.close();

  out.result = make_result(op, iterations, elapsed_seconds(start, end), samples, counters);
  out.samples = std::move(samples);
  return true;
}

ConcurrentDriver::ConcurrentDriver(ConnectOptions options, int clients)
    : options_(std::move(options)), clients_(clients < 1 ? 1 : clients) {}

bool ConcurrentDriver::run(Operation op, std::uint64_t iterations, OperationRun& out, std::string& err) {
  if (!check_iterations(iterations, err)) return false;

  struct Worker {
    std::uint64_t begin = 0;
    std::uint64_t end = 0;
    LatencySamples samples;
    ReplyCounters counters;
    bool ok = true;
    std::string err;
  };

  const auto n = static_cast<std::uint64_t>(clients_);
  std::vector<Worker> workers(static_cast<std::size_t>(clients_));
  std::uint64_t next = 0;
  for (std::uint64_t c = 0; c < n; ++c) {
    const std::uint64_t share = iterations / n + (c < iterations % n ? 1 : 0);
    workers[c].begin = next;
    workers[c].end = next + share;
    next += share;
  }

  // Every client connects first; the clock starts once all of them are ready.
  std::mutex gate_mutex;
  std::condition_variable gate_cv;
  std::size_t ready = 0;
  bool go = false;

  // Used when a thread cannot be spawned: lets the started ones past the gate without running.
  bool cancelled = false;
  auto cancel_and_join = [&](std::vector<std::thread>& started) {
    {
      std::lock_guard<std::mutex> lock(gate_mutex);
      cancelled = true;
      go = true;
    }
    gate_cv.notify_all();
    for (auto& t : started) t.join();
  };

  std::vector<std::thread> threads;
  threads.reserve(workers.size());
  for (auto& w : workers) {
    try {
      threads.emplace_back([&, op]() {
        Connection conn;
        w.ok = conn.open(options_, w.err);
        {
          std::unique_lock<std::mutex> lock(gate_mutex);
          ++ready;
          gate_cv.notify_all();
          gate_cv.wait(lock, [&] { return go; });
          if (cancelled) return;
        }
        if (!w.ok) return;
        w.samples.reserve(static_cast<std::size_t>(w.end - w.begin));
        w.ok = run_iterations(conn, op, w.begin, w.end, w.samples, w.counters, w.err);
      });
    } catch (const std::system_error& e) {
      cancel_and_join(threads);
      err = "cannot start client thread " + std::to_string(threads.size()) + ": " + e.what();
      return false;
    }
  }

  Clock::time_point start;
  {
    std::unique_lock<std::mutex> lock(gate_mutex);
    gate_cv.wait(lock, [&] { return ready == workers.size(); });
    start = Clock::now();
    go = true;
  }
  gate_cv.notify_all();

  for (auto& t : threads) t.join();
  const auto end = Clock::now();

  LatencySamples merged;
  merged.reserve(static_cast<std::size_t>(iterations));
  ReplyCounters counters;
  for (std::size_t c = 0; c < workers.size(); ++c) {
    const auto& w = workers[c];
    if (!w.ok) {
      err = "client " + std::to_string(c) + ": " + w.err;
      return false;
    }
    merged.insert(merged.end(), w.samples.begin(), w.samples.end());
    counters.empty += w.counters.empty;
    counters.errors += w.counters.errors;
    counters.lossy += w.counters.lossy;
  }

  log(LogLevel::Debug, std::string(operation_name(op)) + ": merged " + std::to_string(merged.size()) +
                           " samples from " + std::to_string(workers.size()) + " clients");

  out.result = make_result(op, iterations, elapsed_seconds(start, end), merged, counters);
  out.samples = std::move(merged);
  return true;
}

std::unique_ptr<OperationDriver> make_driver(const ConnectOptions& options, int clients) {
  if (clients <= 1) return std::make_unique<SequentialDriver>(options);
  return std::make_unique<ConcurrentDriver>(options, clients);
}

}  // namespace respbench
