#include "driver.hpp"
#include "report.hpp"

#include "stub_server.hpp"

#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

respbench::ConnectOptions options_for(const respbench::testing::StubServer& server) {
  respbench::ConnectOptions options;
  options.host = "127.0.0.1";
  options.port = server.port();
  return options;
}

}  // namespace

int main() {
  using respbench::Operation;
  using respbench::testing::StubServer;

  {
    StubServer server(respbench::testing::default_reply);
    if (!server.start()) {
      std::cerr << "stub server failed to start\n";
      return 1;
    }
    respbench::SequentialDriver driver(options_for(server));

    respbench::OperationRun ping;
    std::string err;
    if (!driver.run(Operation::Ping, 50, ping, err)) {
      std::cerr << "PING run failed: " << err << "\n";
      return 1;
    }
    if (ping.samples.size() != 50 || ping.result.iterations != 50 || ping.result.operation != "PING") {
      std::cerr << "one sample per PING iteration expected\n";
      return 1;
    }
    if (!(ping.result.ops_per_sec > 0.0) || ping.result.total_seconds * 1e6 < ping.result.latency.max) {
      std::cerr << "total elapsed time must cover the slowest round trip\n";
      return 1;
    }
    if (ping.result.empty_replies != 0 || ping.result.error_replies != 0 || ping.result.lossy_replies != 0) {
      std::cerr << "+PONG replies should be clean\n";
      return 1;
    }

    respbench::OperationRun get;
    if (!driver.run(Operation::Get, 10000, get, err)) {
      std::cerr << "GET run failed: " << err << "\n";
      return 1;
    }
    if (get.samples.size() != 10000) {
      std::cerr << "GET sample count mismatch\n";
      return 1;
    }

    const auto requests = server.requests();
    if (requests.size() != 10050) {
      std::cerr << "server saw " << requests.size() << " requests\n";
      return 1;
    }
    for (std::size_t i = 0; i < 50; ++i) {
      if (requests[i] != std::vector<std::string>{"PING"}) {
        std::cerr << "unexpected PING request shape\n";
        return 1;
      }
    }
    for (std::size_t i = 0; i < 10000; ++i) {
      const auto& req = requests[50 + i];
      if (req.size() != 2 || req[0] != "GET" || req[1] != std::to_string(i % 1000)) {
        std::cerr << "GET key sequence broken at " << i << "\n";
        return 1;
      }
    }
    if (server.connections() != 2) {
      std::cerr << "each operation should open its own connection\n";
      return 1;
    }
  }

  {
    StubServer server(respbench::testing::default_reply);
    if (!server.start()) return 1;
    respbench::ConcurrentDriver driver(options_for(server), 4);

    respbench::OperationRun set;
    std::string err;
    if (!driver.run(Operation::Set, 1001, set, err)) {
      std::cerr << "concurrent SET failed: " << err << "\n";
      return 1;
    }
    if (set.samples.size() != 1001 || set.result.iterations != 1001) {
      std::cerr << "concurrent driver must merge every sample\n";
      return 1;
    }
    std::map<std::string, int> keys;
    for (const auto& req : server.requests()) ++keys[req.at(1)];
    if (keys.size() != 1001 || keys.count("key0") != 1 || keys.count("key1000") != 1) {
      std::cerr << "iteration indices must be split without overlap\n";
      return 1;
    }
    if (server.connections() != 4) {
      std::cerr << "one connection per client expected\n";
      return 1;
    }
  }

  {
    StubServer server([](const std::vector<std::string>&) { return std::string("-NOAUTH Authentication required\r\n"); });
    if (!server.start()) return 1;
    respbench::SequentialDriver driver(options_for(server));
    respbench::OperationRun del;
    std::string err;
    if (!driver.run(Operation::Del, 20, del, err) || del.result.error_replies != 20 || del.samples.size() != 20) {
      std::cerr << "error replies are counted, not fatal\n";
      return 1;
    }
  }

  {
    StubServer server([](const std::vector<std::string>&) { return std::string("+\xff\xfe\r\n"); });
    if (!server.start()) return 1;
    respbench::SequentialDriver driver(options_for(server));
    respbench::OperationRun ping;
    std::string err;
    if (!driver.run(Operation::Ping, 10, ping, err) || ping.result.lossy_replies != 10 || ping.samples.size() != 10) {
      std::cerr << "undecodable replies should be replaced and counted\n";
      return 1;
    }
  }

  {
    StubServer server([](const std::vector<std::string>& args) {
      if (args[0] == "AUTH") {
        return std::string(args.size() == 3 && args[1] == "bench" && args[2] == "secret" ? "+OK\r\n"
                                                                                          : "-WRONGPASS invalid\r\n");
      }
      return respbench::testing::default_reply(args);
    });
    if (!server.start()) return 1;

    auto options = options_for(server);
    options.user = "bench";
    options.password = "secret";
    respbench::SequentialDriver good(options);
    respbench::OperationRun ping;
    std::string err;
    if (!good.run(Operation::Ping, 3, ping, err)) {
      std::cerr << "AUTH with valid credentials failed: " << err << "\n";
      return 1;
    }
    const auto requests = server.requests();
    if (requests.size() != 4 || requests[0][0] != "AUTH" || ping.samples.size() != 3) {
      std::cerr << "AUTH must precede the timed iterations\n";
      return 1;
    }

    options.password = "nope";
    respbench::SequentialDriver bad(options);
    if (bad.run(Operation::Ping, 3, ping, err) || err.find("AUTH rejected") == std::string::npos) {
      std::cerr << "rejected AUTH should fail the operation\n";
      return 1;
    }
  }

  {
    StubServer silent([](const std::vector<std::string>&) { return std::string(); });
    if (!silent.start()) return 1;
    auto options = options_for(silent);
    options.timeout_ms = 100;
    respbench::SequentialDriver driver(options);
    respbench::OperationRun ping;
    std::string err;
    if (driver.run(Operation::Ping, 1, ping, err) || err.find("timed out") == std::string::npos) {
      std::cerr << "a silent server should trip the read timeout, got: " << err << "\n";
      return 1;
    }
  }

  {
    StubServer server(respbench::testing::default_reply);
    server.set_replies_before_eof(2);
    if (!server.start()) return 1;
    respbench::SequentialDriver driver(options_for(server));
    respbench::OperationRun ping;
    std::string err;
    if (!driver.run(Operation::Ping, 4, ping, err)) {
      std::cerr << "end-of-stream replies should not fail the run: " << err << "\n";
      return 1;
    }
    if (ping.samples.size() != 4 || ping.result.empty_replies != 2) {
      std::cerr << "expected 4 samples with 2 empty reads, got " << ping.samples.size() << " / "
                << ping.result.empty_replies << "\n";
      return 1;
    }
    std::ostringstream out;
    respbench::render_results(respbench::summarize({ping.result}, {}), out);
    if (out.str().find("note: PING saw 2 empty reads") == std::string::npos) {
      std::cerr << "empty reads should be noted under the table:\n" << out.str();
      return 1;
    }
  }

  {
    int closed_port = 0;
    {
      StubServer gone(respbench::testing::default_reply);
      if (!gone.start()) return 1;
      closed_port = gone.port();
    }
    respbench::ConnectOptions options;
    options.port = closed_port;
    respbench::SequentialDriver driver(options);
    respbench::OperationRun run;
    std::string err;
    if (driver.run(Operation::Ping, 1, run, err) || err.find("cannot connect") == std::string::npos) {
      std::cerr << "refused connection should be reported\n";
      return 1;
    }

    // Every client fails to connect; the start gate must still release and join them all.
    respbench::ConcurrentDriver concurrent(options, 3);
    if (concurrent.run(Operation::Ping, 9, run, err) || err.find("client 0: cannot connect") == std::string::npos) {
      std::cerr << "concurrent connect failure should be reported, got: " << err << "\n";
      return 1;
    }

    respbench::SequentialDriver oversized(options);
    if (oversized.run(Operation::Ping, respbench::kMaxIterations + 1, run, err) ||
        err.find("iteration count") == std::string::npos) {
      std::cerr << "oversized iteration count should be refused before connecting\n";
      return 1;
    }
  }

  std::cout << "driver_test passed\n";
  return 0;
}
