#include "benchmark.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cout << "Usage: resp-bench [--host <ip>] [--port <port>] [--iterations <n>]\n"
               "                  [--operations <PING,SET,GET,DEL>] [--clients <n>] [--timeout-ms <ms>]\n"
               "                  [--on-error <abort|continue>] [--user <name>] [--password <secret>]\n"
               "                  [--loglevel <error|warn|info|debug>] [--strict] [--config <path>]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);

  respbench::CommandLine cl;
  std::string err;
  if (!respbench::parse_command_line(argc, argv, cl, err)) {
    std::cerr << err << "\n";
    print_usage();
    return respbench::kExitFailure;
  }
  if (cl.show_help) {
    print_usage();
    return 0;
  }

  respbench::BenchConfig config;
  if (!respbench::resolve_config(cl, config, err)) {
    respbench::log(respbench::LogLevel::Error, err);
    return respbench::kExitFailure;
  }

  respbench::LogLevel level = respbench::LogLevel::Info;
  if (respbench::parse_log_level(config.log_level, level)) {
    respbench::set_log_level(level);
  }

  return respbench::run_benchmark(config, std::cout);
}
