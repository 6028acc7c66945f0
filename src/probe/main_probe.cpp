#include "logging.hpp"
#include "probe.hpp"
#include <iostream>
#include <sodium.h>

using namespace rkprobe;

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  ProbeConfig cfg;
  std::string error;
  if (!parse_probe_args(args, cfg, error)) {
    std::cerr << error << "\n";
    print_usage(std::cerr, argv[0]);
    return 2;
  }
  if (cfg.show_help) {
    print_usage(std::cout, argv[0]);
    return 0;
  }
  Logger::instance().set_level(cfg.log_level);

  if (sodium_init() < 0) {
    Logger::instance().log(LogLevel::ERROR, "sodium_init failed");
    return 1;
  }
  return run_probe(cfg, std::cout);
}
