#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static std::string write_temp(const std::string &name, const std::string &text) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << text;
  return path.string();
}

int main() {
  std::cout << "Running config tests...\n";

  // === Test 1: missing file keeps the defaults ===
  {
    Config cfg = load_config("/nonexistent/procsim_config.txt");
    assert(cfg.scheduler == SchedulingAlgorithm::FCFS);
    assert(cfg.quantum_cycles == 2);
    assert(cfg.num_resources == 10);
    assert(cfg.sjf_metric == SjfMetric::INSTRUCTIONS);
    assert(cfg.max_resolution_attempts == 0);
    assert(cfg.save_action_log == 1);
    assert(cfg.log_directory == "logs");
    std::cout << "Test 1 passed: defaults OK.\n";
  }

  // === Test 2: every key read ===
  {
    auto path = write_temp("procsim_config_full.txt",
                           "scheduler RR\n"
                           "quantum-cycles 5\n"
                           "num-resources 4\n"
                           "sjf-metric burst\n"
                           "max-resolution-attempts 3\n"
                           "save-action-log 0\n"
                           "log-directory out/logs\n");
    Config cfg = load_config(path);
    assert(cfg.scheduler == SchedulingAlgorithm::RR);
    assert(cfg.quantum_cycles == 5);
    assert(cfg.num_resources == 4);
    assert(cfg.sjf_metric == SjfMetric::BURST);
    assert(cfg.max_resolution_attempts == 3);
    assert(cfg.save_action_log == 0);
    assert(cfg.log_directory == "out/logs");
    std::filesystem::remove(path);
    std::cout << "Test 2 passed: all keys parsed.\n";
  }

  // === Test 3: bad values fall back ===
  {
    auto path = write_temp("procsim_config_bad.txt",
                           "scheduler lottery\n"
                           "quantum-cycles 0\n"
                           "num-resources many\n"
                           "colour blue\n");
    Config cfg = load_config(path);
    assert(cfg.scheduler == SchedulingAlgorithm::FCFS);
    assert(cfg.quantum_cycles == 1);
    assert(cfg.num_resources == 10);
    std::filesystem::remove(path);
    std::cout << "Test 3 passed: invalid values handled.\n";
  }

  // === Test 4: negative and oversized numbers keep their defaults ===
  {
    auto path = write_temp("procsim_config_range.txt",
                           "quantum-cycles -1\n"
                           "num-resources 4294967298\n"
                           "max-resolution-attempts 99999999999999999999999\n"
                           "save-action-log +1\n");
    Config cfg = load_config(path);
    assert(cfg.quantum_cycles == 2);
    assert(cfg.num_resources == 10);
    assert(cfg.max_resolution_attempts == 0);
    assert(cfg.save_action_log == 1);

    std::ofstream(path) << "num-resources 4294967295\n";
    assert(load_config(path).num_resources == 4294967295u);
    std::filesystem::remove(path);
    std::cout << "Test 4 passed: out-of-range numbers rejected.\n";
  }

  // === Test 5: algorithm names ===
  {
    bool ok = false;
    assert(parse_algorithm(" Sjf ", ok) == SchedulingAlgorithm::SJF && ok);
    parse_algorithm("edf", ok);
    assert(!ok);
    assert(algorithm_name(SchedulingAlgorithm::RR) == "RR");
    std::cout << "Test 5 passed: algorithm names OK.\n";
  }

  std::cout << "All config tests passed.\n";
  return 0;
}
