#pragma once
#include <cstdint>
#include <string>

enum SchedulingAlgorithm {
  FCFS,
  SJF,
  RR
};

// What "shortest" means for SJF.
enum class SjfMetric {
  INSTRUCTIONS, // remaining instruction count
  BURST         // remaining estimated burst (wait ticks + 1 per request/end)
};

struct Config {
  SchedulingAlgorithm scheduler = FCFS; // "fcfs", "sjf" or "rr"
  uint32_t quantum_cycles = 2;
  SjfMetric sjf_metric = SjfMetric::INSTRUCTIONS;

  // Resources R0 .. R(num_resources - 1) are declared at startup
  uint32_t num_resources = 10;

  // Deadlock resolution: 0 = keep asking until a valid answer arrives
  uint32_t max_resolution_attempts = 0;

  // Logging
  uint32_t save_action_log = 1;
  std::string log_directory = "logs";
};

Config load_config(const std::string &path);

SchedulingAlgorithm parse_algorithm(const std::string &name, bool &ok);
std::string algorithm_name(SchedulingAlgorithm algo);
