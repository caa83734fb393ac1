#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <iostream>

SchedulingAlgorithm parse_algorithm(const std::string &name, bool &ok) {
  std::string v = to_lower(trim(name));
  ok = true;
  if (v == "fcfs") return SchedulingAlgorithm::FCFS;
  if (v == "sjf")  return SchedulingAlgorithm::SJF;
  if (v == "rr")   return SchedulingAlgorithm::RR;
  ok = false;
  return SchedulingAlgorithm::FCFS;
}

std::string algorithm_name(SchedulingAlgorithm algo) {
  switch (algo) {
  case FCFS:
    return "FCFS";
  case SJF:
    return "SJF";
  case RR:
    return "RR";
  default:
    return "UNKNOWN";
  }
}

// stoul alone accepts "-1" and values past 32 bits; both are rejected here
static uint32_t to_u32(const std::string &key, const std::string &value, uint32_t fallback) {
  bool digits = !value.empty() &&
                std::all_of(value.begin(), value.end(),
                            [](unsigned char c) { return std::isdigit(c); });
  if (digits) {
    try {
      unsigned long long v = std::stoull(value);
      if (v <= std::numeric_limits<uint32_t>::max())
        return static_cast<uint32_t>(v);
    } catch (const std::out_of_range &) {
      // too large, handled below
    }
  }
  std::cerr << "Warning: " << key << " expects a number from 0 to "
            << std::numeric_limits<uint32_t>::max() << ", got '" << value
            << "'. Keeping " << fallback << ".\n";
  return fallback;
}

Config load_config(const std::string &path) {

  Config cfg{};
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return cfg;
  }

  std::string key, value;

  while (in >> key >> value)
  {
    key = trim(key), value = trim(value);

    if (key == "scheduler") {
      bool ok = false;
      cfg.scheduler = parse_algorithm(value, ok);
      if (!ok)
        std::cerr << "Warning: unknown scheduler '" << value << "', using FCFS.\n";
    }

    else if (key == "sjf-metric") {
      std::string v = to_lower(value);
      if (v == "instructions") cfg.sjf_metric = SjfMetric::INSTRUCTIONS;
      else if (v == "burst")   cfg.sjf_metric = SjfMetric::BURST;
      else std::cerr << "Warning: unknown sjf-metric '" << value << "', using instructions.\n";
    }

    else if (key == "quantum-cycles") cfg.quantum_cycles = to_u32(key, value, cfg.quantum_cycles);
    else if (key == "num-resources") cfg.num_resources = to_u32(key, value, cfg.num_resources);
    else if (key == "max-resolution-attempts") cfg.max_resolution_attempts = to_u32(key, value, cfg.max_resolution_attempts);
    else if (key == "save-action-log") cfg.save_action_log = to_u32(key, value, cfg.save_action_log);
    else if (key == "log-directory") cfg.log_directory = value;
    else std::cerr << "Warning: unknown config key '" << key << "' ignored.\n";
  }

  // Validation
  if (cfg.quantum_cycles == 0) {
    std::cerr << "Warning: quantum-cycles must be at least 1, using 1.\n";
    cfg.quantum_cycles = 1;
  }
  if (cfg.num_resources == 0) {
    std::cerr << "Warning: num-resources is 0, every resource request will abort its process.\n";
  }

  return cfg;
}
