#include "view/cli.hpp"
#include "view/reporter.hpp"
#include "kernel/engine.hpp"
#include "processes/program_loader.hpp"
#include "util.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

static void print_banner(std::ostream &out) {
  out << "=============================================\n"
      << "    PROCESS SCHEDULING & DEADLOCK SIMULATOR\n"
      << "=============================================\n";
}

CLI::CLI(std::istream &in, std::ostream &out, std::ostream &err)
    : in_(in), out_(out), err_(err) {}

bool CLI::read_line(std::string &line) {
  if (!std::getline(in_, line))
    return false;
  line = trim(line);
  return true;
}

int CLI::run(int argc, char **argv) {
  if (argc < 2) {
    err_ << "Usage: procsim <program-file> [config-file]\n";
    return 1;
  }

  cfg_ = load_config(argc >= 3 ? argv[2] : "config.txt");

  std::vector<ProgramDefinition> programs;
  try {
    programs = ProgramLoader().load_file(argv[1]);
  } catch (const std::exception &ex) {
    err_ << "Error: " << ex.what() << "\n";
    return 1;
  }

  print_banner(out_);
  out_ << "Loaded " << programs.size() << " program(s) from " << argv[1] << ".\n";
  choose_algorithm();
  return simulate(programs);
}

void CLI::choose_algorithm() {
  out_ << "Choose scheduling algorithm:\n"
       << "1. First-Come-First-Serve (FCFS)\n"
       << "2. Shortest Job First (SJF)\n"
       << "3. Round Robin (RR)\n"
       << "Enter choice (1/2/3): " << std::flush;

  std::string choice;
  if (!read_line(choice))
    choice.clear();

  if (choice == "1") {
    cfg_.scheduler = SchedulingAlgorithm::FCFS;
  } else if (choice == "2") {
    cfg_.scheduler = SchedulingAlgorithm::SJF;
  } else if (choice == "3") {
    cfg_.scheduler = SchedulingAlgorithm::RR;
    out_ << "Enter time quantum (ticks, default=" << cfg_.quantum_cycles << "): " << std::flush;
    std::string quantum;
    if (read_line(quantum) && !quantum.empty()) {
      try {
        unsigned long q = std::stoul(quantum);
        if (q > 0) cfg_.quantum_cycles = static_cast<uint32_t>(q);
        else out_ << "Quantum must be at least 1, keeping " << cfg_.quantum_cycles << ".\n";
      } catch (const std::exception &) {
        out_ << "Invalid quantum, keeping " << cfg_.quantum_cycles << ".\n";
      }
    }
  } else {
    out_ << "Invalid choice, defaulting to FCFS\n";
    cfg_.scheduler = SchedulingAlgorithm::FCFS;
  }
}

uint32_t CLI::prompt_resolution(const Engine &engine, const DeadlockReport &report) {
  out_ << "\n" << engine.snapshot();
  out_ << "Resources involved in deadlock: " << join_ids(report.resources, "R") << "\n";

  std::string line;
  while (true) {
    out_ << "Enter the resource ID (e.g. 1 for R1) to release: " << std::flush;
    if (!read_line(line))
      throw std::runtime_error("input closed while waiting for a deadlock resolution");
    if (!line.empty() && (line[0] == 'R' || line[0] == 'r'))
      line.erase(0, 1);
    try {
      size_t used = 0;
      unsigned long long id = std::stoull(line, &used);
      if (used == line.size() && std::isdigit(static_cast<unsigned char>(line[0])) &&
          id <= std::numeric_limits<uint32_t>::max())
        return static_cast<uint32_t>(id);
    } catch (const std::exception &) {
      // fall through to the re-prompt
    }
    out_ << "Invalid input. Please enter one of: " << join_ids(report.resources, "R") << "\n";
  }
}

int CLI::simulate(const std::vector<ProgramDefinition> &programs) {
  Engine engine(cfg_);
  Reporter reporter(engine);

  for (auto &p : ProgramLoader::build_processes(programs))
    engine.submit_process(p);

  engine.add_observer([this, &reporter](const SimEvent &e) {
    out_ << reporter.describe(e) << "\n";
  });
  engine.set_resolver([this, &engine](const DeadlockReport &report) {
    return prompt_resolution(engine, report);
  });

  out_ << "\nRunning " << engine.policy().name();
  if (engine.policy().is_preemptive())
    out_ << " (quantum " << engine.policy().quantum() << ")";
  out_ << "\n";

  int status = 0;
  try {
    engine.run();
  } catch (const std::exception &ex) {
    err_ << "Simulation stopped: " << ex.what() << "\n";
    status = 2;
  }

  out_ << reporter.build_report();

  if (cfg_.save_action_log) {
    std::string path = cfg_.log_directory + "/action_log.log";
    try {
      reporter.write_log(path);
      out_ << "\nAction log written to " << path << "\n";
    } catch (const std::exception &ex) {
      err_ << "Warning: " << ex.what() << "\n";
    }
  }
  return status;
}
