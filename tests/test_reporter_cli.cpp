#include "view/cli.hpp"
#include "view/reporter.hpp"
#include "kernel/engine.hpp"
#include "processes/program_loader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static const char *kDeadlockPrograms =
    "program P1\n"
    "resource(1, allocate)\n"
    "wait(2)\n"
    "resource(2, allocate)\n"
    "end\n"
    "program P2\n"
    "resource(2, allocate)\n"
    "wait(1)\n"
    "resource(1, allocate)\n"
    "end\n";

static bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

static size_t count(const std::string &haystack, const std::string &needle) {
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size()))
    ++n;
  return n;
}

static Config quiet_config() {
  Config cfg;
  cfg.save_action_log = 0;
  return cfg;
}

int main() {
  std::cout << "Running reporter and CLI tests...\n";
  auto programs = ProgramLoader().parse_string(kDeadlockPrograms);

  // === Test 1: interactive RR run with a deadlock answered by the operator ===
  {
    std::istringstream in("3\n1\n1\n");
    std::ostringstream out, err;
    CLI cli(in, out, err);
    cli.set_config(quiet_config());

    cli.choose_algorithm();
    assert(cli.config().scheduler == SchedulingAlgorithm::RR);
    assert(cli.config().quantum_cycles == 1);

    int status = cli.simulate(programs);
    std::string text = out.str();
    assert(status == 0);
    assert(err.str().empty());
    assert(contains(text, "Resources involved in deadlock: R1, R2"));
    assert(contains(text, "deadlock detected"));
    assert(contains(text, "force released resource"));
    assert(contains(text, "Completed Processes: P1, P2"));
    assert(contains(text, "R1 was released from P1"));
    assert(contains(text, "Process Completion Table:"));
    assert(contains(text, "Action Log Table:"));
    std::cout << "Test 1 passed: deadlock resolved from the prompt.\n";
  }

  // === Test 2: bad answers are re-prompted ===
  {
    // "x" is not a number, 2^32 + 1 and -1 do not fit a resource id,
    // R9 is a number but not held by the cycle
    std::istringstream in("3\n1\nx\n4294967297\n-1\nR9\n1\n");
    std::ostringstream out, err;
    CLI cli(in, out, err);
    cli.set_config(quiet_config());
    cli.choose_algorithm();

    int status = cli.simulate(programs);
    std::string text = out.str();
    assert(status == 0);
    assert(count(text, "Enter the resource ID") == 5);
    assert(count(text, "Invalid input") == 3);
    assert(contains(text, "R1 was released from P1"));
    // Only R9 reaches the engine: printed live and again in the action log
    assert(count(text, "resolution rejected") == 2);
    assert(contains(text, "InvalidResolution"));
    std::cout << "Test 2 passed: invalid answers re-prompted.\n";
  }

  // === Test 3: input closes while a deadlock is pending ===
  {
    std::istringstream in("3\n1\n");
    std::ostringstream out, err;
    CLI cli(in, out, err);
    cli.set_config(quiet_config());
    cli.choose_algorithm();

    assert(cli.simulate(programs) == 2);
    assert(contains(err.str(), "input closed"));
    std::cout << "Test 3 passed: EOF stops the run.\n";
  }

  // === Test 4: menu fallbacks ===
  {
    std::istringstream in("9\n");
    std::ostringstream out, err;
    CLI cli(in, out, err);
    Config cfg = quiet_config();
    cfg.scheduler = SchedulingAlgorithm::SJF;
    cli.set_config(cfg);
    cli.choose_algorithm();
    assert(cli.config().scheduler == SchedulingAlgorithm::FCFS);
    assert(contains(out.str(), "defaulting to FCFS"));

    std::istringstream in2("3\n0\n");
    CLI cli2(in2, out, err);
    cli2.set_config(quiet_config());
    cli2.choose_algorithm();
    assert(cli2.config().scheduler == SchedulingAlgorithm::RR);
    assert(cli2.config().quantum_cycles == 2);
    std::cout << "Test 4 passed: menu fallbacks OK.\n";
  }

  // === Test 5: run() argument handling ===
  {
    std::istringstream in("");
    std::ostringstream out, err;
    CLI cli(in, out, err);

    char prog[] = "procsim";
    char missing[] = "/nonexistent/procsim_programs.txt";
    char *no_args[] = {prog};
    assert(cli.run(1, no_args) == 1);
    assert(contains(err.str(), "Usage"));

    char *bad_file[] = {prog, missing};
    assert(cli.run(2, bad_file) == 1);
    assert(contains(err.str(), "cannot open program file"));
    std::cout << "Test 5 passed: argument errors reported.\n";
  }

  // === Test 6: reporter tables for an aborted process ===
  {
    Config cfg;
    cfg.scheduler = SchedulingAlgorithm::RR;
    cfg.quantum_cycles = 1;
    cfg.num_resources = 2;
    Engine engine(cfg);
    auto defs = ProgramLoader().parse_string(
        "program A\nresource(0, allocate)\nresource(5, allocate)\nend\n"
        "program B\nresource(0, allocate)\nend\n");
    for (auto &p : ProgramLoader::build_processes(defs))
      engine.submit_process(p);
    engine.run();

    Reporter reporter(engine);
    assert(reporter.completed_processes() == "Completed Processes: B");
    assert(contains(reporter.resource_allocation(), "R0: None"));
    assert(contains(reporter.resource_allocation(), "R1: None"));
    assert(reporter.forced_releases().empty());
    assert(contains(reporter.completion_table(), "aborted"));
    assert(contains(reporter.error_summary(), "UnknownResource"));

    std::string log = reporter.action_log();
    assert(contains(log, "allocated resource"));
    assert(contains(log, "blocked on resource"));
    assert(contains(log, "now held by B"));
    assert(contains(log, "ends"));

    auto dir = std::filesystem::temp_directory_path() / "procsim_reporter_test";
    std::filesystem::remove_all(dir);
    auto path = dir / "nested" / "action_log.log";
    reporter.write_log(path.string());

    std::ifstream logfile(path);
    assert(logfile.good());
    std::stringstream written;
    written << logfile.rdbuf();
    assert(contains(written.str(), "Action Log Table:"));
    assert(contains(written.str(), "Errors:"));
    std::filesystem::remove_all(dir);
    std::cout << "Test 6 passed: reporter tables OK.\n";
  }

  std::cout << "All reporter and CLI tests passed.\n";
  return 0;
}
