#pragma once
#include "config.hpp"
#include "kernel/engine.hpp"
#include "processes/program_loader.hpp"
#include <iostream>
#include <string>
#include <vector>

// Interactive front end: picks the scheduler, runs the engine, and asks the
// operator which resource to free whenever a deadlock shows up.
class CLI {
public:
  CLI(std::istream &in = std::cin, std::ostream &out = std::cout, std::ostream &err = std::cerr);
  int run(int argc, char **argv); // returns exit code

  void choose_algorithm();
  int simulate(const std::vector<ProgramDefinition> &programs);

  const Config &config() const { return cfg_; }
  void set_config(const Config &cfg) { cfg_ = cfg; }

private:
  bool read_line(std::string &line);
  uint32_t prompt_resolution(const Engine &engine, const DeadlockReport &report);

  Config cfg_;
  std::istream &in_;
  std::ostream &out_;
  std::ostream &err_;
};
