#pragma once
#include "kernel/engine.hpp"
#include "kernel/sim_event.hpp"
#include <string>

/**
 * Renders the engine's event stream and final state as text tables.
 * Read-only: never touches engine state.
 */
class Reporter {
public:
  Reporter(const Engine &engine);
  std::string build_report(); // everything printed at the end of a run
  std::string completed_processes();
  std::string resource_allocation();
  std::string forced_releases();
  std::string completion_table();
  std::string action_log();
  std::string error_summary();

  std::string describe(const SimEvent &event) const; // one action-log row
  void write_log(const std::string &path);

private:
  std::string process_label(std::optional<uint32_t> pid) const;
  const Engine &engine_;
};
