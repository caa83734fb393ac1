#include "kernel/engine.hpp"
#include "util.hpp"
#include <sstream>

std::string Engine::snapshot() const {
  std::ostringstream oss;
  std::ostringstream oss_mini;

  oss << "- Engine Snapshot ---------------------------------------------------------------------------\n";
  oss << "Tick: " << tick_
      << " Algorithm: " << policy_->name();
  if (policy_->is_preemptive())
    oss << " Quantum: " << policy_->quantum();
  oss << "\n";

  oss << "[Running]: ";
  if (running_)
    oss << running_->summary_line() << "  RR=" << running_->quantum_remaining << "\n";
  else
    oss << "IDLE\n";
  oss << "---------------------------------------------------------------------------------------------\n";

  // --- Ready Queue ---
  oss_mini << "[Ready Queue]\n";
  if (ready_queue_.empty())
    oss_mini << "  (empty)\n";
  for (const auto &p : ready_queue_)
    oss_mini << "  " << p->name() << "\tPID=" << p->id() << "\tleft " << p->remaining_instructions() << "\n";
  std::string ready_string = oss_mini.str();
  oss_mini.str("");

  // --- Blocked ---
  oss_mini << "[Blocked]\n";
  bool any_blocked = false;
  for (const auto &[pid, p] : process_map_) {
    if (!p->is_blocked()) continue;
    any_blocked = true;
    oss_mini << "  " << p->name() << " -> " << resource_label(*p->blocked_on()) << "\n";
  }
  if (!any_blocked)
    oss_mini << "  (none)\n";
  std::string blocked_string = oss_mini.str();
  oss_mini.str("");

  oss << merge_columns(ready_string, blocked_string, (size_t)45, " | ")
      << "\n---------------------------------------------+-----------------------------------------------\n";

  oss << "[Processes]\n";
  for (const auto &[pid, p] : process_map_)
    oss << "  " << p->summary_line() << "\n";

  oss << "[Resources]\n" << table_.snapshot();
  oss << "---------------------------------------------------------------------------------------------\n";
  return oss.str();
}
