#include "view/reporter.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Reporter::Reporter(const Engine &engine) : engine_(engine) {}

std::string Reporter::process_label(std::optional<uint32_t> pid) const {
  if (!pid)
    return "SYSTEM";
  auto p = engine_.find(*pid);
  return p ? p->name() : "PID=" + std::to_string(*pid);
}

std::string Reporter::describe(const SimEvent &e) const {
  std::string process = process_label(e.pid);
  std::string action;
  std::string res = e.resource_id ? resource_label(*e.resource_id) : "";
  std::ostringstream note;

  auto names = [this](const std::vector<uint32_t> &pids) {
    std::ostringstream oss;
    for (size_t i = 0; i < pids.size(); ++i)
      oss << (i ? ", " : "") << process_label(pids[i]);
    return oss.str();
  };

  switch (e.type) {
  case SimEventType::PROCESS_DISPATCHED:
    action = "dispatched";
    break;
  case SimEventType::PROCESS_WAITED:
    action = "waits";
    note << "1 tick, " << e.value << " left";
    break;
  case SimEventType::PROCESS_PREEMPTED:
    action = "re-queued";
    note << "quantum expired";
    break;
  case SimEventType::RESOURCE_GRANTED:
    action = "allocated resource";
    break;
  case SimEventType::RESOURCE_BLOCKED:
    action = "blocked on resource";
    break;
  case SimEventType::RESOURCE_RELEASED:
    action = "released resource";
    if (e.new_owner) note << "now held by " << process_label(e.new_owner);
    break;
  case SimEventType::DEADLOCK_DETECTED:
    process = "SYSTEM";
    action = "deadlock detected";
    note << "Involving " << names(e.involved);
    break;
  case SimEventType::FORCED_RELEASE:
    process = "SYSTEM";
    action = "force released resource";
    note << "from " << process_label(e.pid);
    if (e.new_owner) note << ", now held by " << process_label(e.new_owner);
    break;
  case SimEventType::RESOLUTION_REJECTED:
    process = "SYSTEM";
    action = "resolution rejected";
    note << "not held by " << names(e.involved);
    break;
  case SimEventType::PROCESS_TERMINATED:
    action = "ends";
    note << "turnaround " << e.value;
    break;
  case SimEventType::PROCESS_ABORTED:
    action = "aborted";
    note << "unknown resource";
    break;
  }

  std::ostringstream oss;
  oss << std::left << std::setw(6) << e.tick << " "
      << std::setw(8) << process << " "
      << std::setw(25) << action << " "
      << std::setw(5) << res;
  std::string n = note.str();
  if (!n.empty())
    oss << " (" << n << ")";
  return oss.str();
}

std::string Reporter::build_report() {
  std::ostringstream oss;
  oss << "\nSimulation Complete! (" << engine_.policy().name()
      << ", " << engine_.current_tick() << " ticks)\n"
      << completed_processes() << "\n"
      << resource_allocation()
      << forced_releases() << "\n"
      << completion_table() << "\n"
      << action_log();
  std::string errors = error_summary();
  if (!errors.empty())
    oss << "\n" << errors;
  return oss.str();
}

std::string Reporter::completed_processes() {
  std::vector<std::string> done;
  for (const auto &p : engine_.processes())
    if (p->is_terminated() && !p->is_aborted())
      done.push_back(p->name());
  std::sort(done.begin(), done.end());

  std::ostringstream oss;
  oss << "Completed Processes: ";
  for (size_t i = 0; i < done.size(); ++i)
    oss << (i ? ", " : "") << done[i];
  if (done.empty())
    oss << "(none)";
  return oss.str();
}

std::string Reporter::resource_allocation() {
  const auto &table = engine_.resources();
  std::ostringstream oss;
  oss << "Final Resource Allocation:\n";
  for (uint32_t rid : table.resource_ids()) {
    auto owner = table.owner_of(rid);
    oss << "  " << resource_label(rid) << ": " << (owner ? process_label(owner) : "None") << "\n";
  }
  return oss.str();
}

std::string Reporter::forced_releases() {
  const auto &releases = engine_.forced_releases();
  if (releases.empty())
    return "";
  std::ostringstream oss;
  oss << "Force Released Resources:\n";
  for (const auto &r : releases)
    oss << "  " << resource_label(r.resource_id) << " was released from "
        << process_label(r.former_owner) << "\n";
  return oss.str();
}

// Processes in the order they finished; unfinished ones last
std::string Reporter::completion_table() {
  auto procs = engine_.processes();
  std::stable_sort(procs.begin(), procs.end(), [](const ProcessPtr &a, const ProcessPtr &b) {
    if (a->is_terminated() != b->is_terminated())
      return a->is_terminated();
    return a->metrics().completion_tick < b->metrics().completion_tick;
  });

  std::ostringstream oss;
  oss << "Process Completion Table:\n"
      << std::left << std::setw(10) << "Process"
      << std::setw(10) << "Arrival"
      << std::setw(10) << "Start"
      << std::setw(10) << "Finish"
      << std::setw(15) << "Turnaround"
      << std::setw(10) << "Burst Est." << "\n";

  for (const auto &p : procs) {
    const auto &m = p->metrics();
    oss << std::setw(10) << p->name()
        << std::setw(10) << m.arrival_tick
        << std::setw(10) << (m.started ? std::to_string(m.first_run_tick) : "-")
        << std::setw(10) << (p->is_terminated() ? std::to_string(m.completion_tick) : "-");
    if (p->is_aborted())
      oss << std::setw(15) << "aborted";
    else if (p->is_terminated())
      oss << std::setw(15) << p->turnaround();
    else
      oss << std::setw(15) << "-";
    oss << std::setw(10) << p->estimated_burst() << "\n";
  }
  return oss.str();
}

std::string Reporter::action_log() {
  std::ostringstream oss;
  oss << "Action Log Table:\n"
      << std::left << std::setw(6) << "Tick" << " "
      << std::setw(8) << "Process" << " "
      << std::setw(25) << "Action" << " "
      << std::setw(5) << "Res" << " Note\n";
  for (const auto &e : engine_.events())
    oss << describe(e) << "\n";
  return oss.str();
}

std::string Reporter::error_summary() {
  const auto &errors = engine_.errors();
  if (errors.empty())
    return "";
  std::ostringstream oss;
  oss << "Errors:\n";
  for (const auto &err : errors)
    oss << "  " << err.what() << "\n";
  return oss.str();
}

void Reporter::write_log(const std::string &path) {
  std::filesystem::path file(path);
  if (file.has_parent_path())
    std::filesystem::create_directories(file.parent_path());

  std::ofstream out(file);
  if (!out)
    throw std::runtime_error("cannot write log file '" + path + "'");
  out << action_log();
  std::string errors = error_summary();
  if (!errors.empty())
    out << "\n" << errors;
}
