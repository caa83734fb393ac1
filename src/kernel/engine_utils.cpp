#include "kernel/engine.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

// This file just contains Engine's accessors and self-checks

uint32_t Engine::current_tick() const { return tick_; }

const std::vector<SimEvent> &Engine::events() const { return events_; }

const std::vector<SimulationError> &Engine::errors() const { return errors_; }

const std::vector<ForcedReleaseResult> &Engine::forced_releases() const { return forced_releases_; }

const ResourceTable &Engine::resources() const { return table_; }

const SchedulingPolicy &Engine::policy() const { return *policy_; }

const Config &Engine::config() const { return cfg_; }

std::vector<ProcessPtr> Engine::processes() const {
  std::vector<ProcessPtr> out;
  out.reserve(process_map_.size());
  for (const auto &[pid, p] : process_map_)
    out.push_back(p);
  return out;
}

ProcessPtr Engine::find(uint32_t pid) const {
  auto it = process_map_.find(pid);
  return (it != process_map_.end()) ? it->second : nullptr;
}

ProcessPtr Engine::require(uint32_t pid) const {
  auto p = find(pid);
  if (!p)
    throw std::logic_error("resource table refers to unknown pid " + std::to_string(pid));
  return p;
}

ProcessPtr Engine::running() const { return running_; }

std::vector<uint32_t> Engine::ready_pids() const {
  std::vector<uint32_t> out;
  for (const auto &p : ready_queue_)
    out.push_back(p->id());
  return out;
}

StateCounts Engine::state_counts() const {
  StateCounts c;
  for (const auto &[pid, p] : process_map_) {
    switch (p->state()) {
    case ProcessState::NEW:        ++c.new_count;  break;
    case ProcessState::READY:      ++c.ready;      break;
    case ProcessState::RUNNING:    ++c.running;    break;
    case ProcessState::BLOCKED:    ++c.blocked;    break;
    case ProcessState::TERMINATED: ++c.terminated; break;
    }
  }
  return c;
}

/**
 * Cross-checks the process records against the resource table.
 * Returns one line per broken invariant; empty means consistent.
 */
std::vector<std::string> Engine::invariant_violations() const {
  std::vector<std::string> out;

  // Owners hold what the table says they own
  for (uint32_t rid : table_.resource_ids()) {
    auto owner = table_.owner_of(rid);
    if (!owner)
      continue;
    auto p = find(*owner);
    if (!p)
      out.push_back(resource_label(rid) + " owned by unknown pid " + std::to_string(*owner));
    else if (p->is_terminated())
      out.push_back(resource_label(rid) + " still owned by terminated " + p->name());
    else if (!p->holds(rid))
      out.push_back(resource_label(rid) + " owner " + p->name() + " does not record it");
  }

  for (const auto &[pid, p] : process_map_) {
    for (uint32_t rid : p->held_resources()) {
      std::optional<uint32_t> owner;
      if (table_.is_declared(rid)) owner = table_.owner_of(rid);
      if (!owner || *owner != pid)
        out.push_back(p->name() + " records " + resource_label(rid) + " it does not own");
    }

    size_t queues = 0;
    for (uint32_t rid : table_.resource_ids()) {
      const auto &w = table_.waiters(rid);
      queues += std::count(w.begin(), w.end(), pid);
    }

    if (p->is_blocked()) {
      if (queues != 1)
        out.push_back(p->name() + " is blocked but sits in " + std::to_string(queues) + " wait queues");
      else if (table_.waiting_on(pid) != p->blocked_on())
        out.push_back(p->name() + " is queued on a different resource than it blocked on");
    } else if (queues != 0) {
      out.push_back(p->name() + " is " + p->get_state_string() + " but still queued");
    }

    bool queued_ready = std::find(ready_queue_.begin(), ready_queue_.end(), p) != ready_queue_.end();
    if (p->is_ready() != queued_ready)
      out.push_back(p->name() + " ready state and ready queue disagree");
    if (p->is_running() != (running_ == p))
      out.push_back(p->name() + " running state and running slot disagree");
  }

  StateCounts c = state_counts();
  if (c.total() != process_map_.size())
    out.push_back("state counts do not add up to the process count");
  if (c.running > 1)
    out.push_back("more than one process is running");

  return out;
}
