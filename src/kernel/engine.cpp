#include "kernel/engine.hpp"
#include "kernel/scheduling_policy.hpp"
#include "processes/process.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>


Engine::Engine(const Config &cfg)
    : Engine(cfg, make_policy(cfg)) {}

Engine::Engine(const Config &cfg, std::unique_ptr<SchedulingPolicy> policy)
    : cfg_(cfg),
      policy_(std::move(policy)),
      table_(cfg.num_resources)
{
  if (!policy_)
    throw std::invalid_argument("Engine needs a scheduling policy");
}

// === Setup ===

void Engine::submit_process(ProcessPtr p) {
  if (!p)
    throw std::invalid_argument("submit_process called with null process");
  if (admitted_)
    throw std::logic_error("processes must be submitted before the simulation starts");
  if (process_map_.count(p->id()))
    throw std::invalid_argument("duplicate process id " + std::to_string(p->id()));
  process_map_[p->id()] = std::move(p);
}

void Engine::set_resolver(DeadlockResolver resolver) {
  resolver_ = std::move(resolver);
}

void Engine::add_observer(EventSink sink) {
  if (sink) observers_.push_back(std::move(sink));
}

// === Main Loop ===

void Engine::run() {
  while (step())
    ;
}

bool Engine::step() {
  if (!admitted_)
    admit_new();

  if (is_finished())
    return false;

  if (!running_) {
    if (ready_queue_.empty()) {
      // Only blocked processes left: nothing moves until the cycle is broken
      handle_stall();
      return true;
    }
    dispatch();
  }

  // Blocking, preemption and termination clear running_; keep our own reference
  ProcessPtr current = running_;
  execute_step(current);
  return true;
}

bool Engine::is_finished() const {
  return std::all_of(process_map_.begin(), process_map_.end(),
                     [](const auto &entry) { return entry.second->is_terminated(); });
}

// === Scheduling ===

// Everything arrives at tick 0, in arrival order
void Engine::admit_new() {
  std::vector<ProcessPtr> arriving;
  for (const auto &[pid, p] : process_map_)
    if (p->is_new()) arriving.push_back(p);

  std::sort(arriving.begin(), arriving.end(), [](const ProcessPtr &a, const ProcessPtr &b) {
    if (a->arrival_order() != b->arrival_order())
      return a->arrival_order() < b->arrival_order();
    return a->id() < b->id();
  });

  for (const auto &p : arriving) {
    p->mark_ready();
    ready_queue_.push_back(p);
  }
  admitted_ = true;
}

void Engine::dispatch() {
  ProcessPtr p = policy_->pick_next(ready_queue_);
  if (!p)
    throw std::logic_error(policy_->name() + " policy picked nothing from a non-empty ready queue");

  auto it = std::find(ready_queue_.begin(), ready_queue_.end(), p);
  if (it == ready_queue_.end())
    throw std::logic_error(policy_->name() + " policy picked a process outside the ready queue");
  ready_queue_.erase(it);

  p->mark_running(tick_);
  p->quantum_remaining = policy_->quantum();
  running_ = p;

  PROCSIM_DEBUG_PRINT(PROCSIM_DEBUG_ENGINE, "tick %u dispatch pid %u", tick_, p->id());
  emit({.type = SimEventType::PROCESS_DISPATCHED, .tick = tick_, .pid = p->id()});
}

void Engine::execute_step(const ProcessPtr &p) {
  const Instruction *ins = p->current_instruction();

  // Script ran out without an END: terminates on dispatch, costs no tick
  if (!ins) {
    terminate(p);
    return;
  }

  switch (ins->type) {
  case InstructionType::REQUEST:
    execute_request(p, ins->arg);
    break;
  case InstructionType::WAIT:
    execute_wait(p, ins->arg);
    break;
  case InstructionType::END:
    ++tick_;
    p->advance_pc();
    terminate(p);
    break;
  }
}

// RR bookkeeping after a step that consumed a tick and left p running
void Engine::after_timed_step(const ProcessPtr &p) {
  if (!policy_->is_preemptive() || running_ != p)
    return;

  if (p->quantum_remaining > 0)
    --p->quantum_remaining;
  if (p->quantum_remaining > 0)
    return;

  // Time to preempt
  p->mark_ready();
  running_.reset();
  ready_queue_.push_back(p);
  emit({.type = SimEventType::PROCESS_PREEMPTED, .tick = tick_, .pid = p->id()});
}

void Engine::enqueue_ready(const ProcessPtr &p) {
  if (!p || p->is_terminated()) return;
  if (std::find(ready_queue_.begin(), ready_queue_.end(), p) != ready_queue_.end()) return;
  ready_queue_.push_back(p);
}

void Engine::handle_stall() {
  DeadlockReport report = detector_.detect(processes(), table_, tick_);
  if (!report.found()) {
    SimulationError err(ErrorKind::STALL_WITHOUT_CYCLE,
                        "no process can run and the wait-for graph has no cycle", tick_);
    errors_.push_back(err);
    throw err;
  }

  emit({.type = SimEventType::DEADLOCK_DETECTED,
        .tick = tick_,
        .involved = report.cycle,
        .resources = report.resources});
  resolve_deadlock(report);
}

void Engine::emit(SimEvent event) {
  PROCSIM_DEBUG_PRINT(PROCSIM_DEBUG_ENGINE, "tick %u %s", event.tick,
                      event_type_to_string(event.type).c_str());
  events_.push_back(event);
  for (const auto &sink : observers_)
    sink(event);
}
