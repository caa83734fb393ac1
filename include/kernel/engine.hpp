#pragma once

#include "config.hpp"
#include "util.hpp"
#include "processes/process.hpp"
#include "kernel/resource_table.hpp"
#include "kernel/deadlock_detector.hpp"
#include "kernel/scheduling_policy.hpp"
#include "kernel/sim_event.hpp"
#include "kernel/sim_error.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Chooses the resource to force-release when a cycle is found. Called
// synchronously; the simulation does not move until it returns.
using DeadlockResolver = std::function<uint32_t(const DeadlockReport &)>;

struct StateCounts {
  size_t new_count{0};
  size_t ready{0};
  size_t running{0};
  size_t blocked{0};
  size_t terminated{0};

  size_t total() const { return new_count + ready + running + blocked + terminated; }
};

/**
 * Drives the simulation: one instruction step of the running process per
 * call to step(). Logically single-threaded; resolver and observers run on
 * the caller's thread.
 */
class Engine {
public:
  explicit Engine(const Config &cfg);
  Engine(const Config &cfg, std::unique_ptr<SchedulingPolicy> policy);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  // === Setup ===
  void submit_process(ProcessPtr p);
  void set_resolver(DeadlockResolver resolver);
  void add_observer(EventSink sink);

  // === Main Loop ===
  void run();  // until every process is terminated
  bool step(); // one scheduling decision; false once everything is terminated
  bool is_finished() const;

  // === Diagnostics ===
  uint32_t current_tick() const;
  const std::vector<SimEvent> &events() const;
  const std::vector<SimulationError> &errors() const;
  const std::vector<ForcedReleaseResult> &forced_releases() const;
  const ResourceTable &resources() const;
  const SchedulingPolicy &policy() const;
  const Config &config() const;
  std::vector<ProcessPtr> processes() const; // ascending pid
  ProcessPtr find(uint32_t pid) const;
  ProcessPtr running() const;
  std::vector<uint32_t> ready_pids() const;
  StateCounts state_counts() const;
  std::vector<std::string> invariant_violations() const;
  std::string snapshot() const;

private:
  // === Scheduling ===
  void admit_new();
  void dispatch();
  void execute_step(const ProcessPtr &p);
  void after_timed_step(const ProcessPtr &p);
  void enqueue_ready(const ProcessPtr &p);
  void handle_stall();

  // === Instructions ===
  void execute_request(const ProcessPtr &p, uint32_t resource_id);
  void execute_wait(const ProcessPtr &p, uint32_t ticks);
  void terminate(const ProcessPtr &p);
  void abort_process(const ProcessPtr &p, uint32_t resource_id);
  void release_held(const ProcessPtr &p);
  void grant_waiter(uint32_t pid, uint32_t resource_id);

  // === Deadlock ===
  void check_deadlock();
  void resolve_deadlock(const DeadlockReport &report);
  bool is_valid_resolution(const DeadlockReport &report, uint32_t resource_id) const;
  void apply_forced_release(uint32_t resource_id);

  void emit(SimEvent event);
  ProcessPtr require(uint32_t pid) const;

  Config cfg_;
  std::unique_ptr<SchedulingPolicy> policy_;
  ResourceTable table_;
  DeadlockDetector detector_;
  DeadlockResolver resolver_;
  std::vector<EventSink> observers_;

  uint32_t tick_{0};
  bool admitted_{false};

  // === Queues ===
  std::map<uint32_t, ProcessPtr> process_map_; // every process, by pid
  std::deque<ProcessPtr> ready_queue_;
  ProcessPtr running_;

  // === Records ===
  std::vector<SimEvent> events_;
  std::vector<SimulationError> errors_;
  std::vector<ForcedReleaseResult> forced_releases_;
};
