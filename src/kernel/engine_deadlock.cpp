#include "kernel/engine.hpp"
#include "util.hpp"
#include <algorithm>

// === Deadlock ===

// Runs after every fresh block. Each resolution can leave another cycle
// behind, so keep going until the graph is clean.
void Engine::check_deadlock() {
  while (true) {
    DeadlockReport report = detector_.detect(processes(), table_, tick_);
    if (!report.found())
      return;

    PROCSIM_DEBUG_PRINT(PROCSIM_DEBUG_ENGINE, "tick %u deadlock over %zu processes",
                        tick_, report.cycle.size());
    emit({.type = SimEventType::DEADLOCK_DETECTED,
          .tick = tick_,
          .involved = report.cycle,
          .resources = report.resources});
    resolve_deadlock(report);
  }
}

void Engine::resolve_deadlock(const DeadlockReport &report) {
  if (!resolver_) {
    SimulationError err(ErrorKind::UNRESOLVED_DEADLOCK,
                        "deadlock between " + join_ids(report.cycle, "PID=") +
                            " and no resolver is installed",
                        tick_);
    errors_.push_back(err);
    throw err;
  }

  uint32_t attempts = 0;
  while (true) {
    uint32_t resource_id = resolver_(report);
    if (is_valid_resolution(report, resource_id)) {
      apply_forced_release(resource_id);
      return;
    }

    ++attempts;
    errors_.emplace_back(ErrorKind::INVALID_RESOLUTION,
                         "resource is not held by a deadlocked process",
                         tick_, std::nullopt, resource_id);
    emit({.type = SimEventType::RESOLUTION_REJECTED, .tick = tick_,
          .resource_id = resource_id, .involved = report.cycle,
          .resources = report.resources});

    if (cfg_.max_resolution_attempts > 0 && attempts >= cfg_.max_resolution_attempts)
      throw SimulationError(ErrorKind::INVALID_RESOLUTION,
                            "giving up after " + std::to_string(attempts) + " invalid answers",
                            tick_, std::nullopt, resource_id);
  }
}

// The chosen resource must currently be owned by one of the cycle's processes
bool Engine::is_valid_resolution(const DeadlockReport &report, uint32_t resource_id) const {
  if (!table_.is_declared(resource_id))
    return false;
  auto owner = table_.owner_of(resource_id);
  if (!owner)
    return false;
  return std::find(report.cycle.begin(), report.cycle.end(), *owner) != report.cycle.end();
}

// The former owner loses the resource for good and keeps its own state
void Engine::apply_forced_release(uint32_t resource_id) {
  ForcedReleaseResult result = table_.force_release(resource_id);
  if (result.former_owner)
    require(*result.former_owner)->drop(resource_id);
  forced_releases_.push_back(result);

  emit({.type = SimEventType::FORCED_RELEASE, .tick = tick_, .pid = result.former_owner,
        .resource_id = resource_id, .new_owner = result.new_owner});

  if (result.new_owner)
    grant_waiter(*result.new_owner, resource_id);
}
