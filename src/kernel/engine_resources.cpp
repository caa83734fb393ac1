#include "kernel/engine.hpp"
#include "util.hpp"

// === Instructions ===

void Engine::execute_request(const ProcessPtr &p, uint32_t resource_id) {
  ++tick_;

  if (!table_.is_declared(resource_id)) {
    abort_process(p, resource_id);
    return;
  }

  if (table_.try_acquire(resource_id, p->id()) == AcquireResult::GRANTED) {
    p->hold(resource_id);
    p->advance_pc();
    emit({.type = SimEventType::RESOURCE_GRANTED, .tick = tick_, .pid = p->id(),
          .resource_id = resource_id});
    after_timed_step(p);
    return;
  }

  // pc stays on the request; it is retried once the resource is handed over
  p->mark_blocked(resource_id);
  running_.reset();
  emit({.type = SimEventType::RESOURCE_BLOCKED, .tick = tick_, .pid = p->id(),
        .resource_id = resource_id});
  check_deadlock();
}

void Engine::execute_wait(const ProcessPtr &p, uint32_t ticks) {
  if (ticks == 0) {
    p->advance_pc();
    return;
  }

  ++tick_;
  if (!p->in_wait())
    p->begin_wait(ticks);

  bool done = p->tick_wait();
  emit({.type = SimEventType::PROCESS_WAITED, .tick = tick_, .pid = p->id(),
        .value = p->wait_remaining()});
  if (done)
    p->advance_pc();

  after_timed_step(p);
}

void Engine::terminate(const ProcessPtr &p) {
  p->mark_terminated(tick_);
  if (running_ == p)
    running_.reset();

  PROCSIM_DEBUG_PRINT(PROCSIM_DEBUG_ENGINE, "tick %u pid %u terminated", tick_, p->id());
  emit({.type = SimEventType::PROCESS_TERMINATED, .tick = tick_, .pid = p->id(),
        .value = p->turnaround()});
  release_held(p);
}

void Engine::abort_process(const ProcessPtr &p, uint32_t resource_id) {
  errors_.emplace_back(ErrorKind::UNKNOWN_RESOURCE,
                       p->name() + " requested a resource that was never declared",
                       tick_, p->id(), resource_id);

  p->mark_aborted(tick_);
  if (running_ == p)
    running_.reset();

  emit({.type = SimEventType::PROCESS_ABORTED, .tick = tick_, .pid = p->id(),
        .resource_id = resource_id});
  release_held(p);
}

void Engine::release_held(const ProcessPtr &p) {
  for (const auto &handoff : table_.release_all(p->id())) {
    p->drop(handoff.resource_id);
    emit({.type = SimEventType::RESOURCE_RELEASED, .tick = tick_, .pid = p->id(),
          .resource_id = handoff.resource_id, .new_owner = handoff.new_owner});
    if (handoff.new_owner)
      grant_waiter(*handoff.new_owner, handoff.resource_id);
  }
}

// Blocked -> Ready; the table already made pid the owner
void Engine::grant_waiter(uint32_t pid, uint32_t resource_id) {
  ProcessPtr q = require(pid);
  q->hold(resource_id);
  q->mark_ready();
  enqueue_ready(q);
}
