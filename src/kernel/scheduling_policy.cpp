#include "kernel/scheduling_policy.hpp"
#include <algorithm>
#include <stdexcept>

static ProcessCmpFn sjf_instructions_cmp = [](const ProcessPtr &a, const ProcessPtr &b) {
  if (a->remaining_instructions() != b->remaining_instructions())
    return a->remaining_instructions() < b->remaining_instructions();
  if (a->arrival_order() != b->arrival_order())
    return a->arrival_order() < b->arrival_order();
  return a->id() < b->id();
};

static ProcessCmpFn sjf_burst_cmp = [](const ProcessPtr &a, const ProcessPtr &b) {
  if (a->remaining_estimated_burst() != b->remaining_estimated_burst())
    return a->remaining_estimated_burst() < b->remaining_estimated_burst();
  if (a->arrival_order() != b->arrival_order())
    return a->arrival_order() < b->arrival_order();
  return a->id() < b->id();
};

ProcessPtr FcfsPolicy::pick_next(const std::deque<ProcessPtr> &ready) const {
  if (ready.empty())
    return nullptr;
  return ready.front();
}

SjfPolicy::SjfPolicy(SjfMetric metric)
    : metric_(metric),
      comparator_(metric == SjfMetric::BURST ? sjf_burst_cmp : sjf_instructions_cmp) {}

// Remaining length is recomputed on every pick
ProcessPtr SjfPolicy::pick_next(const std::deque<ProcessPtr> &ready) const {
  if (ready.empty())
    return nullptr;
  return *std::min_element(ready.begin(), ready.end(), comparator_);
}

RoundRobinPolicy::RoundRobinPolicy(uint32_t quantum) : quantum_(quantum) {
  if (quantum_ == 0)
    throw std::invalid_argument("round robin quantum must be at least 1");
}

ProcessPtr RoundRobinPolicy::pick_next(const std::deque<ProcessPtr> &ready) const {
  if (ready.empty())
    return nullptr;
  return ready.front();
}

std::unique_ptr<SchedulingPolicy> make_policy(const Config &cfg) {
  switch (cfg.scheduler) {
  case RR:
    return std::make_unique<RoundRobinPolicy>(cfg.quantum_cycles);
  case SJF:
    return std::make_unique<SjfPolicy>(cfg.sjf_metric);
  case FCFS:
  default:
    return std::make_unique<FcfsPolicy>();
  }
}
