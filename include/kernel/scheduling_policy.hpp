#pragma once

#include "config.hpp"
#include "processes/process.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <string>

using ProcessCmpFn = std::function<bool(const ProcessPtr&, const ProcessPtr&)>;

/**
 * Ready-set ordering strategy. pick_next only chooses; admitting to and
 * removing from the ready queue is the Engine's job.
 */
class SchedulingPolicy {
public:
  virtual ~SchedulingPolicy() = default;

  // Returns nullptr when ready is empty
  virtual ProcessPtr pick_next(const std::deque<ProcessPtr> &ready) const = 0;

  virtual SchedulingAlgorithm algorithm() const = 0;
  virtual bool is_preemptive() const { return false; }
  virtual uint32_t quantum() const { return 0; }
  std::string name() const { return algorithm_name(algorithm()); }
};

// Head of the queue; the queue itself is kept in FIFO order.
class FcfsPolicy : public SchedulingPolicy {
public:
  ProcessPtr pick_next(const std::deque<ProcessPtr> &ready) const override;
  SchedulingAlgorithm algorithm() const override { return SchedulingAlgorithm::FCFS; }
};

class SjfPolicy : public SchedulingPolicy {
public:
  explicit SjfPolicy(SjfMetric metric = SjfMetric::INSTRUCTIONS);
  ProcessPtr pick_next(const std::deque<ProcessPtr> &ready) const override;
  SchedulingAlgorithm algorithm() const override { return SchedulingAlgorithm::SJF; }
  SjfMetric metric() const { return metric_; }

private:
  SjfMetric metric_;
  ProcessCmpFn comparator_;
};

class RoundRobinPolicy : public SchedulingPolicy {
public:
  explicit RoundRobinPolicy(uint32_t quantum);
  ProcessPtr pick_next(const std::deque<ProcessPtr> &ready) const override;
  SchedulingAlgorithm algorithm() const override { return SchedulingAlgorithm::RR; }
  bool is_preemptive() const override { return true; }
  uint32_t quantum() const override { return quantum_; }

private:
  uint32_t quantum_;
};

std::unique_ptr<SchedulingPolicy> make_policy(const Config &cfg);
