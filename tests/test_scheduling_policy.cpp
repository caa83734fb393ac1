#include "config.hpp"
#include "kernel/scheduling_policy.hpp"
#include "processes/process.hpp"
#include <cassert>
#include <deque>
#include <iostream>
#include <stdexcept>

static ProcessPtr make(uint32_t id, uint32_t arrival, std::vector<Instruction> ins) {
  return std::make_shared<Process>(id, "P" + std::to_string(id), ins, arrival);
}

static std::vector<Instruction> waits(uint32_t count, uint32_t ticks = 1) {
  std::vector<Instruction> ins(count, Instruction{InstructionType::WAIT, ticks});
  ins.push_back({InstructionType::END});
  return ins;
}

int main() {
  std::cout << "Running scheduling policy tests...\n";

  // === Test 1: FCFS takes the head and leaves the queue alone ===
  {
    FcfsPolicy fcfs;
    std::deque<ProcessPtr> ready = {make(3, 0, waits(5)), make(1, 1, waits(1))};
    assert(fcfs.pick_next(ready)->id() == 3);
    assert(ready.size() == 2);
    assert(!fcfs.is_preemptive());
    assert(fcfs.name() == "FCFS");
    assert(fcfs.pick_next({}) == nullptr);
    std::cout << "Test 1 passed: FCFS OK.\n";
  }

  // === Test 2: SJF by remaining instruction count ===
  {
    SjfPolicy sjf;
    std::deque<ProcessPtr> ready = {make(1, 0, waits(4)), make(2, 1, waits(1)), make(3, 2, waits(2))};
    assert(sjf.pick_next(ready)->id() == 2);
    assert(ready.size() == 3);

    // Remaining count is recomputed: advance P1 until it is the shortest
    for (int i = 0; i < 4; ++i) ready[0]->advance_pc();
    assert(sjf.pick_next(ready)->id() == 1);
    std::cout << "Test 2 passed: SJF picks the shortest.\n";
  }

  // === Test 3: SJF ties: arrival order, then id ===
  {
    SjfPolicy sjf;
    std::deque<ProcessPtr> by_arrival = {make(1, 4, waits(2)), make(2, 3, waits(2))};
    assert(sjf.pick_next(by_arrival)->id() == 2);

    for (int run = 0; run < 3; ++run) {
      std::deque<ProcessPtr> by_id = {make(9, 0, waits(2)), make(5, 0, waits(2)), make(7, 0, waits(2))};
      assert(sjf.pick_next(by_id)->id() == 5);
    }
    std::cout << "Test 3 passed: SJF tie-break deterministic.\n";
  }

  // === Test 4: SJF by estimated burst ===
  {
    SjfPolicy sjf(SjfMetric::BURST);
    // P1: one long wait (burst 10), P2: two short waits (burst 2)
    std::deque<ProcessPtr> ready = {make(1, 0, waits(1, 10)), make(2, 1, waits(2))};
    assert(sjf.pick_next(ready)->id() == 2);
    assert(SjfPolicy().pick_next(ready)->id() == 1);
    std::cout << "Test 4 passed: SJF burst metric OK.\n";
  }

  // === Test 5: Round Robin ===
  {
    RoundRobinPolicy rr(3);
    std::deque<ProcessPtr> ready = {make(2, 1, waits(1)), make(1, 0, waits(9))};
    assert(rr.pick_next(ready)->id() == 2);
    assert(rr.is_preemptive());
    assert(rr.quantum() == 3);

    bool threw = false;
    try {
      RoundRobinPolicy bad(0);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
    std::cout << "Test 5 passed: RR OK.\n";
  }

  // === Test 6: make_policy follows the config ===
  {
    Config cfg;
    assert(make_policy(cfg)->algorithm() == SchedulingAlgorithm::FCFS);
    cfg.scheduler = SchedulingAlgorithm::SJF;
    assert(make_policy(cfg)->algorithm() == SchedulingAlgorithm::SJF);
    cfg.scheduler = SchedulingAlgorithm::RR;
    cfg.quantum_cycles = 4;
    auto rr = make_policy(cfg);
    assert(rr->algorithm() == SchedulingAlgorithm::RR);
    assert(rr->quantum() == 4);
    std::cout << "Test 6 passed: make_policy OK.\n";
  }

  std::cout << "All scheduling policy tests passed.\n";
  return 0;
}
