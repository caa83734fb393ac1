#include "processes/instruction.hpp"
#include "processes/process.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

int main() {
  std::cout << "Running process unit tests...\n";

  // === Test 1: Process initialization ===
  {
    std::vector<Instruction> ins = {
        {InstructionType::REQUEST, 1},
        {InstructionType::WAIT, 3},
        {InstructionType::END}};
    Process p(4, "P4", ins, 2);

    assert(p.id() == 4);
    assert(p.name() == "P4");
    assert(p.arrival_order() == 2);
    assert(p.is_new());
    assert(p.metrics().total_instructions == 3);
    assert(p.remaining_instructions() == 3);
    assert(p.estimated_burst() == 4); // 1 + 3
    assert(p.summary_line().find("next REQUEST(R1)") != std::string::npos);
    assert(p.current_instruction()->type == InstructionType::REQUEST);
    std::cout << "Test 1 passed: initialization OK.\n";
  }

  // === Test 2: WAIT progress and remaining burst ===
  {
    std::vector<Instruction> ins = {{InstructionType::WAIT, 3}, {InstructionType::END}};
    Process p(1, "sleeper", ins);

    p.begin_wait(3);
    assert(!p.tick_wait());
    assert(p.wait_remaining() == 2);
    assert(p.remaining_estimated_burst() == 2); // 2 left
    assert(!p.tick_wait());
    assert(p.tick_wait());
    p.advance_pc();
    assert(p.pc() == 1);
    assert(p.remaining_instructions() == 1);
    assert(p.remaining_estimated_burst() == 0);
    assert(p.metrics().executed_instructions == 1);
    std::cout << "Test 2 passed: WAIT bookkeeping OK.\n";
  }

  // === Test 3: State transitions ===
  {
    Process p(2, "P2", {{InstructionType::REQUEST, 0}, {InstructionType::END}});
    p.mark_ready();
    assert(p.is_ready());
    p.mark_running(3);
    assert(p.is_running());
    assert(p.metrics().started && p.metrics().first_run_tick == 3);
    p.mark_blocked(0);
    assert(p.is_blocked());
    assert(p.blocked_on() == 0u);
    p.mark_ready();
    assert(!p.blocked_on());
    p.mark_running(8);
    assert(p.metrics().first_run_tick == 3); // first dispatch only
    p.mark_terminated(10);
    assert(p.is_terminated());
    assert(p.turnaround() == 10);
    std::cout << "Test 3 passed: transitions OK.\n";
  }

  // === Test 4: Terminated is absorbing ===
  {
    Process p(3, "P3", {});
    p.mark_terminated(0);
    bool threw = false;
    try {
      p.mark_ready();
    } catch (const std::logic_error &) {
      threw = true;
    }
    assert(threw);
    assert(p.is_terminated());
    assert(!p.current_instruction());
    std::cout << "Test 4 passed: TERMINATED is final.\n";
  }

  // === Test 5: Held resources and abort ===
  {
    Process p(5, "P5", {{InstructionType::REQUEST, 9}});
    p.hold(2);
    p.hold(2);
    p.hold(4);
    assert(p.held_resources().size() == 2);
    assert(p.holds(4));
    p.drop(4);
    assert(!p.holds(4));

    p.mark_aborted(6);
    assert(p.is_aborted() && p.is_terminated());
    assert(p.metrics().completion_tick == 6);
    std::cout << "Test 5 passed: held set and abort OK.\n";
  }

  // === Test 6: Instruction helpers ===
  {
    assert(instruction_to_string({InstructionType::REQUEST, 3}) == "REQUEST(R3)");
    assert(instruction_to_string({InstructionType::WAIT, 2}) == "WAIT(2)");
    assert(instruction_to_string({InstructionType::END}) == "END");
    assert(instruction_cost({InstructionType::WAIT, 7}) == 7);
    assert(instruction_cost({InstructionType::REQUEST, 4}) == 1);
    assert(instruction_cost({InstructionType::END}) == 0);
    std::cout << "Test 6 passed: instruction helpers OK.\n";
  }

  std::cout << "All process tests passed.\n";
  return 0;
}
