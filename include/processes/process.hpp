#pragma once
#include "processes/instruction.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class ProcessState {
  NEW,
  READY,
  RUNNING,
  BLOCKED,
  TERMINATED,
};

std::string process_state_to_string(ProcessState s);

/**
 * Timing counters for a process, all in simulated ticks.
 */
struct ProcessMetrics {
  uint32_t arrival_tick{0};
  uint32_t first_run_tick{0};
  uint32_t completion_tick{0};
  uint32_t executed_instructions{0};
  uint32_t total_instructions{0};
  bool started{false};
};

/**
 * A process is a linear script of resource requests, waits and an end.
 * The Engine owns every Process and drives all of its transitions; the
 * class itself only keeps the record consistent.
 */
class Process {
public:
  Process(uint32_t id, const std::string &name, std::vector<Instruction> ins,
          uint32_t arrival_order = 0);

  uint32_t id() const;
  std::string name() const;
  uint32_t arrival_order() const;
  ProcessState state() const;
  std::string get_state_string() const;

  // === Scheduler metadata ===
  uint32_t quantum_remaining{0}; // RR bookkeeping

  // === Script ===
  const std::vector<Instruction> &instructions() const;
  const Instruction *current_instruction() const; // nullptr when script is exhausted
  uint32_t pc() const;
  void advance_pc();
  uint32_t remaining_instructions() const noexcept;
  uint32_t estimated_burst() const;           // whole script
  uint32_t remaining_estimated_burst() const; // from pc on

  // === Computation waits ===
  bool in_wait() const noexcept;
  uint32_t wait_remaining() const noexcept;
  void begin_wait(uint32_t ticks);
  // Consume one tick of the current wait, returns true once it is over
  bool tick_wait();

  // === Held resources ===
  void hold(uint32_t resource_id);
  void drop(uint32_t resource_id);
  bool holds(uint32_t resource_id) const;
  const std::set<uint32_t> &held_resources() const;
  std::optional<uint32_t> blocked_on() const;

  // === State Query Helpers ===
  bool is_new() const noexcept;
  bool is_ready() const noexcept;
  bool is_running() const noexcept;
  bool is_blocked() const noexcept;
  bool is_terminated() const noexcept;
  bool is_aborted() const noexcept;

  // === State Transition Helpers ===
  void mark_ready();
  void mark_running(uint32_t tick);
  void mark_blocked(uint32_t resource_id);
  void mark_terminated(uint32_t tick);
  void mark_aborted(uint32_t tick);

  const ProcessMetrics &metrics() const;
  uint32_t turnaround() const;
  std::string summary_line() const;

private:
  void set_state(ProcessState s);

  uint32_t m_id;
  std::string m_name;
  uint32_t m_arrival_order;
  std::vector<Instruction> m_instr;
  ProcessState m_state{ProcessState::NEW};
  uint32_t m_pc{0};

  std::set<uint32_t> m_held;
  std::optional<uint32_t> m_blocked_on;
  uint32_t m_wait_remaining{0};
  bool m_aborted{false};
  ProcessMetrics m_metrics;
};

using ProcessPtr = std::shared_ptr<Process>;
