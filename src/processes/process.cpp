#include "processes/process.hpp"
#include "processes/instruction.hpp"
#include "util.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

/**
 * Convert process state enum to readable string
 */
std::string process_state_to_string(ProcessState s) {
  switch (s) {
  case ProcessState::NEW:
    return "NEW";
  case ProcessState::READY:
    return "READY";
  case ProcessState::RUNNING:
    return "RUNNING";
  case ProcessState::BLOCKED:
    return "BLOCKED";
  case ProcessState::TERMINATED:
    return "TERMINATED";
  default:
    return "UNKNOWN";
  }
}

Process::Process(uint32_t id, const std::string &name, std::vector<Instruction> ins,
                 uint32_t arrival_order)
    : m_id(id), m_name(name), m_arrival_order(arrival_order), m_instr(std::move(ins)) {
  m_metrics.total_instructions = static_cast<uint32_t>(m_instr.size());
}

uint32_t Process::id() const { return m_id; }
std::string Process::name() const { return m_name; }
uint32_t Process::arrival_order() const { return m_arrival_order; }
ProcessState Process::state() const { return m_state; }
std::string Process::get_state_string() const { return process_state_to_string(m_state); }

const std::vector<Instruction> &Process::instructions() const { return m_instr; }

const Instruction *Process::current_instruction() const {
  if (m_pc >= m_instr.size())
    return nullptr;
  return &m_instr[m_pc];
}

uint32_t Process::pc() const { return m_pc; }

void Process::advance_pc() {
  if (m_pc >= m_instr.size())
    throw std::logic_error("advance_pc past end of script for " + m_name);
  ++m_pc;
  ++m_metrics.executed_instructions;
}

uint32_t Process::remaining_instructions() const noexcept {
  return static_cast<uint32_t>(m_instr.size()) - m_pc;
}

uint32_t Process::estimated_burst() const {
  uint32_t total = 0;
  for (const auto &ins : m_instr)
    total += instruction_cost(ins);
  return total;
}

uint32_t Process::remaining_estimated_burst() const {
  uint32_t total = 0;
  for (size_t i = m_pc; i < m_instr.size(); ++i)
    total += instruction_cost(m_instr[i]);
  // A wait in progress has already burned part of its cost
  if (in_wait() && m_pc < m_instr.size())
    total -= instruction_cost(m_instr[m_pc]) - m_wait_remaining;
  return total;
}

// === Computation waits ===

bool Process::in_wait() const noexcept { return m_wait_remaining > 0; }
uint32_t Process::wait_remaining() const noexcept { return m_wait_remaining; }

void Process::begin_wait(uint32_t ticks) { m_wait_remaining = ticks; }

bool Process::tick_wait() {
  if (m_wait_remaining > 0)
    --m_wait_remaining;
  return m_wait_remaining == 0;
}

// === Held resources ===

void Process::hold(uint32_t resource_id) { m_held.insert(resource_id); }
void Process::drop(uint32_t resource_id) { m_held.erase(resource_id); }
bool Process::holds(uint32_t resource_id) const { return m_held.count(resource_id) > 0; }
const std::set<uint32_t> &Process::held_resources() const { return m_held; }
std::optional<uint32_t> Process::blocked_on() const { return m_blocked_on; }

// === State Query Helpers ===

bool Process::is_new() const noexcept { return m_state == ProcessState::NEW; }
bool Process::is_ready() const noexcept { return m_state == ProcessState::READY; }
bool Process::is_running() const noexcept { return m_state == ProcessState::RUNNING; }
bool Process::is_blocked() const noexcept { return m_state == ProcessState::BLOCKED; }
bool Process::is_terminated() const noexcept { return m_state == ProcessState::TERMINATED; }
bool Process::is_aborted() const noexcept { return m_aborted; }

// === State Transition Helpers ===

void Process::set_state(ProcessState s) {
  if (m_state == ProcessState::TERMINATED)
    throw std::logic_error(m_name + " is terminated and cannot become " +
                           process_state_to_string(s));
  m_state = s;
}

void Process::mark_ready() {
  set_state(ProcessState::READY);
  m_blocked_on.reset();
}

void Process::mark_running(uint32_t tick) {
  set_state(ProcessState::RUNNING);
  if (!m_metrics.started) {
    m_metrics.started = true;
    m_metrics.first_run_tick = tick;
  }
}

void Process::mark_blocked(uint32_t resource_id) {
  set_state(ProcessState::BLOCKED);
  m_blocked_on = resource_id;
}

void Process::mark_terminated(uint32_t tick) {
  set_state(ProcessState::TERMINATED);
  m_blocked_on.reset();
  m_wait_remaining = 0;
  m_metrics.completion_tick = tick;
}

void Process::mark_aborted(uint32_t tick) {
  mark_terminated(tick);
  m_aborted = true;
}

const ProcessMetrics &Process::metrics() const { return m_metrics; }

uint32_t Process::turnaround() const {
  return m_metrics.completion_tick - m_metrics.arrival_tick;
}

/**
 * One line per process for the engine snapshot
 */
std::string Process::summary_line() const {
  std::ostringstream oss;
  oss << std::left << std::setw(8) << m_name
      << "PID=" << std::setw(4) << m_id
      << std::setw(11) << get_state_string()
      << "PC " << m_pc << " / " << m_instr.size();

  if (m_blocked_on)
    oss << "  waiting " << resource_label(*m_blocked_on);
  if (!m_held.empty())
    oss << "  holds " << join_ids(std::vector<uint32_t>(m_held.begin(), m_held.end()), "R");
  if (m_wait_remaining > 0)
    oss << "  wait " << m_wait_remaining;
  else if (const Instruction *ins = current_instruction())
    oss << "  next " << instruction_to_string(*ins);
  return oss.str();
}
