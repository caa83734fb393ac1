#pragma once
#include "processes/instruction.hpp"
#include "processes/process.hpp"
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

// A parsed program, before it becomes a Process
struct ProgramDefinition {
  std::string name;
  std::vector<Instruction> instructions;
};

class ProgramParseError : public std::runtime_error {
public:
  ProgramParseError(size_t line, const std::string &message);
  size_t line() const noexcept { return line_; }

private:
  size_t line_;
};

/**
 * Reads program files of the form
 *
 *   # comment
 *   program P1
 *   resource(1, allocate)
 *   wait(2)
 *   end
 *
 * `for` and `next` lines are accepted and ignored.
 */
class ProgramLoader {
public:
  std::vector<ProgramDefinition> parse(std::istream &in) const;
  std::vector<ProgramDefinition> parse_string(const std::string &text) const;
  std::vector<ProgramDefinition> load_file(const std::string &path) const;

  // Single instruction line, throws ProgramParseError
  Instruction parse_instruction(const std::string &line, size_t line_no) const;

  // Assigns pids 1..n and arrival orders 0..n-1 in definition order
  static std::vector<ProcessPtr> build_processes(const std::vector<ProgramDefinition> &defs);
};
