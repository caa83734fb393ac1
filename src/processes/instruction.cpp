#include "processes/instruction.hpp"
#include "util.hpp"
#include <string>

std::string instruction_to_string(const Instruction &instr) {
  switch (instr.type) {
  case InstructionType::REQUEST:
    return "REQUEST(" + resource_label(instr.arg) + ")";
  case InstructionType::WAIT:
    return "WAIT(" + std::to_string(instr.arg) + ")";
  case InstructionType::END:
    return "END";
  default:
    return "UNKNOWN";
  }
}

uint32_t instruction_cost(const Instruction &instr) {
  switch (instr.type) {
  case InstructionType::WAIT:
    return instr.arg;
  case InstructionType::REQUEST:
    return 1;
  default:
    return 0;
  }
}
