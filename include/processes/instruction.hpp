#pragma once
#include <cstdint>
#include <string>

enum class InstructionType { REQUEST, WAIT, END };

// A single step of a process script. Fixed at load time.
//   REQUEST: arg is the resource id
//   WAIT:    arg is the number of ticks
//   END:     arg unused
struct Instruction {
  InstructionType type;
  uint32_t arg{0};

  bool operator==(const Instruction &other) const = default;
};

std::string instruction_to_string(const Instruction &instr);

// Weight of an instruction in the burst estimate: WAIT ticks, 1 per REQUEST, END is free
uint32_t instruction_cost(const Instruction &instr);
