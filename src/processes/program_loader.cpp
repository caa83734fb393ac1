#include "processes/program_loader.hpp"
#include "util.hpp"
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

ProgramParseError::ProgramParseError(size_t line, const std::string &message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

static bool is_number(const std::string &s) {
  if (s.empty())
    return false;
  for (char c : s)
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  return true;
}

static uint32_t parse_number(const std::string &token, size_t line_no, const std::string &what) {
  std::string t = trim(token);
  if (!is_number(t))
    throw ProgramParseError(line_no, what + " must be a non-negative number, got '" + t + "'");
  unsigned long long v = 0;
  try {
    v = std::stoull(t);
  } catch (const std::out_of_range &) {
    throw ProgramParseError(line_no, what + " is out of range: " + t);
  }
  if (v > std::numeric_limits<uint32_t>::max())
    throw ProgramParseError(line_no, what + " is out of range: " + t);
  return static_cast<uint32_t>(v);
}

// "for", "for(3)", "next" but not "format(3)"
static bool is_loop_marker(const std::string &head) {
  for (const std::string kw : {"for", "next"}) {
    if (head == kw || head.rfind(kw + "(", 0) == 0)
      return true;
  }
  return false;
}

// Text between the first '(' and the last ')'
static std::string parenthesised(const std::string &line, size_t line_no) {
  auto open = line.find('(');
  auto close = line.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close < open)
    throw ProgramParseError(line_no, "expected '(...)' in '" + line + "'");
  if (!trim(line.substr(close + 1)).empty())
    throw ProgramParseError(line_no, "unexpected text after ')' in '" + line + "'");
  return line.substr(open + 1, close - open - 1);
}

Instruction ProgramLoader::parse_instruction(const std::string &raw, size_t line_no) const {
  std::string line = trim(raw);
  std::string lower = to_lower(line);

  if (lower == "end")
    return {InstructionType::END, 0};

  if (lower.rfind("wait", 0) == 0) {
    std::string inner = parenthesised(line, line_no);
    return {InstructionType::WAIT, parse_number(inner, line_no, "wait duration")};
  }

  if (lower.rfind("resource", 0) == 0) {
    std::string inner = parenthesised(line, line_no);
    auto comma = inner.find(',');
    if (comma == std::string::npos)
      throw ProgramParseError(line_no, "expected resource(<id>, allocate)");

    uint32_t rid = parse_number(inner.substr(0, comma), line_no, "resource id");
    std::string op = to_lower(trim(inner.substr(comma + 1)));
    if (op != "allocate")
      throw ProgramParseError(line_no, "unsupported resource operation '" + op + "'");
    return {InstructionType::REQUEST, rid};
  }

  throw ProgramParseError(line_no, "unknown instruction '" + line + "'");
}

std::vector<ProgramDefinition> ProgramLoader::parse(std::istream &in) const {
  std::vector<ProgramDefinition> programs;
  std::set<std::string> names;
  std::string raw;
  size_t line_no = 0;

  while (std::getline(in, raw)) {
    ++line_no;
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#')
      continue;

    auto tokens = split(line);
    std::string head = to_lower(tokens[0]);

    if (head == "program") {
      if (tokens.size() != 2)
        throw ProgramParseError(line_no, "expected 'program <name>'");
      if (!names.insert(tokens[1]).second)
        throw ProgramParseError(line_no, "duplicate program name " + tokens[1]);
      programs.push_back({tokens[1], {}});
      PROCSIM_DEBUG_PRINT(PROCSIM_DEBUG_LOADER, "program %s", tokens[1].c_str());
      continue;
    }

    // Loop markers carry no meaning for the simulation
    if (is_loop_marker(head))
      continue;

    if (programs.empty())
      throw ProgramParseError(line_no, "instruction outside of a program block");

    programs.back().instructions.push_back(parse_instruction(line, line_no));
  }

  return programs;
}

std::vector<ProgramDefinition> ProgramLoader::parse_string(const std::string &text) const {
  std::istringstream in(text);
  return parse(in);
}

std::vector<ProgramDefinition> ProgramLoader::load_file(const std::string &path) const {
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("cannot open program file '" + path + "'");
  return parse(in);
}

std::vector<ProcessPtr> ProgramLoader::build_processes(const std::vector<ProgramDefinition> &defs) {
  std::vector<ProcessPtr> out;
  out.reserve(defs.size());
  for (size_t i = 0; i < defs.size(); ++i)
    out.push_back(std::make_shared<Process>(static_cast<uint32_t>(i + 1), defs[i].name,
                                            defs[i].instructions, static_cast<uint32_t>(i)));
  return out;
}
