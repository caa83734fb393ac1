#include "kernel/sim_error.hpp"
#include "util.hpp"
#include <sstream>

std::string error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UNKNOWN_RESOURCE:
    return "UnknownResource";
  case ErrorKind::INVALID_RESOLUTION:
    return "InvalidResolution";
  case ErrorKind::STALL_WITHOUT_CYCLE:
    return "StallWithoutCycle";
  case ErrorKind::UNRESOLVED_DEADLOCK:
    return "UnresolvedDeadlock";
  default:
    return "Unknown";
  }
}

static std::string format_error(ErrorKind kind, const std::string &message, uint32_t tick,
                                std::optional<uint32_t> pid,
                                std::optional<uint32_t> resource_id) {
  std::ostringstream oss;
  oss << "[" << error_kind_to_string(kind) << "] tick " << tick;
  if (pid) oss << " pid " << *pid;
  if (resource_id) oss << " " << resource_label(*resource_id);
  oss << ": " << message;
  return oss.str();
}

SimulationError::SimulationError(ErrorKind kind, const std::string &message, uint32_t tick,
                                 std::optional<uint32_t> pid,
                                 std::optional<uint32_t> resource_id)
    : std::runtime_error(format_error(kind, message, tick, pid, resource_id)),
      kind_(kind), tick_(tick), pid_(pid), resource_id_(resource_id) {}
