#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorKind {
  UNKNOWN_RESOURCE,     // instruction names a resource that was never declared
  INVALID_RESOLUTION,   // resolver picked a resource outside the cycle
  STALL_WITHOUT_CYCLE,  // nothing can run, yet no cycle exists
  UNRESOLVED_DEADLOCK,  // cycle found with no resolver installed
};

std::string error_kind_to_string(ErrorKind kind);

/**
 * Error raised (or recorded) by the simulation engine. Carries enough
 * context for a presenter to render a diagnostic.
 */
class SimulationError : public std::runtime_error {
public:
  SimulationError(ErrorKind kind, const std::string &message, uint32_t tick,
                  std::optional<uint32_t> pid = std::nullopt,
                  std::optional<uint32_t> resource_id = std::nullopt);

  ErrorKind kind() const noexcept { return kind_; }
  uint32_t tick() const noexcept { return tick_; }
  std::optional<uint32_t> pid() const noexcept { return pid_; }
  std::optional<uint32_t> resource_id() const noexcept { return resource_id_; }

private:
  ErrorKind kind_;
  uint32_t tick_;
  std::optional<uint32_t> pid_;
  std::optional<uint32_t> resource_id_;
};
