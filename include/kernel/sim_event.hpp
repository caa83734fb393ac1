#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class SimEventType {
  PROCESS_DISPATCHED,  // pid picked by the policy
  PROCESS_WAITED,      // pid spent one tick computing; value = ticks left in the wait
  PROCESS_PREEMPTED,   // pid's quantum ran out
  RESOURCE_GRANTED,    // pid's request for resource_id completed
  RESOURCE_BLOCKED,    // pid queued on resource_id
  RESOURCE_RELEASED,   // pid freed resource_id on termination; new_owner took it
  DEADLOCK_DETECTED,   // involved = cycle, resources = candidates
  FORCED_RELEASE,      // resource_id taken from pid (former owner), given to new_owner
  RESOLUTION_REJECTED, // resolver answered resource_id, not part of the cycle
  PROCESS_TERMINATED,  // pid ended; value = turnaround ticks
  PROCESS_ABORTED,     // pid stopped on an undeclared resource_id
};

struct SimEvent {
  SimEventType type;
  uint32_t tick{0};
  std::optional<uint32_t> pid;
  std::optional<uint32_t> resource_id;
  std::optional<uint32_t> new_owner;
  std::vector<uint32_t> involved;
  std::vector<uint32_t> resources;
  uint32_t value{0};
};

std::string event_type_to_string(SimEventType type);

// Observers are called synchronously, in emission order
using EventSink = std::function<void(const SimEvent &)>;
