#include "kernel/sim_event.hpp"

std::string event_type_to_string(SimEventType type) {
  switch (type) {
  case SimEventType::PROCESS_DISPATCHED:
    return "PROCESS_DISPATCHED";
  case SimEventType::PROCESS_WAITED:
    return "PROCESS_WAITED";
  case SimEventType::PROCESS_PREEMPTED:
    return "PROCESS_PREEMPTED";
  case SimEventType::RESOURCE_GRANTED:
    return "RESOURCE_GRANTED";
  case SimEventType::RESOURCE_BLOCKED:
    return "RESOURCE_BLOCKED";
  case SimEventType::RESOURCE_RELEASED:
    return "RESOURCE_RELEASED";
  case SimEventType::DEADLOCK_DETECTED:
    return "DEADLOCK_DETECTED";
  case SimEventType::FORCED_RELEASE:
    return "FORCED_RELEASE";
  case SimEventType::RESOLUTION_REJECTED:
    return "RESOLUTION_REJECTED";
  case SimEventType::PROCESS_TERMINATED:
    return "PROCESS_TERMINATED";
  case SimEventType::PROCESS_ABORTED:
    return "PROCESS_ABORTED";
  default:
    return "UNKNOWN";
  }
}
