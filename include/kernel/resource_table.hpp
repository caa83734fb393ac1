#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class AcquireResult { GRANTED, ENQUEUED };

// Ownership passed on after a release; new_owner is empty when nobody waited
struct ResourceHandoff {
  uint32_t resource_id;
  std::optional<uint32_t> new_owner;
};

struct ForcedReleaseResult {
  uint32_t resource_id;
  std::optional<uint32_t> former_owner;
  std::optional<uint32_t> new_owner;
};

/**
 * Ownership and FIFO wait queues of mutually exclusive resources.
 * A resource has at most one owner; a waiting pid sits in at most one
 * queue. Queries on an undeclared id throw std::out_of_range.
 */
class ResourceTable {
public:
  ResourceTable() = default;
  explicit ResourceTable(uint32_t num_resources); // declares 0 .. n-1

  void declare(uint32_t resource_id);
  bool is_declared(uint32_t resource_id) const;
  std::vector<uint32_t> resource_ids() const;

  AcquireResult try_acquire(uint32_t resource_id, uint32_t pid);
  std::vector<ResourceHandoff> release_all(uint32_t pid);
  ForcedReleaseResult force_release(uint32_t resource_id);

  std::optional<uint32_t> owner_of(uint32_t resource_id) const;
  const std::deque<uint32_t> &waiters(uint32_t resource_id) const;
  std::vector<uint32_t> owned_by(uint32_t pid) const;
  std::optional<uint32_t> waiting_on(uint32_t pid) const;

  std::string snapshot() const;

private:
  struct Resource {
    std::optional<uint32_t> owner;
    std::deque<uint32_t> wait_queue;
  };

  Resource &at(uint32_t resource_id);
  const Resource &at(uint32_t resource_id) const;
  // Pop the head of the queue and make it the owner
  std::optional<uint32_t> grant_next(Resource &res);

  std::map<uint32_t, Resource> resources_;
};
