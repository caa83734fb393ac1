#pragma once
#include "kernel/resource_table.hpp"
#include "processes/process.hpp"
#include <cstdint>
#include <map>
#include <vector>

// Result of one detection pass
struct DeadlockReport {
  std::vector<uint32_t> cycle;     // pids in wait-for order, empty if none
  std::vector<uint32_t> resources; // resources on the cycle's edges, ascending
  uint32_t tick{0};

  bool found() const noexcept { return !cycle.empty(); }
};

// Wait-for graph: blocked pid -> pids owning what it waits on
using WaitForGraph = std::map<uint32_t, std::vector<uint32_t>>;

/**
 * Builds the wait-for graph from the resource table on every call and
 * reports the first cycle found. Nothing is cached between calls.
 */
class DeadlockDetector {
public:
  static WaitForGraph build_wait_for_graph(const std::vector<ProcessPtr> &processes,
                                           const ResourceTable &table);

  DeadlockReport detect(const std::vector<ProcessPtr> &processes,
                        const ResourceTable &table, uint32_t tick = 0) const;

private:
  enum class Color { WHITE, GRAY, BLACK };

  static bool visit(uint32_t node, const WaitForGraph &graph,
                    std::map<uint32_t, Color> &color,
                    std::vector<uint32_t> &path, std::vector<uint32_t> &cycle);
};
