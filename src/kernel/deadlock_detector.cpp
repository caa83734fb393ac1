#include "kernel/deadlock_detector.hpp"
#include <algorithm>
#include <set>

WaitForGraph DeadlockDetector::build_wait_for_graph(const std::vector<ProcessPtr> &processes,
                                                    const ResourceTable &table) {
  WaitForGraph graph;
  std::set<uint32_t> blocked;
  for (const auto &p : processes)
    if (p && p->is_blocked())
      blocked.insert(p->id());

  for (uint32_t rid : table.resource_ids()) {
    auto owner = table.owner_of(rid);
    if (!owner)
      continue;
    for (uint32_t waiter : table.waiters(rid)) {
      if (!blocked.count(waiter))
        continue;
      auto &edges = graph[waiter];
      if (std::find(edges.begin(), edges.end(), *owner) == edges.end())
        edges.push_back(*owner);
    }
  }
  return graph;
}

// Three-colour DFS. GRAY nodes are on the current path; reaching one closes a cycle.
bool DeadlockDetector::visit(uint32_t node, const WaitForGraph &graph,
                             std::map<uint32_t, Color> &color,
                             std::vector<uint32_t> &path, std::vector<uint32_t> &cycle) {
  color[node] = Color::GRAY;
  path.push_back(node);

  auto it = graph.find(node);
  if (it != graph.end()) {
    for (uint32_t next : it->second) {
      Color c = color.count(next) ? color[next] : Color::WHITE;
      if (c == Color::GRAY) {
        auto start = std::find(path.begin(), path.end(), next);
        cycle.assign(start, path.end());
        return true;
      }
      if (c == Color::WHITE && visit(next, graph, color, path, cycle))
        return true;
    }
  }

  path.pop_back();
  color[node] = Color::BLACK;
  return false;
}

DeadlockReport DeadlockDetector::detect(const std::vector<ProcessPtr> &processes,
                                        const ResourceTable &table, uint32_t tick) const {
  DeadlockReport report;
  report.tick = tick;

  WaitForGraph graph = build_wait_for_graph(processes, table);
  std::map<uint32_t, Color> color;
  std::vector<uint32_t> path;

  for (const auto &[pid, edges] : graph) {
    if (color.count(pid) && color[pid] != Color::WHITE)
      continue;
    if (visit(pid, graph, color, path, report.cycle))
      break;
  }

  if (!report.found())
    return report;

  // Resources on the cycle: what each member waits on, owned by the next member
  std::set<uint32_t> members(report.cycle.begin(), report.cycle.end());
  std::set<uint32_t> resources;
  for (uint32_t pid : report.cycle) {
    auto rid = table.waiting_on(pid);
    if (!rid)
      continue;
    auto owner = table.owner_of(*rid);
    if (owner && members.count(*owner))
      resources.insert(*rid);
  }
  report.resources.assign(resources.begin(), resources.end());
  return report;
}
