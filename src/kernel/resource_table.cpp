#include "kernel/resource_table.hpp"
#include "util.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

ResourceTable::ResourceTable(uint32_t num_resources) {
  for (uint32_t i = 0; i < num_resources; ++i)
    declare(i);
}

void ResourceTable::declare(uint32_t resource_id) {
  resources_.try_emplace(resource_id);
}

bool ResourceTable::is_declared(uint32_t resource_id) const {
  return resources_.count(resource_id) > 0;
}

std::vector<uint32_t> ResourceTable::resource_ids() const {
  std::vector<uint32_t> ids;
  ids.reserve(resources_.size());
  for (const auto &[id, res] : resources_)
    ids.push_back(id);
  return ids;
}

ResourceTable::Resource &ResourceTable::at(uint32_t resource_id) {
  auto it = resources_.find(resource_id);
  if (it == resources_.end())
    throw std::out_of_range("undeclared resource " + resource_label(resource_id));
  return it->second;
}

const ResourceTable::Resource &ResourceTable::at(uint32_t resource_id) const {
  auto it = resources_.find(resource_id);
  if (it == resources_.end())
    throw std::out_of_range("undeclared resource " + resource_label(resource_id));
  return it->second;
}

std::optional<uint32_t> ResourceTable::grant_next(Resource &res) {
  if (res.wait_queue.empty()) {
    res.owner.reset();
    return std::nullopt;
  }
  res.owner = res.wait_queue.front();
  res.wait_queue.pop_front();
  return res.owner;
}

AcquireResult ResourceTable::try_acquire(uint32_t resource_id, uint32_t pid) {
  auto &res = at(resource_id);

  if (!res.owner) {
    res.owner = pid;
    return AcquireResult::GRANTED;
  }

  // Re-requesting a held resource is a no-op grant
  if (*res.owner == pid)
    return AcquireResult::GRANTED;

  if (std::find(res.wait_queue.begin(), res.wait_queue.end(), pid) == res.wait_queue.end())
    res.wait_queue.push_back(pid);
  return AcquireResult::ENQUEUED;
}

std::vector<ResourceHandoff> ResourceTable::release_all(uint32_t pid) {
  std::vector<ResourceHandoff> handoffs;

  for (auto &[id, res] : resources_) {
    auto it = std::find(res.wait_queue.begin(), res.wait_queue.end(), pid);
    if (it != res.wait_queue.end())
      res.wait_queue.erase(it);
  }

  for (auto &[id, res] : resources_) {
    if (res.owner && *res.owner == pid)
      handoffs.push_back({id, grant_next(res)});
  }
  return handoffs;
}

ForcedReleaseResult ResourceTable::force_release(uint32_t resource_id) {
  auto &res = at(resource_id);
  ForcedReleaseResult result{resource_id, res.owner, std::nullopt};
  if (!res.owner)
    return result;
  result.new_owner = grant_next(res);
  return result;
}

std::optional<uint32_t> ResourceTable::owner_of(uint32_t resource_id) const {
  return at(resource_id).owner;
}

const std::deque<uint32_t> &ResourceTable::waiters(uint32_t resource_id) const {
  return at(resource_id).wait_queue;
}

std::vector<uint32_t> ResourceTable::owned_by(uint32_t pid) const {
  std::vector<uint32_t> ids;
  for (const auto &[id, res] : resources_)
    if (res.owner && *res.owner == pid)
      ids.push_back(id);
  return ids;
}

std::optional<uint32_t> ResourceTable::waiting_on(uint32_t pid) const {
  for (const auto &[id, res] : resources_)
    if (std::find(res.wait_queue.begin(), res.wait_queue.end(), pid) != res.wait_queue.end())
      return id;
  return std::nullopt;
}

std::string ResourceTable::snapshot() const {
  std::ostringstream oss;
  oss << "Res\tOwner\tWaiting\n"
      << "----------------------------------------\n";
  for (const auto &[id, res] : resources_) {
    oss << resource_label(id) << "\t"
        << (res.owner ? "PID=" + std::to_string(*res.owner) : std::string("None")) << "\t"
        << join_ids(std::vector<uint32_t>(res.wait_queue.begin(), res.wait_queue.end()), "PID=")
        << "\n";
  }
  return oss.str();
}
