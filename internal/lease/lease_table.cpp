#include "lease_table.hpp"

#include "internal/util/uuid.hpp"

namespace tams::lease {

bool LeaseTable::IsExpired(const Lease& lease, Clock::time_point now) {
  return lease.expires_at <= now;
}

std::string LeaseTable::GenerateLeaseID() {
  return util::NewId();
}

std::optional<Lease> LeaseTable::TryAcquire(const std::string& resource_id, const std::string& holder, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = Clock::now();
  if (auto existing = by_resource_.find(resource_id); existing != by_resource_.end()) {
    if (!IsExpired(existing->second, now)) {
      return std::nullopt;
    }
    by_resource_.erase(existing);
  }

  Lease lease{GenerateLeaseID(), resource_id, holder, now + ttl};
  by_resource_.emplace(resource_id, lease);
  return lease;
}

bool LeaseTable::Renew(const Lease& lease, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  auto it = by_resource_.find(lease.resource_id);
  if (it == by_resource_.end() || it->second.lease_id != lease.lease_id) return false;

  const auto now = Clock::now();
  if (IsExpired(it->second, now)) {
    by_resource_.erase(it);
    return false;
  }

  it->second.expires_at = now + ttl;
  return true;
}

void LeaseTable::Release(const Lease& lease) {
  std::lock_guard lock(mutex_);

  auto it = by_resource_.find(lease.resource_id);
  if (it == by_resource_.end() || it->second.lease_id != lease.lease_id) return;
  by_resource_.erase(it);
}

bool LeaseTable::HasActive(const std::string& resource_id) {
  std::lock_guard lock(mutex_);

  auto it = by_resource_.find(resource_id);
  if (it == by_resource_.end()) return false;

  if (IsExpired(it->second, Clock::now())) {
    by_resource_.erase(it);
    return false;
  }
  return true;
}

} // namespace tams::lease
