#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace tams::lease {

/*
  In-process lease table.

  At most one unexpired lease exists per resource. An expired lease is
  reclaimed by the next TryAcquire, so a stalled holder loses its claim
  after the TTL.
*/
class LeaseTable {
 public:
  using Clock = std::chrono::steady_clock;

  std::optional<Lease> TryAcquire(const std::string& resource_id, const std::string& holder, std::chrono::milliseconds ttl);

  // False when the lease expired or was taken over.
  bool Renew(const Lease& lease, std::chrono::milliseconds ttl);

  void Release(const Lease& lease);

  bool HasActive(const std::string& resource_id);

 private:
  std::mutex mutex_;

  std::unordered_map<std::string, Lease> by_resource_;

  static bool IsExpired(const Lease& lease, Clock::time_point now);
  static std::string GenerateLeaseID();
};

} // namespace tams::lease
