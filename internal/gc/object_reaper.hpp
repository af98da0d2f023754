#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/storage/object_store.hpp"

namespace tams::gc {

/*
  Periodically reclaims media objects no segment references.

  An object is reaped once it has been unreferenced for longer than the
  retention period: its bytes are removed through the object store first,
  then its catalog row. A failed store delete leaves the row in place so
  the next pass retries it.
*/
class ObjectReaper {
 public:
  ObjectReaper(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr object_store, std::chrono::seconds retention,
               std::chrono::milliseconds interval);
  ~ObjectReaper();

  void Start();
  void Stop();

  // One pass; returns the number of objects reaped.
  std::size_t RunOnce(util::WallTime now);

 private:
  void Loop();

  std::shared_ptr<db::Repository> repository_;
  storage::ObjectStorePtr         object_store_;
  std::chrono::seconds            retention_;
  std::chrono::milliseconds       interval_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace tams::gc
