#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>

namespace tams::deletion {

/*
  Thread-safe blocking queue of deletion request ids for workers.

  An id already queued is not queued twice.
*/
class DeletionScheduler {
 public:
  void Enqueue(const std::string& request_id);

  // blocking wait
  std::optional<std::string> Dequeue();

  void Shutdown();

 private:
  std::mutex                      mutex_;
  std::condition_variable         cv_;
  std::queue<std::string>         queue_;
  std::unordered_set<std::string> queued_;
  bool                            shutdown_ = false;
};

} // namespace tams::deletion
