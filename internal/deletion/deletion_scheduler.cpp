#include "deletion_scheduler.hpp"

namespace tams::deletion {

void DeletionScheduler::Enqueue(const std::string& request_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || !queued_.insert(request_id).second) return;
    queue_.push(request_id);
  }
  cv_.notify_one();
}

std::optional<std::string> DeletionScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  std::string id = std::move(queue_.front());
  queue_.pop();
  queued_.erase(id);
  return id;
}

void DeletionScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace tams::deletion
