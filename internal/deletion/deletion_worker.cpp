#include "deletion_worker.hpp"

#include "internal/observability/logging.hpp"

namespace tams::deletion {

DeletionWorker::DeletionWorker(std::shared_ptr<DeletionScheduler> scheduler, std::shared_ptr<DeletionWorkflow> workflow,
                               std::size_t workers, std::chrono::milliseconds rescan_interval)
    : scheduler_(std::move(scheduler)),
      workflow_(std::move(workflow)),
      worker_count_(workers == 0 ? 1 : workers),
      rescan_interval_(rescan_interval) {
}

DeletionWorker::~DeletionWorker() {
  Stop();
}

void DeletionWorker::Start() {
  if (running_.exchange(true)) return;

  Rescan();
  for (std::size_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&DeletionWorker::Run, this);
  }
  rescan_thread_ = std::thread(&DeletionWorker::RescanLoop, this);
}

void DeletionWorker::Stop() {
  scheduler_->Shutdown();
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  if (rescan_thread_.joinable()) rescan_thread_.join();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void DeletionWorker::Rescan() {
  try {
    for (const auto& id : workflow_->ListResumable()) {
      scheduler_->Enqueue(id);
    }
  } catch (const std::exception& e) {
    TAMS_LOG_ERROR("deletion rescan failed", {observability::StringField("error", e.what())});
  }
}

void DeletionWorker::RescanLoop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, rescan_interval_, [this] { return !running_; })) break;
    lock.unlock();
    Rescan();
    lock.lock();
  }
}

void DeletionWorker::Run() {
  while (running_) {
    auto id = scheduler_->Dequeue();
    if (!id) break;

    try {
      workflow_->Run(*id);
    } catch (const std::exception& e) {
      TAMS_LOG_ERROR("deletion worker failed", {observability::StringField("request_id", *id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace tams::deletion
