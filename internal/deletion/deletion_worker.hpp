#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "deletion_scheduler.hpp"
#include "deletion_workflow.hpp"

namespace tams::deletion {

/*
  Background workers that drive deletion requests to completion.

  Executes:
      DeletionWorkflow::Run for every scheduled request id

  On Start() and then every rescan interval, requests left pending or
  processing are scheduled again, which resumes work interrupted by a
  restart or a storage failure.
*/
class DeletionWorker {
 public:
  DeletionWorker(std::shared_ptr<DeletionScheduler> scheduler, std::shared_ptr<DeletionWorkflow> workflow, std::size_t workers,
                 std::chrono::milliseconds rescan_interval);
  ~DeletionWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void Rescan();
  void RescanLoop();

  std::shared_ptr<DeletionScheduler> scheduler_;
  std::shared_ptr<DeletionWorkflow>  workflow_;
  std::size_t                        worker_count_;
  std::chrono::milliseconds          rescan_interval_;

  std::vector<std::thread> threads_;
  std::thread              rescan_thread_;
  std::atomic<bool>        running_{false};

  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace tams::deletion
