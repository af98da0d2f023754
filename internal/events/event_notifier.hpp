#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "webhook_sender.hpp"

namespace tams::events {

struct NotifierOptions {
  std::chrono::milliseconds poll_interval{500};

  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds initial_backoff{100};
  std::chrono::milliseconds max_backoff{5000};
  std::chrono::milliseconds attempt_timeout{30000};

  // Delivery threads shared by all webhook lanes.
  std::size_t lanes = 4;
};

/*
  At-least-once webhook delivery from the event outbox.

  The dispatch loop turns each undispatched event into one pending
  delivery row per subscribed webhook, in the same transaction that marks
  the event dispatched. Deliveries are then queued on the webhook's lane.

  A lane is a FIFO per webhook url served by at most one thread at a time,
  so a subscriber receives events in creation order while different
  subscribers proceed concurrently. A failing attempt is retried with
  exponential backoff up to max_attempts; exhaustion marks the delivery
  failed and the lane moves on.

  Deliveries left pending by a previous process are reloaded on Start().
*/
class EventNotifier {
 public:
  EventNotifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<WebhookSender> sender, NotifierOptions options);
  ~EventNotifier();

  void Start();
  void Stop();

  // Wakes the dispatch loop ahead of its poll interval.
  void Notify();

  // One dispatch pass over up to one batch of events; returns the number of events dispatched.
  std::size_t DispatchPending();

  // Blocks until every queued delivery finished; false on timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

 private:
  struct Lane {
    std::deque<db::model::DeliveryRecord> queue;
    bool                                  busy = false;
    // grows while the head delivery keeps failing outside the sender
    std::chrono::milliseconds backoff{0};
  };

  void DispatchLoop();
  void LaneLoop();

  void ReloadPending();
  void Enqueue(std::vector<db::model::DeliveryRecord> deliveries);
  void Deliver(db::model::DeliveryRecord delivery);
  void Persist(const db::model::DeliveryRecord& delivery);
  bool SleepFor(std::chrono::milliseconds delay);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<WebhookSender>  sender_;
  NotifierOptions                 options_;

  std::atomic<bool> running_{false};

  // one dispatch pass at a time keeps lane order equal to event order
  std::mutex pass_mutex_;

  std::mutex              dispatch_mutex_;
  std::condition_variable dispatch_cv_;
  bool                    notified_ = false;
  std::thread             dispatch_thread_;

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;

  std::mutex                            lanes_mutex_;
  std::condition_variable               lanes_cv_;
  std::condition_variable               idle_cv_;
  std::unordered_map<std::string, Lane> lanes_;
  std::deque<std::string>               ready_;
  std::size_t                           in_flight_ = 0;
  std::vector<std::thread>              lane_threads_;
};

} // namespace tams::events
