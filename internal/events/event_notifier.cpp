#include "event_notifier.hpp"

#include <algorithm>

#include "internal/db/api/db_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/event_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tams::events {

namespace {

constexpr std::size_t kDispatchBatch = 100;

bool Subscribed(const db::model::WebhookRecord& webhook, const std::string& event_type) {
  return std::any_of(webhook.events.begin(), webhook.events.end(),
                     [&](const std::string& type) { return type == tams::model::kAllEvents || type == event_type; });
}

} // namespace

EventNotifier::EventNotifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<WebhookSender> sender, NotifierOptions options)
    : repository_(std::move(repository)), sender_(std::move(sender)), options_(options) {
  if (options_.lanes == 0) options_.lanes = 1;
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

EventNotifier::~EventNotifier() {
  Stop();
}

void EventNotifier::Start() {
  if (running_.exchange(true)) return;

  ReloadPending();
  for (std::size_t i = 0; i < options_.lanes; ++i) {
    lane_threads_.emplace_back(&EventNotifier::LaneLoop, this);
  }
  dispatch_thread_ = std::thread(&EventNotifier::DispatchLoop, this);

  TAMS_LOG_INFO("event notifier started", {observability::UintField("lanes", options_.lanes)});
}

void EventNotifier::Stop() {
  if (!running_.exchange(false)) return;

  {
    std::lock_guard lock(dispatch_mutex_);
    notified_ = true;
  }
  dispatch_cv_.notify_all();
  {
    std::lock_guard lock(stop_mutex_);
  }
  stop_cv_.notify_all();
  {
    std::lock_guard lock(lanes_mutex_);
  }
  lanes_cv_.notify_all();

  if (dispatch_thread_.joinable()) dispatch_thread_.join();
  for (auto& thread : lane_threads_) {
    if (thread.joinable()) thread.join();
  }
  lane_threads_.clear();

  // anything still queued stays pending in the store
  std::lock_guard lock(lanes_mutex_);
  lanes_.clear();
  ready_.clear();
  idle_cv_.notify_all();
}

void EventNotifier::Notify() {
  {
    std::lock_guard lock(dispatch_mutex_);
    notified_ = true;
  }
  dispatch_cv_.notify_one();
}

// ------------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------------

void EventNotifier::ReloadPending() {
  std::vector<db::model::DeliveryRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListPendingDeliveries(*tx);
  }
  if (!pending.empty()) {
    TAMS_LOG_INFO("resuming pending webhook deliveries", {observability::UintField("count", pending.size())});
  }
  Enqueue(std::move(pending));
}

std::size_t EventNotifier::DispatchPending() {
  std::lock_guard                        pass(pass_mutex_);
  std::vector<db::model::DeliveryRecord> created;

  auto tx     = repository_->Begin();
  auto events = repository_->ListUndispatchedEvents(*tx, kDispatchBatch);
  if (events.empty()) {
    return 0;
  }

  const auto webhooks = repository_->ListWebhooks(*tx);
  const auto now      = util::Now();
  for (const auto& event : events) {
    for (const auto& webhook : webhooks) {
      if (!Subscribed(webhook, event.event_type)) continue;

      db::model::DeliveryRecord delivery;
      delivery.event_id    = event.id;
      delivery.webhook_url = webhook.url;
      delivery.updated_at  = now;
      db::ThrowIfDbError(repository_->InsertDelivery(*tx, delivery), "insert delivery");
      created.push_back(std::move(delivery));
    }
    db::ThrowIfDbError(repository_->MarkEventDispatched(*tx, event.id), "mark event dispatched");
  }
  tx->Commit();

  TAMS_LOG_DEBUG("events dispatched", {observability::UintField("events", events.size()),
                                       observability::UintField("deliveries", created.size())});
  Enqueue(std::move(created));
  return events.size();
}

void EventNotifier::DispatchLoop() {
  std::unique_lock lock(dispatch_mutex_);
  while (running_) {
    notified_ = false;
    lock.unlock();
    try {
      while (running_ && DispatchPending() == kDispatchBatch) {
      }
    } catch (const std::exception& e) {
      TAMS_LOG_ERROR("event dispatch failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    dispatch_cv_.wait_for(lock, options_.poll_interval, [this] { return notified_ || !running_; });
  }
}

// ------------------------------------------------------------------
// Lanes
// ------------------------------------------------------------------

void EventNotifier::Enqueue(std::vector<db::model::DeliveryRecord> deliveries) {
  if (deliveries.empty()) return;
  {
    std::lock_guard lock(lanes_mutex_);
    for (auto& delivery : deliveries) {
      auto& lane = lanes_[delivery.webhook_url];
      if (!lane.busy && lane.queue.empty()) ready_.push_back(delivery.webhook_url);
      lane.queue.push_back(std::move(delivery));
    }
  }
  lanes_cv_.notify_all();
}

void EventNotifier::LaneLoop() {
  std::unique_lock lock(lanes_mutex_);
  while (true) {
    lanes_cv_.wait(lock, [this] { return !running_ || !ready_.empty(); });
    if (!running_) return;

    const std::string url = std::move(ready_.front());
    ready_.pop_front();

    auto& lane = lanes_[url];
    lane.busy  = true;
    auto delivery = std::move(lane.queue.front());
    lane.queue.pop_front();
    ++in_flight_;
    lock.unlock();

    bool retry = false;
    try {
      Deliver(delivery);
    } catch (const std::exception& e) {
      // the lane must not move past this event; hold it and try again
      std::chrono::milliseconds backoff;
      {
        std::lock_guard backoff_lock(lanes_mutex_);
        auto&           held = lanes_[url];
        held.backoff         = held.backoff.count() == 0 ? options_.initial_backoff : std::min(held.backoff * 2, options_.max_backoff);
        backoff              = held.backoff;
      }
      TAMS_LOG_ERROR("webhook delivery interrupted", {observability::StringField("url", url), observability::UintField("event_id", delivery.event_id),
                                                      observability::IntField("backoff_ms", backoff.count()),
                                                      observability::StringField("error", e.what())});
      retry = SleepFor(backoff);
    }

    lock.lock();
    --in_flight_;
    auto it = lanes_.find(url);
    if (it != lanes_.end()) {
      if (retry) {
        it->second.queue.push_front(std::move(delivery));
      } else {
        it->second.backoff = std::chrono::milliseconds{0};
      }
      it->second.busy = false;
      if (it->second.queue.empty()) {
        lanes_.erase(it);
      } else {
        ready_.push_back(url);
        lanes_cv_.notify_one();
      }
    }
    if (ready_.empty() && in_flight_ == 0) idle_cv_.notify_all();
  }
}

bool EventNotifier::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(lanes_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return ready_.empty() && in_flight_ == 0; });
}

bool EventNotifier::SleepFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [this] { return !running_; });
}

void EventNotifier::Persist(const db::model::DeliveryRecord& delivery) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateDelivery(*tx, delivery), "update delivery");
  tx->Commit();
}

void EventNotifier::Deliver(db::model::DeliveryRecord delivery) {
  std::optional<db::model::EventRecord>   event;
  std::optional<db::model::WebhookRecord> webhook;
  {
    auto tx = repository_->Begin();
    event   = repository_->GetEvent(*tx, delivery.event_id);
    webhook = repository_->GetWebhook(*tx, delivery.webhook_url);
  }

  if (!event || !webhook) {
    delivery.status     = std::string(db::model::kDeliveryFailed);
    delivery.last_error = !event ? "event no longer exists" : "webhook no longer registered";
    delivery.updated_at = util::Now();
    Persist(delivery);
    TAMS_LOG_WARN("webhook delivery dropped", {observability::UintField("event_id", delivery.event_id),
                                                observability::StringField("url", delivery.webhook_url),
                                                observability::StringField("reason", delivery.last_error)});
    return;
  }

  WebhookRequest request;
  request.url     = webhook->url;
  request.body    = BuildWebhookBody(*event);
  request.timeout = options_.attempt_timeout;
  if (!webhook->api_key_name.empty()) {
    request.headers.emplace_back(webhook->api_key_name, webhook->api_key_value);
  }

  auto backoff = options_.initial_backoff;
  while (running_) {
    SendResult result;
    try {
      result = sender_->Send(request);
    } catch (const std::exception& e) {
      result.error = e.what();
    }
    ++delivery.attempts;
    delivery.updated_at = util::Now();

    if (result.ok) {
      delivery.status = std::string(db::model::kDeliveryDelivered);
      delivery.last_error.clear();
      Persist(delivery);
      TAMS_LOG_DEBUG("webhook delivered", {observability::UintField("event_id", delivery.event_id),
                                           observability::StringField("url", delivery.webhook_url),
                                           observability::UintField("attempts", delivery.attempts)});
      return;
    }

    delivery.last_error = result.error;
    if (delivery.attempts >= options_.max_attempts) {
      delivery.status = std::string(db::model::kDeliveryFailed);
      Persist(delivery);

      const util::DeliveryExhausted exhausted("delivery of event " + std::to_string(delivery.event_id) + " to " + delivery.webhook_url +
                                              " failed after " + std::to_string(delivery.attempts) + " attempts: " + result.error);
      TAMS_LOG_ERROR("webhook delivery exhausted", {observability::StringField("error", exhausted.what()),
                                                    observability::StringField("event_type", event->event_type)});
      return;
    }

    Persist(delivery);
    TAMS_LOG_WARN("webhook delivery failed, retrying", {observability::UintField("event_id", delivery.event_id),
                                                         observability::StringField("url", delivery.webhook_url),
                                                         observability::UintField("attempt", delivery.attempts),
                                                         observability::IntField("backoff_ms", backoff.count()),
                                                         observability::StringField("error", result.error)});
    if (!SleepFor(backoff)) return;
    backoff = std::min(backoff * 2, options_.max_backoff);
  }
}

} // namespace tams::events
