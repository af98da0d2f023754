#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/catalog_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_notifier.hpp"
#include "internal/storage/ram/ram_object_store.hpp"

namespace {

using namespace std::chrono_literals;
using tams::events::EventNotifier;
using tams::events::SendResult;
using tams::events::WebhookRequest;
using tams::events::WebhookSender;
using tams::model::TimeRange;

constexpr const char* kAllHook     = "http://hooks.example/all";
constexpr const char* kDeletedHook = "http://hooks.example/deleted";

class RecordingSender final : public WebhookSender {
 public:
  SendResult Send(const WebhookRequest& request) override {
    std::lock_guard lock(mutex_);
    ++attempts_[request.url];
    if (failures_[request.url] > 0) {
      --failures_[request.url];
      return SendResult{false, 503, "service unavailable"};
    }
    delivered_[request.url].push_back(request);
    return SendResult{true, 200, ""};
  }

  void FailNext(const std::string& url, int count) {
    std::lock_guard lock(mutex_);
    failures_[url] = count;
  }

  int Attempts(const std::string& url) {
    std::lock_guard lock(mutex_);
    return attempts_[url];
  }

  std::vector<WebhookRequest> Delivered(const std::string& url) {
    std::lock_guard lock(mutex_);
    return delivered_[url];
  }

 private:
  std::mutex                                         mutex_;
  std::map<std::string, int>                         failures_;
  std::map<std::string, int>                         attempts_;
  std::map<std::string, std::vector<WebhookRequest>> delivered_;
};

// Forwards to an in-memory catalog; delivery bookkeeping writes can be made to fail.
class FlakyDeliveryRepository final : public tams::db::Repository {
 public:
  using Result = tams::db::Result;
  using Tx     = tams::db::Transaction;

  explicit FlakyDeliveryRepository(std::shared_ptr<tams::db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailDeliveryUpdates(int count) {
    failures_ = count;
  }

  std::unique_ptr<Tx> Begin() override {
    return inner_->Begin();
  }

  Result InsertSource(Tx& tx, const tams::db::model::SourceRecord& r) override {
    return inner_->InsertSource(tx, r);
  }
  std::optional<tams::db::model::SourceRecord> GetSource(Tx& tx, const std::string& id) override {
    return inner_->GetSource(tx, id);
  }
  std::vector<tams::db::model::SourceRecord> ListSources(Tx& tx, const tams::db::model::SourceFilter& f, const tams::db::Page& p) override {
    return inner_->ListSources(tx, f, p);
  }
  Result UpdateSource(Tx& tx, const tams::db::model::SourceRecord& r) override {
    return inner_->UpdateSource(tx, r);
  }
  Result DeleteSource(Tx& tx, const std::string& id) override {
    return inner_->DeleteSource(tx, id);
  }

  Result InsertFlow(Tx& tx, const tams::db::model::FlowRecord& r) override {
    return inner_->InsertFlow(tx, r);
  }
  std::optional<tams::db::model::FlowRecord> GetFlow(Tx& tx, const std::string& id) override {
    return inner_->GetFlow(tx, id);
  }
  std::vector<tams::db::model::FlowRecord> ListFlows(Tx& tx, const tams::db::model::FlowFilter& f, const tams::db::Page& p) override {
    return inner_->ListFlows(tx, f, p);
  }
  Result UpdateFlow(Tx& tx, const tams::db::model::FlowRecord& r) override {
    return inner_->UpdateFlow(tx, r);
  }
  Result DeleteFlow(Tx& tx, const std::string& id) override {
    return inner_->DeleteFlow(tx, id);
  }

  Result InsertSegment(Tx& tx, const tams::db::model::SegmentRecord& r) override {
    return inner_->InsertSegment(tx, r);
  }
  std::vector<tams::db::model::SegmentRecord> FindSegments(Tx& tx, const tams::db::model::SegmentQuery& q) override {
    return inner_->FindSegments(tx, q);
  }
  Result DeleteSegment(Tx& tx, const std::string& flow_id, const std::string& object_id, const TimeRange& timerange) override {
    return inner_->DeleteSegment(tx, flow_id, object_id, timerange);
  }

  Result UpsertMediaObject(Tx& tx, const tams::db::model::MediaObjectRecord& r) override {
    return inner_->UpsertMediaObject(tx, r);
  }
  std::optional<tams::db::model::MediaObjectRecord> GetMediaObject(Tx& tx, const std::string& id) override {
    return inner_->GetMediaObject(tx, id);
  }
  Result DeleteMediaObject(Tx& tx, const std::string& id) override {
    return inner_->DeleteMediaObject(tx, id);
  }
  std::vector<tams::db::model::MediaObjectRecord> ListOrphanedMediaObjects(Tx& tx, tams::util::WallTime cutoff, std::size_t limit) override {
    return inner_->ListOrphanedMediaObjects(tx, cutoff, limit);
  }

  Result UpsertWebhook(Tx& tx, const tams::db::model::WebhookRecord& r) override {
    return inner_->UpsertWebhook(tx, r);
  }
  std::optional<tams::db::model::WebhookRecord> GetWebhook(Tx& tx, const std::string& url) override {
    return inner_->GetWebhook(tx, url);
  }
  std::vector<tams::db::model::WebhookRecord> ListWebhooks(Tx& tx) override {
    return inner_->ListWebhooks(tx);
  }
  Result DeleteWebhook(Tx& tx, const std::string& url) override {
    return inner_->DeleteWebhook(tx, url);
  }

  Result InsertDeletionRequest(Tx& tx, const tams::db::model::DeletionRequestRecord& r) override {
    return inner_->InsertDeletionRequest(tx, r);
  }
  std::optional<tams::db::model::DeletionRequestRecord> GetDeletionRequest(Tx& tx, const std::string& id) override {
    return inner_->GetDeletionRequest(tx, id);
  }
  std::vector<tams::db::model::DeletionRequestRecord> ListDeletionRequests(Tx& tx) override {
    return inner_->ListDeletionRequests(tx);
  }
  Result UpdateDeletionRequest(Tx& tx, const tams::db::model::DeletionRequestRecord& r) override {
    return inner_->UpdateDeletionRequest(tx, r);
  }

  Result AppendEvent(Tx& tx, tams::db::model::EventRecord& event) override {
    return inner_->AppendEvent(tx, event);
  }
  std::optional<tams::db::model::EventRecord> GetEvent(Tx& tx, uint64_t id) override {
    return inner_->GetEvent(tx, id);
  }
  std::vector<tams::db::model::EventRecord> ListUndispatchedEvents(Tx& tx, std::size_t limit) override {
    return inner_->ListUndispatchedEvents(tx, limit);
  }
  Result MarkEventDispatched(Tx& tx, uint64_t id) override {
    return inner_->MarkEventDispatched(tx, id);
  }
  Result InsertDelivery(Tx& tx, const tams::db::model::DeliveryRecord& r) override {
    return inner_->InsertDelivery(tx, r);
  }
  Result UpdateDelivery(Tx& tx, const tams::db::model::DeliveryRecord& r) override {
    if (failures_.fetch_sub(1) > 0) {
      return Result::Err(tams::db::ErrorCode::InternalError, "disk I/O error");
    }
    return inner_->UpdateDelivery(tx, r);
  }
  std::vector<tams::db::model::DeliveryRecord> ListPendingDeliveries(Tx& tx) override {
    return inner_->ListPendingDeliveries(tx);
  }

 private:
  std::shared_ptr<tams::db::Repository> inner_;
  std::atomic<int>                      failures_{0};
};

google::protobuf::Struct ParseBody(const std::string& body) {
  google::protobuf::Struct parsed;
  const auto               status = google::protobuf::util::JsonStringToMessage(body, &parsed);
  assert(status.ok());
  return parsed;
}

std::vector<std::string> EventTypes(const std::vector<WebhookRequest>& requests) {
  std::vector<std::string> types;
  for (const auto& request : requests) {
    types.push_back(ParseBody(request.body).fields().at("event_type").string_value());
  }
  return types;
}

struct Harness {
  std::shared_ptr<tams::db::memory::MemoryRepository> repository = std::make_shared<tams::db::memory::MemoryRepository>();
  std::shared_ptr<RecordingSender>                    sender     = std::make_shared<RecordingSender>();
  tams::core::CatalogManager                          catalog{repository, std::make_shared<tams::index::SegmentIndex>(repository),
                                     std::make_shared<tams::storage::RamObjectStore>(), tams::core::CatalogOptions{}};

  static tams::events::NotifierOptions Options(uint32_t max_attempts = 5) {
    tams::events::NotifierOptions options;
    options.poll_interval   = 1h;
    options.max_attempts    = max_attempts;
    options.initial_backoff = 1ms;
    options.max_backoff     = 4ms;
    options.attempt_timeout = 1s;
    options.lanes           = 2;
    return options;
  }

  std::unique_ptr<EventNotifier> Notifier(uint32_t max_attempts = 5) {
    return std::make_unique<EventNotifier>(repository, sender, Options(max_attempts));
  }

  void Subscribe(const std::string& url, std::vector<std::string> events, const std::string& key_name = "") {
    tams::db::model::WebhookRecord webhook;
    webhook.url    = url;
    webhook.events = std::move(events);
    if (!key_name.empty()) {
      webhook.api_key_name  = key_name;
      webhook.api_key_value = "token-123";
    }
    catalog.RegisterWebhook(webhook);
  }

  // source.created, flow.created, segments.added, segments.deleted x2
  std::string ProduceEvents() {
    tams::db::model::SourceRecord source;
    source = catalog.CreateSource(source);

    tams::db::model::FlowRecord flow;
    flow.source_id = source.id;
    flow           = catalog.CreateFlow(flow);

    tams::db::model::SegmentRecord segment;
    segment.object_id = "obj-1";
    segment.timerange = TimeRange::Parse("[0:0_10:0)");
    catalog.AddSegments(flow.id, {segment}, false);

    catalog.DeleteSegments(flow.id, TimeRange::Parse("[0:0_2:0)"));
    catalog.DeleteSegments(flow.id, TimeRange::Parse("[8:0_10:0)"));
    return flow.id;
  }

  std::size_t PendingDeliveries() {
    auto tx = repository->Begin();
    return repository->ListPendingDeliveries(*tx).size();
  }
};

void TestFanOutPreservesPerWebhookOrder() {
  Harness h;
  h.Subscribe(kAllHook, {"*"});
  h.Subscribe(kDeletedHook, {"segments.deleted"});
  const auto flow_id = h.ProduceEvents();

  auto notifier = h.Notifier();
  notifier->Start();
  notifier->DispatchPending();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  const std::vector<std::string> all = {"source.created", "flow.created", "segments.added", "segments.deleted", "segments.deleted"};
  assert(EventTypes(h.sender->Delivered(kAllHook)) == all);

  const auto deleted = h.sender->Delivered(kDeletedHook);
  assert(EventTypes(deleted) == (std::vector<std::string>{"segments.deleted", "segments.deleted"}));

  const auto first = ParseBody(deleted[0].body);
  assert(!first.fields().at("event_timestamp").string_value().empty());
  const auto& event = first.fields().at("event").struct_value().fields();
  assert(event.at("flow_id").string_value() == flow_id);
  assert(event.at("timerange").string_value() == "[0:0_2:0)");
  assert(ParseBody(deleted[1].body).fields().at("event").struct_value().fields().at("timerange").string_value() == "[8:0_10:0)");

  assert(h.PendingDeliveries() == 0);
  // nothing left to dispatch
  assert(notifier->DispatchPending() == 0);
}

void TestTransientFailureIsRetried() {
  Harness h;
  h.Subscribe(kAllHook, {"*"});
  h.sender->FailNext(kAllHook, 2);
  h.ProduceEvents();

  auto notifier = h.Notifier();
  notifier->Start();
  notifier->DispatchPending();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  // the retried event is still delivered first
  const auto delivered = EventTypes(h.sender->Delivered(kAllHook));
  assert(delivered.size() == 5);
  assert(delivered.front() == "source.created");
  assert(h.sender->Attempts(kAllHook) == 7);
  assert(h.PendingDeliveries() == 0);
}

void TestExhaustionMarksFailedAndLaneMovesOn() {
  Harness h;
  h.Subscribe(kAllHook, {"source.created", "flow.created"});
  h.sender->FailNext(kAllHook, 3);
  h.ProduceEvents();

  auto notifier = h.Notifier(3);
  notifier->Start();
  notifier->DispatchPending();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  assert(h.sender->Attempts(kAllHook) == 4);
  assert(EventTypes(h.sender->Delivered(kAllHook)) == std::vector<std::string>{"flow.created"});
  // failed rows are not pending
  assert(h.PendingDeliveries() == 0);
}

void TestApiKeyHeader() {
  Harness h;
  h.Subscribe(kAllHook, {"source.created"}, "X-Api-Key");
  tams::db::model::SourceRecord source;
  h.catalog.CreateSource(source);

  auto notifier = h.Notifier();
  notifier->Start();
  notifier->DispatchPending();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  const auto delivered = h.sender->Delivered(kAllHook);
  assert(delivered.size() == 1);
  assert(delivered[0].headers.size() == 1);
  assert(delivered[0].headers[0].first == "X-Api-Key");
  assert(delivered[0].headers[0].second == "token-123");
  assert(delivered[0].timeout == 1s);
}

void TestPendingDeliveriesSurviveRestart() {
  Harness h;
  h.Subscribe(kDeletedHook, {"segments.deleted"});
  h.ProduceEvents();

  {
    // dispatched but never started: rows stay pending
    auto stopped = h.Notifier();
    assert(stopped->DispatchPending() == 5);
  }
  assert(h.PendingDeliveries() == 2);
  assert(h.sender->Attempts(kDeletedHook) == 0);

  auto notifier = h.Notifier();
  notifier->Start();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  assert(h.sender->Delivered(kDeletedHook).size() == 2);
  assert(h.PendingDeliveries() == 0);
}

void TestRemovedWebhookIsDropped() {
  Harness h;
  h.Subscribe(kAllHook, {"*"});
  tams::db::model::SourceRecord source;
  h.catalog.CreateSource(source);

  {
    auto stopped = h.Notifier();
    stopped->DispatchPending();
  }
  h.catalog.DeleteWebhook(kAllHook);

  auto notifier = h.Notifier();
  notifier->Start();
  assert(notifier->WaitIdle(5s));
  notifier->Stop();

  assert(h.sender->Attempts(kAllHook) == 0);
  assert(h.PendingDeliveries() == 0);
}

void TestStorageFailureHoldsLaneOrder() {
  Harness h;
  h.Subscribe(kAllHook, {"source.created"});
  for (const auto* label : {"first", "second", "third"}) {
    tams::db::model::SourceRecord source;
    source.label = label;
    h.catalog.CreateSource(source);
  }

  auto flaky = std::make_shared<FlakyDeliveryRepository>(h.repository);
  // the first delivery is sent but recording it fails twice
  flaky->FailDeliveryUpdates(2);

  EventNotifier notifier(flaky, h.sender, Harness::Options());
  notifier.Start();
  notifier.DispatchPending();
  assert(notifier.WaitIdle(5s));
  notifier.Stop();

  std::vector<std::string> labels;
  for (const auto& request : h.sender->Delivered(kAllHook)) {
    labels.push_back(ParseBody(request.body).fields().at("event").struct_value().fields().at("label").string_value());
  }
  // the interrupted event is resent before the lane moves on
  assert((labels == std::vector<std::string>{"first", "first", "first", "second", "third"}));
  assert(h.PendingDeliveries() == 0);
}

} // namespace

int main() {
  TestFanOutPreservesPerWebhookOrder();
  TestTransientFailureIsRetried();
  TestExhaustionMarksFailedAndLaneMovesOn();
  TestApiKeyHeader();
  TestPendingDeliveriesSurviveRestart();
  TestRemovedWebhookIsDropped();
  TestStorageFailureHoldsLaneOrder();

  std::cout << "event_notifier_test: pass\n";
  return 0;
}
