#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tams::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSource(Transaction&, const model::SourceRecord&) override;
  std::optional<model::SourceRecord> GetSource(Transaction&, const std::string&) override;
  std::vector<model::SourceRecord> ListSources(Transaction&, const model::SourceFilter&, const Page&) override;
  Result UpdateSource(Transaction&, const model::SourceRecord&) override;
  Result DeleteSource(Transaction&, const std::string&) override;

  Result InsertFlow(Transaction&, const model::FlowRecord&) override;
  std::optional<model::FlowRecord> GetFlow(Transaction&, const std::string&) override;
  std::vector<model::FlowRecord> ListFlows(Transaction&, const model::FlowFilter&, const Page&) override;
  Result UpdateFlow(Transaction&, const model::FlowRecord&) override;
  Result DeleteFlow(Transaction&, const std::string&) override;

  Result InsertSegment(Transaction&, const model::SegmentRecord&) override;
  std::vector<model::SegmentRecord> FindSegments(Transaction&, const model::SegmentQuery&) override;
  Result DeleteSegment(Transaction&, const std::string& flow_id, const std::string& object_id,
                       const tams::model::TimeRange& timerange) override;

  Result UpsertMediaObject(Transaction&, const model::MediaObjectRecord&) override;
  std::optional<model::MediaObjectRecord> GetMediaObject(Transaction&, const std::string&) override;
  Result DeleteMediaObject(Transaction&, const std::string&) override;
  std::vector<model::MediaObjectRecord> ListOrphanedMediaObjects(Transaction&, util::WallTime cutoff, std::size_t limit) override;

  Result UpsertWebhook(Transaction&, const model::WebhookRecord&) override;
  std::optional<model::WebhookRecord> GetWebhook(Transaction&, const std::string&) override;
  std::vector<model::WebhookRecord> ListWebhooks(Transaction&) override;
  Result DeleteWebhook(Transaction&, const std::string&) override;

  Result InsertDeletionRequest(Transaction&, const model::DeletionRequestRecord&) override;
  std::optional<model::DeletionRequestRecord> GetDeletionRequest(Transaction&, const std::string&) override;
  std::vector<model::DeletionRequestRecord> ListDeletionRequests(Transaction&) override;
  Result UpdateDeletionRequest(Transaction&, const model::DeletionRequestRecord&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, uint64_t) override;
  std::vector<model::EventRecord> ListUndispatchedEvents(Transaction&, std::size_t limit) override;
  Result MarkEventDispatched(Transaction&, uint64_t) override;
  Result InsertDelivery(Transaction&, const model::DeliveryRecord&) override;
  Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) override;
  std::vector<model::DeliveryRecord> ListPendingDeliveries(Transaction&) override;

private:
  friend class MemoryTransaction;

  using DeliveryKey = std::pair<uint64_t, std::string>;

  struct State {
    std::map<std::string, model::SourceRecord> sources;
    std::map<std::string, model::FlowRecord> flows;

    // flow id -> segments, kept sorted by timerange
    std::unordered_map<std::string, std::vector<model::SegmentRecord>> segments;

    std::unordered_map<std::string, model::MediaObjectRecord> media_objects;
    std::map<std::string, model::WebhookRecord> webhooks;
    std::unordered_map<std::string, model::DeletionRequestRecord> deletion_requests;

    std::map<uint64_t, model::EventRecord> events;
    std::map<DeliveryKey, model::DeliveryRecord> deliveries;
    uint64_t next_event_id = 1;
  };

  // held by the open transaction, if any
  std::mutex tx_mutex_;
  State committed_;
};

}
