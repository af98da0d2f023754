#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tams::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
  // NotFound when the statement touched no row.
  static Result Changed(const pqxx::result& res, const std::string& what);
};

}
