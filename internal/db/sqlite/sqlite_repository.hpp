#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tams::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);
  // Translate + NotFound when the statement touched no row.
  static Result TranslateChange(sqlite3* db, int rc, const std::string& what);

  std::shared_ptr<SqliteDB> db_;
};

}
