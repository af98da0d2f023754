#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/deletion_request_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/flow_record.hpp"
#include "internal/db/model/media_object_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/db/model/webhook_record.hpp"

namespace tams::db {

// Keyset page over string identifiers, ascending.
struct Page {
  std::size_t                limit = 50;
  std::optional<std::string> after_id;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Writes report failure through Result; reads that fail at the engine
    level throw util::StorageFailure
  - Segment rows and media object reference counts only change together,
    inside the caller's transaction

  The DB is the source of truth for:
    sources, flows, segments, media objects
    webhooks, deletion requests
    the event outbox and its delivery bookkeeping
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  virtual Result InsertSource(Transaction&, const model::SourceRecord&) = 0;

  virtual std::optional<model::SourceRecord> GetSource(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SourceRecord> ListSources(Transaction&, const model::SourceFilter&, const Page&) = 0;

  virtual Result UpdateSource(Transaction&, const model::SourceRecord&) = 0;

  // Clears source_id on every flow that referenced it.
  virtual Result DeleteSource(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Flows
  // ---------------------------------------------------------------------

  virtual Result InsertFlow(Transaction&, const model::FlowRecord&) = 0;

  virtual std::optional<model::FlowRecord> GetFlow(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::FlowRecord> ListFlows(Transaction&, const model::FlowFilter&, const Page&) = 0;

  virtual Result UpdateFlow(Transaction&, const model::FlowRecord&) = 0;

  // Removes the flow and any segment rows still attached to it.
  virtual Result DeleteFlow(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------

  virtual Result InsertSegment(Transaction&, const model::SegmentRecord&) = 0;

  virtual std::vector<model::SegmentRecord> FindSegments(Transaction&, const model::SegmentQuery&) = 0;

  virtual Result DeleteSegment(Transaction&, const std::string& flow_id, const std::string& object_id,
                               const tams::model::TimeRange& timerange) = 0;

  // ---------------------------------------------------------------------
  // Media objects
  // ---------------------------------------------------------------------

  virtual Result UpsertMediaObject(Transaction&, const model::MediaObjectRecord&) = 0;

  virtual std::optional<model::MediaObjectRecord> GetMediaObject(Transaction&, const std::string& object_id) = 0;

  virtual Result DeleteMediaObject(Transaction&, const std::string& object_id) = 0;

  // Objects with no references whose unreferenced_since is at or before `cutoff`.
  virtual std::vector<model::MediaObjectRecord> ListOrphanedMediaObjects(Transaction&, util::WallTime cutoff, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Webhooks
  // ---------------------------------------------------------------------

  virtual Result UpsertWebhook(Transaction&, const model::WebhookRecord&) = 0;

  virtual std::optional<model::WebhookRecord> GetWebhook(Transaction&, const std::string& url) = 0;

  virtual std::vector<model::WebhookRecord> ListWebhooks(Transaction&) = 0;

  virtual Result DeleteWebhook(Transaction&, const std::string& url) = 0;

  // ---------------------------------------------------------------------
  // Deletion requests
  // ---------------------------------------------------------------------

  virtual Result InsertDeletionRequest(Transaction&, const model::DeletionRequestRecord&) = 0;

  virtual std::optional<model::DeletionRequestRecord> GetDeletionRequest(Transaction&, const std::string& id) = 0;

  // Ordered by created_at ascending.
  virtual std::vector<model::DeletionRequestRecord> ListDeletionRequests(Transaction&) = 0;

  virtual Result UpdateDeletionRequest(Transaction&, const model::DeletionRequestRecord&) = 0;

  // ---------------------------------------------------------------------
  // Event outbox
  // ---------------------------------------------------------------------

  // Assigns event.id.
  virtual Result AppendEvent(Transaction&, model::EventRecord& event) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, uint64_t id) = 0;

  // Ordered by id ascending.
  virtual std::vector<model::EventRecord> ListUndispatchedEvents(Transaction&, std::size_t limit) = 0;

  virtual Result MarkEventDispatched(Transaction&, uint64_t id) = 0;

  virtual Result InsertDelivery(Transaction&, const model::DeliveryRecord&) = 0;

  virtual Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) = 0;

  // Ordered by event_id ascending.
  virtual std::vector<model::DeliveryRecord> ListPendingDeliveries(Transaction&) = 0;
};

} // namespace tams::db
