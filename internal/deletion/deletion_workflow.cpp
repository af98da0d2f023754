#include "deletion_workflow.hpp"

#include <stdexcept>

#include "internal/core/proto_codec.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/event_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tams::deletion {

using tams::model::DeletionStatus;
using tams::model::TimeRange;

namespace {

class LeaseGuard {
 public:
  LeaseGuard(lease::LeaseTable& table, lease::Lease lease) : table_(table), lease_(std::move(lease)) {
  }
  ~LeaseGuard() {
    table_.Release(lease_);
  }

  const lease::Lease& Get() const {
    return lease_;
  }

 private:
  lease::LeaseTable& table_;
  lease::Lease       lease_;
};

void LogTransition(const db::model::DeletionRequestRecord& request, DeletionStatus from) {
  TAMS_LOG_INFO("deletion request transition",
                {observability::StringField("request_id", request.id), observability::StringField("flow_id", request.flow_id),
                 observability::StringField("from", tams::model::ToString(from)),
                 observability::StringField("to", tams::model::ToString(request.status)),
                 observability::UintField("segments_processed", request.segments_processed),
                 observability::StringField("error", request.error)});
}

// Front of `remaining` that holds the next `batch_size` segments.
TimeRange NextBatchRange(const TimeRange& remaining, const std::vector<db::model::SegmentRecord>& segments, std::size_t batch_size) {
  if (segments.size() <= batch_size) {
    return remaining;
  }
  const auto& last = segments[batch_size - 1].timerange;
  auto        head = TimeRange::Make(remaining.start, remaining.start_inclusive, last.end, last.end_inclusive);
  if (!head) {
    return remaining;
  }
  auto clipped = tams::model::Intersect(*head, remaining);
  return clipped ? *clipped : remaining;
}

} // namespace

DeletionWorkflow::DeletionWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::SegmentIndex> index,
                                   std::shared_ptr<lease::LeaseTable> leases, DeletionOptions options, DeletionHooks hooks)
    : repository_(std::move(repository)),
      index_(std::move(index)),
      leases_(std::move(leases)),
      options_(std::move(options)),
      hooks_(std::move(hooks)) {
  if (options_.batch_size == 0) {
    throw std::invalid_argument("deletion batch size must be positive");
  }
}

void DeletionWorkflow::Transition(db::model::DeletionRequestRecord& request, DeletionStatus to, const std::string& error) {
  if (!tams::model::CanTransition(request.status, to)) {
    throw util::InvalidState("deletion request " + request.id + " cannot move from " + std::string(tams::model::ToString(request.status)) +
                             " to " + std::string(tams::model::ToString(to)));
  }
  request.status     = to;
  request.updated_at = util::Now();
  if (!error.empty()) request.error = error;
}

db::model::DeletionRequestRecord DeletionWorkflow::Create(const std::string& flow_id, const TimeRange& timerange) {
  if (!util::IsUUID(flow_id)) {
    throw util::ParseError("flow id is not a UUID: " + flow_id);
  }
  if (timerange.IsEmpty()) {
    throw util::ParseError("deletion timerange is empty");
  }

  db::model::DeletionRequestRecord request;
  request.id         = util::NewId();
  request.flow_id    = flow_id;
  request.timerange  = timerange;
  request.remaining  = timerange;
  request.created_at = util::Now();
  request.updated_at = request.created_at;

  auto tx   = repository_->Begin();
  auto flow = repository_->GetFlow(*tx, flow_id);
  if (!flow) {
    throw util::NotFound("flow not found: " + flow_id);
  }
  if (flow->read_only) {
    throw util::ReadOnlyFlow("flow is read-only: " + flow_id);
  }
  db::ThrowIfDbError(repository_->InsertDeletionRequest(*tx, request), "create deletion request");
  tx->Commit();

  TAMS_LOG_INFO("deletion request created", {observability::StringField("request_id", request.id),
                                             observability::StringField("flow_id", flow_id),
                                             observability::StringField("timerange", timerange.ToString())});
  if (hooks_.on_created) hooks_.on_created(request.id);
  return request;
}

db::model::DeletionRequestRecord DeletionWorkflow::Get(const std::string& id) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetDeletionRequest(*tx, id);
  if (!request) {
    throw util::NotFound("deletion request not found: " + id);
  }
  return *request;
}

std::vector<db::model::DeletionRequestRecord> DeletionWorkflow::List() {
  auto tx = repository_->Begin();
  return repository_->ListDeletionRequests(*tx);
}

std::vector<std::string> DeletionWorkflow::ListResumable() {
  std::vector<std::string> ids;
  for (const auto& request : List()) {
    if (!tams::model::IsTerminal(request.status)) ids.push_back(request.id);
  }
  return ids;
}

db::model::DeletionRequestRecord DeletionWorkflow::Cancel(const std::string& id) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetDeletionRequest(*tx, id);
  if (!request) {
    throw util::NotFound("deletion request not found: " + id);
  }

  const auto from = request->status;
  switch (from) {
    case DeletionStatus::kPending:
      Transition(*request, DeletionStatus::kError, "cancelled");
      break;
    case DeletionStatus::kProcessing:
      request->cancel_requested = true;
      request->updated_at       = util::Now();
      break;
    default:
      throw util::InvalidState("deletion request " + id + " is already " + std::string(tams::model::ToString(from)));
  }

  db::ThrowIfDbError(repository_->UpdateDeletionRequest(*tx, *request), "cancel deletion request");
  tx->Commit();

  if (request->status != from) {
    LogTransition(*request, from);
  } else {
    TAMS_LOG_INFO("deletion request cancel requested", {observability::StringField("request_id", id)});
  }
  return *request;
}

BatchOutcome DeletionWorkflow::ProcessBatch(const std::string& id) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetDeletionRequest(*tx, id);
  if (!request) {
    throw util::NotFound("deletion request not found: " + id);
  }
  if (tams::model::IsTerminal(request->status)) {
    return BatchOutcome::kFinished;
  }

  const auto from       = request->status;
  bool       has_events = false;

  if (request->cancel_requested) {
    Transition(*request, DeletionStatus::kError, "cancelled");
  } else {
    Transition(*request, DeletionStatus::kProcessing);

    if (request->remaining) {
      db::model::SegmentQuery query;
      query.flow_id = request->flow_id;
      query.range   = *request->remaining;
      query.limit   = options_.batch_size + 1;

      const auto batch  = NextBatchRange(*request->remaining, repository_->FindSegments(*tx, query), options_.batch_size);
      const auto result = index_->DeleteRange(*tx, request->flow_id, batch);

      request->segments_processed += result.Affected();
      const auto rest = tams::model::Subtract(*request->remaining, batch);
      if (rest.empty()) {
        request->remaining.reset();
      } else {
        request->remaining = rest.back();
      }

      if (result.Affected() > 0) {
        tams::v1::SegmentsDeletedEvent event;
        event.set_flow_id(request->flow_id);
        event.set_timerange(batch.ToString());
        events::AppendEvent(*repository_, *tx, tams::model::kSegmentsDeleted, event);
        has_events = true;
      }
    }

    if (!request->remaining) {
      Transition(*request, DeletionStatus::kCompleted);
      if (auto flow = repository_->GetFlow(*tx, request->flow_id)) {
        events::AppendEvent(*repository_, *tx, tams::model::kFlowUpdated, core::ToProto(*flow));
        has_events = true;
      }
    }
  }

  db::ThrowIfDbError(repository_->UpdateDeletionRequest(*tx, *request), "update deletion request");
  tx->Commit();

  if (has_events && hooks_.on_events) hooks_.on_events();
  if (request->status != from) {
    LogTransition(*request, from);
  } else {
    TAMS_LOG_DEBUG("deletion batch committed", {observability::StringField("request_id", id),
                                                observability::UintField("segments_processed", request->segments_processed)});
  }
  return tams::model::IsTerminal(request->status) ? BatchOutcome::kFinished : BatchOutcome::kContinue;
}

void DeletionWorkflow::MarkFailed(const std::string& id, const std::string& error) {
  auto tx      = repository_->Begin();
  auto request = repository_->GetDeletionRequest(*tx, id);
  if (!request || tams::model::IsTerminal(request->status)) {
    return;
  }

  const auto from = request->status;
  Transition(*request, DeletionStatus::kError, error);
  db::ThrowIfDbError(repository_->UpdateDeletionRequest(*tx, *request), "fail deletion request");
  tx->Commit();
  LogTransition(*request, from);
}

bool DeletionWorkflow::Run(const std::string& id) {
  auto acquired = leases_->TryAcquire(id, options_.holder, options_.lease_ttl);
  if (!acquired) {
    TAMS_LOG_DEBUG("deletion request held elsewhere", {observability::StringField("request_id", id)});
    return false;
  }
  LeaseGuard guard(*leases_, std::move(*acquired));

  while (true) {
    BatchOutcome outcome;
    try {
      outcome = ProcessBatch(id);
    } catch (const util::StorageFailure& e) {
      // the request stays resumable; the next scan or restart picks it up
      TAMS_LOG_ERROR("deletion batch failed", {observability::StringField("request_id", id), observability::StringField("error", e.what())});
      return true;
    } catch (const std::exception& e) {
      TAMS_LOG_ERROR("deletion request failed", {observability::StringField("request_id", id), observability::StringField("error", e.what())});
      MarkFailed(id, e.what());
      return true;
    }

    if (outcome == BatchOutcome::kFinished) {
      return true;
    }
    if (!leases_->Renew(guard.Get(), options_.lease_ttl)) {
      TAMS_LOG_WARN("deletion lease lost", {observability::StringField("request_id", id)});
      return false;
    }
  }
}

} // namespace tams::deletion
