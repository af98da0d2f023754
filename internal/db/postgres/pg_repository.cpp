#include "pg_repository.hpp"

#include <utility>

#include "internal/db/sql/record_codec.hpp"
#include "internal/util/errors.hpp"

namespace tams::db::postgres {

namespace {

// Reads surface engine failures as StorageFailure, writes as Result.
template <typename... Args>
pqxx::result Query(pqxx::transaction_base& work, const char* statement, Args&&... args) {
  try {
    return work.exec_prepared(statement, std::forward<Args>(args)...);
  } catch (const pqxx::failure& e) {
    throw util::StorageFailure(std::string(statement) + ": " + e.what());
  }
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

template <typename T>
std::optional<T> Opt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

std::optional<int64_t> AsI64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::optional<int64_t> AsI64(const std::optional<uint32_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::optional<std::string> FormatParam(const std::optional<tams::model::Format>& format) {
  if (!format) return std::nullopt;
  return std::string(tams::model::ToUrn(*format));
}

std::optional<std::string> TimeParam(const std::optional<util::WallTime>& t) {
  if (!t) return std::nullopt;
  return util::FormatIso8601(*t);
}

std::optional<std::string> RangeParam(const std::optional<tams::model::TimeRange>& r) {
  if (!r) return std::nullopt;
  return r->ToString();
}

model::SourceRecord ReadSource(const pqxx::row& row) {
  model::SourceRecord r;
  r.id          = Text(row[0]);
  r.format      = sql::DecodeFormat(Text(row[1]));
  r.label       = Text(row[2]);
  r.description = Text(row[3]);
  r.tags        = sql::DecodeTags(Text(row[4]));
  r.created_at  = sql::DecodeTime(Text(row[5]));
  r.updated_at  = sql::DecodeTime(Text(row[6]));
  return r;
}

model::FlowRecord ReadFlow(const pqxx::row& row) {
  model::FlowRecord r;
  r.id              = Text(row[0]);
  r.source_id       = Opt<std::string>(row[1]);
  r.format          = sql::DecodeFormat(Text(row[2]));
  r.label           = Text(row[3]);
  r.description     = Text(row[4]);
  r.tags            = sql::DecodeTags(Text(row[5]));
  r.read_only       = row[6].as<int>() != 0;
  r.max_bit_rate    = Opt<uint64_t>(row[7]);
  r.avg_bit_rate    = Opt<uint64_t>(row[8]);
  r.container       = Text(row[9]);
  r.codec           = Text(row[10]);
  r.frame_width     = Opt<uint32_t>(row[11]);
  r.frame_height    = Opt<uint32_t>(row[12]);
  r.sample_rate     = Opt<uint32_t>(row[13]);
  r.channels        = Opt<uint32_t>(row[14]);
  r.flow_collection = sql::DecodeFlowCollection(Text(row[15]));
  r.available       = sql::DecodeTimeRangeSet(Text(row[16]));
  r.created_at      = sql::DecodeTime(Text(row[17]));
  r.updated_at      = sql::DecodeTime(Text(row[18]));
  return r;
}

model::SegmentRecord ReadSegment(const pqxx::row& row) {
  model::SegmentRecord r;
  r.flow_id         = Text(row[0]);
  r.object_id       = Text(row[1]);
  r.timerange       = sql::DecodeTimeRange(Text(row[2]));
  r.ts_offset       = sql::DecodeTimePoint(Text(row[3]));
  r.sample_offset   = Opt<uint64_t>(row[4]);
  r.sample_count    = Opt<uint64_t>(row[5]);
  r.key_frame_count = Opt<uint64_t>(row[6]);
  r.get_urls        = sql::DecodeGetUrls(Text(row[7]));
  r.created_at      = sql::DecodeTime(Text(row[8]));
  return r;
}

model::MediaObjectRecord ReadMediaObject(const pqxx::row& row) {
  model::MediaObjectRecord r;
  r.object_id       = Text(row[0]);
  r.size_bytes      = row[1].as<uint64_t>();
  r.mime_type       = Text(row[2]);
  r.flow_references = sql::DecodeFlowReferences(Text(row[3]));
  r.created_at      = sql::DecodeTime(Text(row[4]));
  if (!row[5].is_null()) r.unreferenced_since = sql::DecodeTime(Text(row[5]));
  return r;
}

model::WebhookRecord ReadWebhook(const pqxx::row& row) {
  model::WebhookRecord r;
  r.url           = Text(row[0]);
  r.api_key_name  = Text(row[1]);
  r.api_key_value = Text(row[2]);
  r.events        = sql::DecodeStrings(Text(row[3]));
  return r;
}

model::DeletionRequestRecord ReadDeletionRequest(const pqxx::row& row) {
  model::DeletionRequestRecord r;
  r.id        = Text(row[0]);
  r.flow_id   = Text(row[1]);
  r.timerange = sql::DecodeTimeRange(Text(row[2]));

  const auto status = tams::model::DeletionStatusFromString(Text(row[3]));
  if (!status) throw util::StorageFailure("corrupt deletion request status: " + Text(row[3]));
  r.status = *status;

  if (!row[4].is_null()) r.remaining = sql::DecodeTimeRange(Text(row[4]));
  r.segments_processed = row[5].as<uint64_t>();
  r.error              = Text(row[6]);
  r.cancel_requested   = row[7].as<int>() != 0;
  r.created_at         = sql::DecodeTime(Text(row[8]));
  r.updated_at         = sql::DecodeTime(Text(row[9]));
  return r;
}

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id         = row[0].as<uint64_t>();
  r.event_type = Text(row[1]);
  r.payload    = Text(row[2]);
  r.created_at = sql::DecodeTime(Text(row[3]));
  r.dispatched = row[4].as<int>() != 0;
  return r;
}

model::DeliveryRecord ReadDelivery(const pqxx::row& row) {
  model::DeliveryRecord r;
  r.event_id    = row[0].as<uint64_t>();
  r.webhook_url = Text(row[1]);
  r.status      = Text(row[2]);
  r.attempts    = row[3].as<uint32_t>();
  r.last_error  = Text(row[4]);
  r.updated_at  = sql::DecodeTime(Text(row[5]));
  return r;
}

pqxx::result ExecSource(pqxx::transaction_base& w, const char* statement, const model::SourceRecord& r) {
  return w.exec_prepared(statement, r.id, std::string(tams::model::ToUrn(r.format)), r.label, r.description,
                         sql::EncodeTags(r.tags), util::FormatIso8601(r.created_at), util::FormatIso8601(r.updated_at));
}

pqxx::result ExecFlow(pqxx::transaction_base& w, const char* statement, const model::FlowRecord& r) {
  return w.exec_prepared(statement, r.id, r.source_id, std::string(tams::model::ToUrn(r.format)), r.label, r.description,
                         sql::EncodeTags(r.tags), r.read_only ? 1 : 0, AsI64(r.max_bit_rate), AsI64(r.avg_bit_rate),
                         r.container, r.codec, AsI64(r.frame_width), AsI64(r.frame_height), AsI64(r.sample_rate),
                         AsI64(r.channels), sql::EncodeFlowCollection(r.flow_collection), sql::EncodeTimeRangeSet(r.available),
                         util::FormatIso8601(r.created_at), util::FormatIso8601(r.updated_at));
}

pqxx::result ExecDeletionRequest(pqxx::transaction_base& w, const char* statement, const model::DeletionRequestRecord& r) {
  return w.exec_prepared(statement, r.id, r.flow_id, r.timerange.ToString(), std::string(tams::model::ToString(r.status)),
                         RangeParam(r.remaining), static_cast<int64_t>(r.segments_processed), r.error,
                         r.cancel_requested ? 1 : 0, util::FormatIso8601(r.created_at), util::FormatIso8601(r.updated_at));
}

pqxx::result ExecDelivery(pqxx::transaction_base& w, const char* statement, const model::DeliveryRecord& r) {
  return w.exec_prepared(statement, static_cast<int64_t>(r.event_id), r.webhook_url, r.status, static_cast<int>(r.attempts),
                         r.last_error, util::FormatIso8601(r.updated_at));
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Changed(const pqxx::result& res, const std::string& what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, what);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result PgRepository::InsertSource(Transaction& t, const model::SourceRecord& r) {
  try {
    ExecSource(TX(t).Work(), "insert_source", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SourceRecord> PgRepository::GetSource(Transaction& t, const std::string& id) {
  auto res = Query(TX(t).Work(), "select_source", id);
  if (res.empty()) return std::nullopt;
  return ReadSource(res[0]);
}

std::vector<model::SourceRecord> PgRepository::ListSources(Transaction& t, const model::SourceFilter& filter, const Page& page) {
  auto res = Query(TX(t).Work(), "list_sources", page.after_id, filter.label, FormatParam(filter.format),
                   static_cast<int64_t>(page.limit));

  std::vector<model::SourceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSource(row));
  return out;
}

Result PgRepository::UpdateSource(Transaction& t, const model::SourceRecord& r) {
  try {
    return Changed(ExecSource(TX(t).Work(), "update_source", r), "source " + r.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSource(Transaction& t, const std::string& id) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("detach_source_flows", id);
    return Changed(work.exec_prepared("delete_source", id), "source " + id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result PgRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
  try {
    ExecFlow(TX(t).Work(), "insert_flow", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FlowRecord> PgRepository::GetFlow(Transaction& t, const std::string& id) {
  auto res = Query(TX(t).Work(), "select_flow", id);
  if (res.empty()) return std::nullopt;
  return ReadFlow(res[0]);
}

std::vector<model::FlowRecord> PgRepository::ListFlows(Transaction& t, const model::FlowFilter& filter, const Page& page) {
  auto res = Query(TX(t).Work(), "list_flows", page.after_id, filter.source_id, FormatParam(filter.format), filter.label,
                   static_cast<int64_t>(page.limit));

  std::vector<model::FlowRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadFlow(row));
  return out;
}

Result PgRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
  try {
    return Changed(ExecFlow(TX(t).Work(), "update_flow", r), "flow " + r.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteFlow(Transaction& t, const std::string& id) {
  try {
    auto& work = TX(t).Work();
    work.exec_prepared("delete_flow_segments", id);
    return Changed(work.exec_prepared("delete_flow", id), "flow " + id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result PgRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  const auto cols = sql::ToColumns(r.timerange);
  try {
    TX(t).Work().exec_prepared("insert_segment", r.flow_id, r.object_id, r.timerange.ToString(), r.ts_offset.ToString(),
                               AsI64(r.sample_offset), AsI64(r.sample_count), AsI64(r.key_frame_count),
                               sql::EncodeGetUrls(r.get_urls), util::FormatIso8601(r.created_at), cols.start_sec,
                               cols.start_nsec, cols.start_excl, cols.end_sec, cols.end_nsec);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SegmentRecord> PgRepository::FindSegments(Transaction& t, const model::SegmentQuery& query) {
  const auto range = sql::ToColumns(query.range);

  std::optional<int64_t> after_sec;
  if (query.after) after_sec = sql::ToColumns(*query.after).start_sec;

  auto res = Query(TX(t).Work(), "find_segments", query.flow_id, range.start_sec, range.end_sec, after_sec);

  std::vector<model::SegmentRecord> out;
  for (const auto& row : res) {
    if (query.limit && out.size() >= *query.limit) break;
    auto segment = ReadSegment(row);
    if (model::Matches(segment, query)) out.push_back(std::move(segment));
  }
  return out;
}

Result PgRepository::DeleteSegment(Transaction& t, const std::string& flow_id, const std::string& object_id,
                                   const tams::model::TimeRange& timerange) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_segment", flow_id, object_id, timerange.ToString());
    return Changed(res, "segment " + object_id + " " + timerange.ToString());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Media objects
// ------------------------------------------------------------------

Result PgRepository::UpsertMediaObject(Transaction& t, const model::MediaObjectRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_media_object", r.object_id, static_cast<int64_t>(r.size_bytes), r.mime_type,
                               sql::EncodeFlowReferences(r.flow_references), util::FormatIso8601(r.created_at),
                               TimeParam(r.unreferenced_since));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MediaObjectRecord> PgRepository::GetMediaObject(Transaction& t, const std::string& object_id) {
  auto res = Query(TX(t).Work(), "select_media_object", object_id);
  if (res.empty()) return std::nullopt;
  return ReadMediaObject(res[0]);
}

Result PgRepository::DeleteMediaObject(Transaction& t, const std::string& object_id) {
  try {
    return Changed(TX(t).Work().exec_prepared("delete_media_object", object_id), "media object " + object_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MediaObjectRecord> PgRepository::ListOrphanedMediaObjects(Transaction& t, util::WallTime cutoff, std::size_t limit) {
  auto res = Query(TX(t).Work(), "list_orphaned_media_objects", util::FormatIso8601(cutoff), static_cast<int64_t>(limit));

  std::vector<model::MediaObjectRecord> out;
  for (const auto& row : res) {
    auto record = ReadMediaObject(row);
    if (record.flow_references.empty()) out.push_back(std::move(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Webhooks
// ------------------------------------------------------------------

Result PgRepository::UpsertWebhook(Transaction& t, const model::WebhookRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_webhook", r.url, r.api_key_name, r.api_key_value, sql::EncodeStrings(r.events));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WebhookRecord> PgRepository::GetWebhook(Transaction& t, const std::string& url) {
  auto res = Query(TX(t).Work(), "select_webhook", url);
  if (res.empty()) return std::nullopt;
  return ReadWebhook(res[0]);
}

std::vector<model::WebhookRecord> PgRepository::ListWebhooks(Transaction& t) {
  auto res = Query(TX(t).Work(), "list_webhooks");

  std::vector<model::WebhookRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadWebhook(row));
  return out;
}

Result PgRepository::DeleteWebhook(Transaction& t, const std::string& url) {
  try {
    return Changed(TX(t).Work().exec_prepared("delete_webhook", url), "webhook " + url);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Deletion requests
// ------------------------------------------------------------------

Result PgRepository::InsertDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
  try {
    ExecDeletionRequest(TX(t).Work(), "insert_deletion_request", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeletionRequestRecord> PgRepository::GetDeletionRequest(Transaction& t, const std::string& id) {
  auto res = Query(TX(t).Work(), "select_deletion_request", id);
  if (res.empty()) return std::nullopt;
  return ReadDeletionRequest(res[0]);
}

std::vector<model::DeletionRequestRecord> PgRepository::ListDeletionRequests(Transaction& t) {
  auto res = Query(TX(t).Work(), "list_deletion_requests");

  std::vector<model::DeletionRequestRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDeletionRequest(row));
  return out;
}

Result PgRepository::UpdateDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
  try {
    return Changed(ExecDeletionRequest(TX(t).Work(), "update_deletion_request", r), "deletion request " + r.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Event outbox
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, model::EventRecord& event) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_event", event.event_type, event.payload, util::FormatIso8601(event.created_at));
    if (res.empty()) return Result::Err(ErrorCode::InternalError, "insert_event returned no id");
    event.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EventRecord> PgRepository::GetEvent(Transaction& t, uint64_t id) {
  auto res = Query(TX(t).Work(), "select_event", static_cast<int64_t>(id));
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

std::vector<model::EventRecord> PgRepository::ListUndispatchedEvents(Transaction& t, std::size_t limit) {
  auto res = Query(TX(t).Work(), "list_undispatched_events", static_cast<int64_t>(limit));

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEvent(row));
  return out;
}

Result PgRepository::MarkEventDispatched(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("mark_event_dispatched", static_cast<int64_t>(id));
    return Changed(res, "event " + std::to_string(id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    ExecDelivery(TX(t).Work(), "insert_delivery", r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    return Changed(ExecDelivery(TX(t).Work(), "update_delivery", r), "delivery for event " + std::to_string(r.event_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeliveryRecord> PgRepository::ListPendingDeliveries(Transaction& t) {
  auto res = Query(TX(t).Work(), "list_pending_deliveries");

  std::vector<model::DeliveryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDelivery(row));
  return out;
}

} // namespace tams::db::postgres
