#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace tams::db::memory {

namespace {

template <typename Record, typename Predicate>
std::vector<Record> PageOf(const std::map<std::string, Record>& rows, const Page& page, Predicate keep) {
  std::vector<Record> out;
  auto it = page.after_id ? rows.upper_bound(*page.after_id) : rows.begin();
  for (; it != rows.end() && out.size() < page.limit; ++it) {
    if (keep(it->second)) out.push_back(it->second);
  }
  return out;
}

bool SameSegment(const model::SegmentRecord& s, const std::string& object_id, const tams::model::TimeRange& timerange) {
  return s.object_id == object_id && s.timerange == timerange;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result MemoryRepository::InsertSource(Transaction& t, const model::SourceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sources.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "source " + r.id);
  s.sources[r.id] = r;
  return Result::Ok();
}

std::optional<model::SourceRecord> MemoryRepository::GetSource(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(id);
  if (it == s.sources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SourceRecord> MemoryRepository::ListSources(Transaction& t, const model::SourceFilter& filter, const Page& page) {
  return PageOf(TX(t).View().sources, page, [&](const model::SourceRecord& r) {
    if (filter.label && r.label != *filter.label) return false;
    if (filter.format && r.format != *filter.format) return false;
    return true;
  });
}

Result MemoryRepository::UpdateSource(Transaction& t, const model::SourceRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sources.contains(r.id)) return Result::Err(ErrorCode::NotFound, "source " + r.id);
  s.sources[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSource(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.sources.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "source " + id);
  for (auto& [_, flow] : s.flows) {
    if (flow.source_id == id) flow.source_id.reset();
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlow(Transaction& t, const model::FlowRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.flows.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "flow " + r.id);
  if (r.source_id && !s.sources.contains(*r.source_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown source " + *r.source_id);
  }
  s.flows[r.id] = r;
  return Result::Ok();
}

std::optional<model::FlowRecord> MemoryRepository::GetFlow(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.flows.find(id);
  if (it == s.flows.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FlowRecord> MemoryRepository::ListFlows(Transaction& t, const model::FlowFilter& filter, const Page& page) {
  return PageOf(TX(t).View().flows, page, [&](const model::FlowRecord& r) {
    if (filter.source_id && r.source_id != filter.source_id) return false;
    if (filter.format && r.format != *filter.format) return false;
    if (filter.label && r.label != *filter.label) return false;
    return true;
  });
}

Result MemoryRepository::UpdateFlow(Transaction& t, const model::FlowRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.flows.contains(r.id)) return Result::Err(ErrorCode::NotFound, "flow " + r.id);
  if (r.source_id && !s.sources.contains(*r.source_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown source " + *r.source_id);
  }
  s.flows[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteFlow(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.flows.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "flow " + id);
  s.segments.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

Result MemoryRepository::InsertSegment(Transaction& t, const model::SegmentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.flows.contains(r.flow_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown flow " + r.flow_id);

  auto& rows = s.segments[r.flow_id];
  for (const auto& existing : rows) {
    if (SameSegment(existing, r.object_id, r.timerange)) {
      return Result::Err(ErrorCode::AlreadyExists, "segment " + r.object_id + " " + r.timerange.ToString());
    }
  }

  auto pos = std::upper_bound(rows.begin(), rows.end(), r,
                              [](const model::SegmentRecord& a, const model::SegmentRecord& b) { return a.timerange < b.timerange; });
  rows.insert(pos, r);
  return Result::Ok();
}

std::vector<model::SegmentRecord> MemoryRepository::FindSegments(Transaction& t, const model::SegmentQuery& query) {
  const auto& s  = TX(t).View();
  auto        it = s.segments.find(query.flow_id);
  if (it == s.segments.end()) return {};

  std::vector<model::SegmentRecord> out;
  for (const auto& segment : it->second) {
    if (query.limit && out.size() >= *query.limit) break;
    if (model::Matches(segment, query)) out.push_back(segment);
  }
  return out;
}

Result MemoryRepository::DeleteSegment(Transaction& t, const std::string& flow_id, const std::string& object_id,
                                       const tams::model::TimeRange& timerange) {
  auto& s  = TX(t).Mutable();
  auto  it = s.segments.find(flow_id);
  if (it == s.segments.end()) return Result::Err(ErrorCode::NotFound, "segment " + object_id);

  auto& rows = it->second;
  auto  row  = std::find_if(rows.begin(), rows.end(), [&](const model::SegmentRecord& r) { return SameSegment(r, object_id, timerange); });
  if (row == rows.end()) return Result::Err(ErrorCode::NotFound, "segment " + object_id + " " + timerange.ToString());
  rows.erase(row);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Media objects
// ------------------------------------------------------------------

Result MemoryRepository::UpsertMediaObject(Transaction& t, const model::MediaObjectRecord& r) {
  TX(t).Mutable().media_objects[r.object_id] = r;
  return Result::Ok();
}

std::optional<model::MediaObjectRecord> MemoryRepository::GetMediaObject(Transaction& t, const std::string& object_id) {
  const auto& s  = TX(t).View();
  auto        it = s.media_objects.find(object_id);
  if (it == s.media_objects.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteMediaObject(Transaction& t, const std::string& object_id) {
  if (TX(t).Mutable().media_objects.erase(object_id) == 0) return Result::Err(ErrorCode::NotFound, "media object " + object_id);
  return Result::Ok();
}

std::vector<model::MediaObjectRecord> MemoryRepository::ListOrphanedMediaObjects(Transaction& t, util::WallTime cutoff, std::size_t limit) {
  std::vector<model::MediaObjectRecord> out;
  for (const auto& [_, record] : TX(t).View().media_objects) {
    if (out.size() >= limit) break;
    if (record.flow_references.empty() && record.unreferenced_since && *record.unreferenced_since <= cutoff) {
      out.push_back(record);
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Webhooks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWebhook(Transaction& t, const model::WebhookRecord& r) {
  TX(t).Mutable().webhooks[r.url] = r;
  return Result::Ok();
}

std::optional<model::WebhookRecord> MemoryRepository::GetWebhook(Transaction& t, const std::string& url) {
  const auto& s  = TX(t).View();
  auto        it = s.webhooks.find(url);
  if (it == s.webhooks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WebhookRecord> MemoryRepository::ListWebhooks(Transaction& t) {
  std::vector<model::WebhookRecord> out;
  for (const auto& [_, record] : TX(t).View().webhooks) out.push_back(record);
  return out;
}

Result MemoryRepository::DeleteWebhook(Transaction& t, const std::string& url) {
  if (TX(t).Mutable().webhooks.erase(url) == 0) return Result::Err(ErrorCode::NotFound, "webhook " + url);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Deletion requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.deletion_requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "deletion request " + r.id);
  s.deletion_requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeletionRequestRecord> MemoryRepository::GetDeletionRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.deletion_requests.find(id);
  if (it == s.deletion_requests.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeletionRequestRecord> MemoryRepository::ListDeletionRequests(Transaction& t) {
  std::vector<model::DeletionRequestRecord> out;
  for (const auto& [_, record] : TX(t).View().deletion_requests) out.push_back(record);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateDeletionRequest(Transaction& t, const model::DeletionRequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.deletion_requests.contains(r.id)) return Result::Err(ErrorCode::NotFound, "deletion request " + r.id);
  s.deletion_requests[r.id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Event outbox
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& event) {
  auto& s  = TX(t).Mutable();
  event.id = s.next_event_id++;
  s.events[event.id] = event;
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EventRecord> MemoryRepository::ListUndispatchedEvents(Transaction& t, std::size_t limit) {
  std::vector<model::EventRecord> out;
  for (const auto& [_, event] : TX(t).View().events) {
    if (out.size() >= limit) break;
    if (!event.dispatched) out.push_back(event);
  }
  return out;
}

Result MemoryRepository::MarkEventDispatched(Transaction& t, uint64_t id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.events.find(id);
  if (it == s.events.end()) return Result::Err(ErrorCode::NotFound, "event " + std::to_string(id));
  it->second.dispatched = true;
  return Result::Ok();
}

Result MemoryRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto&       s   = TX(t).Mutable();
  DeliveryKey key{r.event_id, r.webhook_url};
  if (s.deliveries.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "delivery for event " + std::to_string(r.event_id));
  s.deliveries[key] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.deliveries.find(DeliveryKey{r.event_id, r.webhook_url});
  if (it == s.deliveries.end()) return Result::Err(ErrorCode::NotFound, "delivery for event " + std::to_string(r.event_id));
  it->second = r;
  return Result::Ok();
}

std::vector<model::DeliveryRecord> MemoryRepository::ListPendingDeliveries(Transaction& t) {
  std::vector<model::DeliveryRecord> out;
  for (const auto& [_, delivery] : TX(t).View().deliveries) {
    if (delivery.status == model::kDeliveryPending) out.push_back(delivery);
  }
  return out;
}

} // namespace tams::db::memory
