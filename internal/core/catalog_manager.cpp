#include "catalog_manager.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

#include "internal/core/proto_codec.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/events/event_log.hpp"
#include "internal/model/event_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tams::core {

using tams::model::TimeRange;

namespace {

void RequireUUID(const std::string& id, const std::string& what) {
  if (!util::IsUUID(id)) {
    throw util::ParseError(what + " is not a UUID: " + id);
  }
}

template <typename T>
ListPage<T> TakePage(std::vector<T> rows, std::size_t limit) {
  ListPage<T> page;
  if (rows.size() > limit) {
    rows.resize(limit);
    if (!rows.empty()) page.next_key = rows.back().id;
  }
  page.items = std::move(rows);
  return page;
}

} // namespace

CatalogManager::CatalogManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::SegmentIndex> index,
                               storage::ObjectStorePtr object_store, CatalogOptions options, std::function<void()> on_commit)
    : repository_(std::move(repository)),
      index_(std::move(index)),
      object_store_(std::move(object_store)),
      options_(std::move(options)),
      on_commit_(std::move(on_commit)) {
  if (!repository_ || !index_ || !object_store_) {
    throw std::invalid_argument("CatalogManager requires repository, index and object store");
  }
}

uint32_t CatalogManager::ResolveLimit(uint32_t requested) const {
  if (requested == 0) return options_.default_limit;
  return std::min(requested, options_.max_limit);
}

void CatalogManager::Committed() const {
  if (on_commit_) on_commit_();
}

db::model::FlowRecord CatalogManager::RequireFlow(db::Transaction& tx, const std::string& id) {
  auto flow = repository_->GetFlow(tx, id);
  if (!flow) {
    throw util::NotFound("flow not found: " + id);
  }
  return *flow;
}

void CatalogManager::RequireSource(db::Transaction& tx, const std::string& id) {
  if (!repository_->GetSource(tx, id)) {
    throw util::NotFound("source not found: " + id);
  }
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

db::model::SourceRecord CatalogManager::CreateSource(db::model::SourceRecord source) {
  if (source.id.empty()) {
    source.id = util::NewId();
  } else {
    RequireUUID(source.id, "source id");
  }
  source.created_at = util::Now();
  source.updated_at = source.created_at;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertSource(*tx, source), "create source " + source.id);
  events::AppendEvent(*repository_, *tx, tams::model::kSourceCreated, ToProto(source));
  tx->Commit();
  Committed();

  TAMS_LOG_INFO("source created", {observability::StringField("source_id", source.id)});
  return source;
}

db::model::SourceRecord CatalogManager::GetSource(const std::string& id) {
  RequireUUID(id, "source id");
  auto tx     = repository_->Begin();
  auto source = repository_->GetSource(*tx, id);
  if (!source) {
    throw util::NotFound("source not found: " + id);
  }
  return *source;
}

ListPage<db::model::SourceRecord> CatalogManager::ListSources(const db::model::SourceFilter& filter, uint32_t limit,
                                                             const std::string& page_key) {
  db::Page page;
  page.limit = ResolveLimit(limit) + 1;
  if (!page_key.empty()) page.after_id = page_key;

  auto tx = repository_->Begin();
  return TakePage(repository_->ListSources(*tx, filter, page), page.limit - 1);
}

db::model::SourceRecord CatalogManager::UpdateSource(db::model::SourceRecord source) {
  RequireUUID(source.id, "source id");

  auto tx      = repository_->Begin();
  auto current = repository_->GetSource(*tx, source.id);
  if (!current) {
    throw util::NotFound("source not found: " + source.id);
  }
  source.created_at = current->created_at;
  source.updated_at = util::Now();

  db::ThrowIfDbError(repository_->UpdateSource(*tx, source), "update source " + source.id);
  events::AppendEvent(*repository_, *tx, tams::model::kSourceUpdated, ToProto(source));
  tx->Commit();
  Committed();
  return source;
}

void CatalogManager::DeleteSource(const std::string& id) {
  RequireUUID(id, "source id");

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteSource(*tx, id), "delete source " + id);

  tams::v1::SourceDeletedEvent event;
  event.set_source_id(id);
  events::AppendEvent(*repository_, *tx, tams::model::kSourceDeleted, event);
  tx->Commit();
  Committed();

  TAMS_LOG_INFO("source deleted", {observability::StringField("source_id", id)});
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

db::model::FlowRecord CatalogManager::CreateFlow(db::model::FlowRecord flow) {
  if (flow.id.empty()) {
    flow.id = util::NewId();
  } else {
    RequireUUID(flow.id, "flow id");
  }
  if (flow.source_id) RequireUUID(*flow.source_id, "source id");
  for (const auto& item : flow.flow_collection) {
    RequireUUID(item.flow_id, "flow_collection flow id");
  }

  // coverage only ever comes from segments
  flow.available  = {};
  flow.created_at = util::Now();
  flow.updated_at = flow.created_at;

  auto tx = repository_->Begin();
  if (flow.source_id) RequireSource(*tx, *flow.source_id);
  db::ThrowIfDbError(repository_->InsertFlow(*tx, flow), "create flow " + flow.id);
  events::AppendEvent(*repository_, *tx, tams::model::kFlowCreated, ToProto(flow));
  tx->Commit();
  Committed();

  TAMS_LOG_INFO("flow created", {observability::StringField("flow_id", flow.id)});
  return flow;
}

db::model::FlowRecord CatalogManager::GetFlow(const std::string& id) {
  RequireUUID(id, "flow id");
  auto tx = repository_->Begin();
  return RequireFlow(*tx, id);
}

ListPage<db::model::FlowRecord> CatalogManager::ListFlows(const db::model::FlowFilter& filter, uint32_t limit,
                                                         const std::string& page_key) {
  db::Page page;
  page.limit = ResolveLimit(limit) + 1;
  if (!page_key.empty()) page.after_id = page_key;

  auto tx = repository_->Begin();
  return TakePage(repository_->ListFlows(*tx, filter, page), page.limit - 1);
}

db::model::FlowRecord CatalogManager::UpdateFlow(db::model::FlowRecord flow) {
  RequireUUID(flow.id, "flow id");
  if (flow.source_id) RequireUUID(*flow.source_id, "source id");
  for (const auto& item : flow.flow_collection) {
    RequireUUID(item.flow_id, "flow_collection flow id");
  }

  auto tx      = repository_->Begin();
  auto current = RequireFlow(*tx, flow.id);
  if (current.read_only && flow.read_only) {
    throw util::ReadOnlyFlow("flow is read-only: " + flow.id);
  }
  if (flow.source_id && flow.source_id != current.source_id) RequireSource(*tx, *flow.source_id);

  flow.available  = current.available;
  flow.created_at = current.created_at;
  flow.updated_at = util::Now();

  db::ThrowIfDbError(repository_->UpdateFlow(*tx, flow), "update flow " + flow.id);
  events::AppendEvent(*repository_, *tx, tams::model::kFlowUpdated, ToProto(flow));
  tx->Commit();
  Committed();
  return flow;
}

void CatalogManager::DeleteFlow(const std::string& id) {
  RequireUUID(id, "flow id");

  auto tx   = repository_->Begin();
  auto flow = RequireFlow(*tx, id);
  if (flow.read_only) {
    throw util::ReadOnlyFlow("flow is read-only: " + id);
  }

  db::model::SegmentQuery all;
  all.flow_id = id;

  std::map<std::string, int64_t> references;
  for (const auto& segment : repository_->FindSegments(*tx, all)) {
    --references[segment.object_id];
  }

  db::ThrowIfDbError(repository_->DeleteFlow(*tx, id), "delete flow " + id);
  for (const auto& [object_id, delta] : references) {
    index_->AdjustReference(*tx, object_id, id, delta);
  }

  tams::v1::FlowDeletedEvent event;
  event.set_flow_id(id);
  events::AppendEvent(*repository_, *tx, tams::model::kFlowDeleted, event);
  tx->Commit();
  Committed();

  TAMS_LOG_INFO("flow deleted", {observability::StringField("flow_id", id),
                observability::UintField("media_objects", references.size())});
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

void CatalogManager::EnsureMediaObject(db::Transaction& tx, const std::string& object_id,
                                       const std::optional<storage::ObjectStat>& stat) {
  auto existing = repository_->GetMediaObject(tx, object_id);
  if (existing) {
    if (!stat || (existing->size_bytes == stat->size_bytes && existing->mime_type == stat->mime_type)) {
      return;
    }
    existing->size_bytes = stat->size_bytes;
    existing->mime_type  = stat->mime_type;
    db::ThrowIfDbError(repository_->UpsertMediaObject(tx, *existing), "update media object " + object_id);
    return;
  }

  db::model::MediaObjectRecord record;
  record.object_id  = object_id;
  record.created_at = util::Now();
  if (stat) {
    record.size_bytes = stat->size_bytes;
    record.mime_type  = stat->mime_type;
  }
  db::ThrowIfDbError(repository_->UpsertMediaObject(tx, record), "create media object " + object_id);
}

std::vector<db::model::SegmentRecord> CatalogManager::AddSegments(const std::string& flow_id,
                                                                  std::vector<db::model::SegmentRecord> segments, bool replace) {
  RequireUUID(flow_id, "flow id");
  if (segments.empty()) {
    throw util::InvalidArgument("no segments given");
  }

  const auto now = util::Now();
  for (auto& segment : segments) {
    storage::common::ValidateObjectId(segment.object_id);
    if (segment.timerange.IsEmpty()) {
      throw util::ParseError("segment timerange is empty");
    }
    segment.flow_id    = flow_id;
    segment.created_at = now;
    if (segment.get_urls.empty() && !options_.public_url_base.empty()) {
      segment.get_urls.push_back({storage::common::JoinPath(options_.public_url_base, segment.object_id), "default"});
    }
  }

  // object store I/O stays outside the transaction
  std::map<std::string, std::optional<storage::ObjectStat>> stats;
  for (const auto& segment : segments) {
    if (!stats.count(segment.object_id)) {
      stats.emplace(segment.object_id, object_store_->Stat(segment.object_id));
    }
  }

  tams::v1::SegmentsAddedEvent event;
  event.set_flow_id(flow_id);

  auto tx = repository_->Begin();
  for (const auto& [object_id, stat] : stats) {
    EnsureMediaObject(*tx, object_id, stat);
  }
  for (const auto& segment : segments) {
    index_->Insert(*tx, segment, replace);
    *event.add_segments() = ToProto(segment);
  }
  events::AppendEvent(*repository_, *tx, tams::model::kSegmentsAdded, event);
  tx->Commit();
  Committed();

  TAMS_LOG_DEBUG("segments added", {observability::StringField("flow_id", flow_id),
                 observability::UintField("count", segments.size()), observability::BoolField("replace", replace)});
  return segments;
}

ListPage<db::model::SegmentRecord> CatalogManager::ListSegments(const std::string& flow_id, const TimeRange& range, uint32_t limit,
                                                                const std::string& page_key) {
  RequireUUID(flow_id, "flow id");

  std::optional<TimeRange> after;
  if (!page_key.empty()) after = TimeRange::Parse(page_key);

  auto tx   = repository_->Begin();
  auto page = index_->Query(*tx, flow_id, range, after, ResolveLimit(limit));

  ListPage<db::model::SegmentRecord> result;
  result.items = std::move(page.segments);
  if (page.next) result.next_key = page.next->ToString();
  return result;
}

uint64_t CatalogManager::DeleteSegments(const std::string& flow_id, const TimeRange& range) {
  RequireUUID(flow_id, "flow id");

  auto tx     = repository_->Begin();
  auto result = index_->DeleteRange(*tx, flow_id, range);
  if (result.Affected() > 0) {
    tams::v1::SegmentsDeletedEvent event;
    event.set_flow_id(flow_id);
    event.set_timerange(range.ToString());
    events::AppendEvent(*repository_, *tx, tams::model::kSegmentsDeleted, event);
  }
  tx->Commit();
  if (result.Affected() > 0) Committed();

  TAMS_LOG_INFO("segments deleted", {observability::StringField("flow_id", flow_id),
                observability::StringField("timerange", range.ToString()), observability::UintField("deleted", result.deleted),
                observability::UintField("truncated", result.truncated)});
  return result.Affected();
}

// ------------------------------------------------------------------
// Media objects
// ------------------------------------------------------------------

std::vector<storage::UploadLocator> CatalogManager::AllocateStorage(const std::string& flow_id, uint32_t limit,
                                                                    const std::vector<std::string>& object_ids) {
  RequireUUID(flow_id, "flow id");
  for (const auto& id : object_ids) {
    storage::common::ValidateObjectId(id);
  }

  {
    auto tx   = repository_->Begin();
    auto flow = RequireFlow(*tx, flow_id);
    if (flow.read_only) {
      throw util::ReadOnlyFlow("flow is read-only: " + flow_id);
    }
  }

  std::vector<std::string> ids = object_ids;
  if (ids.empty()) {
    const uint32_t count = ResolveLimit(limit == 0 ? 1 : limit);
    for (uint32_t i = 0; i < count; ++i) {
      ids.push_back(storage::common::GenerateObjectId());
    }
  }

  std::vector<storage::UploadLocator> locators;
  locators.reserve(ids.size());
  for (const auto& id : ids) {
    locators.push_back(object_store_->IssueUploadLocator(id));
  }
  return locators;
}

db::model::MediaObjectRecord CatalogManager::GetMediaObject(const std::string& object_id) {
  storage::common::ValidateObjectId(object_id);
  auto tx     = repository_->Begin();
  auto object = repository_->GetMediaObject(*tx, object_id);
  if (!object) {
    throw util::NotFound("media object not found: " + object_id);
  }
  return *object;
}

// ------------------------------------------------------------------
// Webhooks
// ------------------------------------------------------------------

db::model::WebhookRecord CatalogManager::RegisterWebhook(db::model::WebhookRecord webhook) {
  if (webhook.url.empty()) {
    throw util::InvalidArgument("webhook url must not be empty");
  }
  if (webhook.api_key_name.empty() != webhook.api_key_value.empty()) {
    throw util::InvalidArgument("webhook api key needs both a name and a value");
  }
  std::set<std::string> unique;
  for (const auto& type : webhook.events) {
    if (!tams::model::IsKnownEventType(type)) {
      throw util::InvalidArgument("unknown event type: " + type);
    }
    unique.insert(type);
  }
  webhook.events.assign(unique.begin(), unique.end());

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertWebhook(*tx, webhook), "register webhook " + webhook.url);
  tx->Commit();

  TAMS_LOG_INFO("webhook registered", {observability::StringField("url", webhook.url),
                observability::UintField("events", webhook.events.size())});
  webhook.api_key_value.clear();
  return webhook;
}

std::vector<db::model::WebhookRecord> CatalogManager::ListWebhooks() {
  auto tx       = repository_->Begin();
  auto webhooks = repository_->ListWebhooks(*tx);
  for (auto& webhook : webhooks) {
    webhook.api_key_value.clear();
  }
  return webhooks;
}

void CatalogManager::DeleteWebhook(const std::string& url) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteWebhook(*tx, url), "delete webhook " + url);
  tx->Commit();

  TAMS_LOG_INFO("webhook deleted", {observability::StringField("url", url)});
}

} // namespace tams::core
