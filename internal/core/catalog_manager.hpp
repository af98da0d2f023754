#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/index/segment_index.hpp"
#include "internal/storage/object_store.hpp"

namespace tams::core {

struct CatalogOptions {
  // Prefix for default segment get_urls; none are added when empty.
  std::string public_url_base;

  uint32_t default_limit = 50;
  uint32_t max_limit     = 1000;
};

template <typename T>
struct ListPage {
  std::vector<T> items;

  // Opaque resume key; nullopt on the last page.
  std::optional<std::string> next_key;
};

/*
  Catalog mutations and queries for sources, flows, segments, media
  objects and webhooks.

  Every mutation runs in one transaction that also appends its outbox
  event; on_commit is invoked after a successful commit so the notifier
  can drain without polling delay.

  Errors are thrown (util/errors.hpp); nothing is persisted when a call
  throws.
*/
class CatalogManager {
 public:
  CatalogManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::SegmentIndex> index,
                 storage::ObjectStorePtr object_store, CatalogOptions options, std::function<void()> on_commit = {});

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  db::model::SourceRecord                CreateSource(db::model::SourceRecord source);
  db::model::SourceRecord                GetSource(const std::string& id);
  ListPage<db::model::SourceRecord>      ListSources(const db::model::SourceFilter& filter, uint32_t limit, const std::string& page_key);
  db::model::SourceRecord                UpdateSource(db::model::SourceRecord source);
  void                                   DeleteSource(const std::string& id);

  // ---------------------------------------------------------------------
  // Flows
  // ---------------------------------------------------------------------

  db::model::FlowRecord                  CreateFlow(db::model::FlowRecord flow);
  db::model::FlowRecord                  GetFlow(const std::string& id);
  ListPage<db::model::FlowRecord>        ListFlows(const db::model::FlowFilter& filter, uint32_t limit, const std::string& page_key);
  // A read-only flow only accepts an update that clears read_only.
  db::model::FlowRecord                  UpdateFlow(db::model::FlowRecord flow);
  void                                   DeleteFlow(const std::string& id);

  // ---------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------

  // All segments are added in one transaction or none is.
  std::vector<db::model::SegmentRecord>  AddSegments(const std::string& flow_id, std::vector<db::model::SegmentRecord> segments, bool replace);
  ListPage<db::model::SegmentRecord>     ListSegments(const std::string& flow_id, const tams::model::TimeRange& range, uint32_t limit,
                                                      const std::string& page_key);
  uint64_t                               DeleteSegments(const std::string& flow_id, const tams::model::TimeRange& range);

  // ---------------------------------------------------------------------
  // Media objects
  // ---------------------------------------------------------------------

  // Upload locators for `object_ids`, or for `limit` fresh ids when none are given.
  std::vector<storage::UploadLocator>    AllocateStorage(const std::string& flow_id, uint32_t limit, const std::vector<std::string>& object_ids);
  db::model::MediaObjectRecord           GetMediaObject(const std::string& object_id);

  // ---------------------------------------------------------------------
  // Webhooks
  // ---------------------------------------------------------------------

  db::model::WebhookRecord               RegisterWebhook(db::model::WebhookRecord webhook);
  std::vector<db::model::WebhookRecord>  ListWebhooks();
  void                                   DeleteWebhook(const std::string& url);

  uint32_t ResolveLimit(uint32_t requested) const;

 private:
  void Committed() const;

  db::model::FlowRecord RequireFlow(db::Transaction& tx, const std::string& id);
  void                  RequireSource(db::Transaction& tx, const std::string& id);
  void                  EnsureMediaObject(db::Transaction& tx, const std::string& object_id, const std::optional<storage::ObjectStat>& stat);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<index::SegmentIndex> index_;
  storage::ObjectStorePtr              object_store_;
  CatalogOptions                       options_;
  std::function<void()>                on_commit_;
};

} // namespace tams::core
