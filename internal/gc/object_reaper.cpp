#include "object_reaper.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tams::gc {

namespace {

constexpr std::size_t kReapBatch = 100;

} // namespace

ObjectReaper::ObjectReaper(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr object_store,
                           std::chrono::seconds retention, std::chrono::milliseconds interval)
    : repository_(std::move(repository)), object_store_(std::move(object_store)), retention_(retention), interval_(interval) {
}

ObjectReaper::~ObjectReaper() {
  Stop();
}

void ObjectReaper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ObjectReaper::Loop, this);
}

void ObjectReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t ObjectReaper::RunOnce(util::WallTime now) {
  const auto cutoff = now - retention_;

  std::vector<db::model::MediaObjectRecord> orphans;
  {
    auto tx = repository_->Begin();
    orphans = repository_->ListOrphanedMediaObjects(*tx, cutoff, kReapBatch);
  }

  std::size_t reaped = 0;
  for (const auto& orphan : orphans) {
    try {
      object_store_->Delete(orphan.object_id);
    } catch (const util::StorageFailure& e) {
      TAMS_LOG_WARN("object store delete failed", {observability::StringField("object_id", orphan.object_id),
                                                   observability::StringField("error", e.what())});
      continue;
    }

    auto tx      = repository_->Begin();
    auto current = repository_->GetMediaObject(*tx, orphan.object_id);
    if (!current) continue;
    if (!current->flow_references.empty()) {
      TAMS_LOG_WARN("media object re-referenced while being reaped", {observability::StringField("object_id", orphan.object_id)});
      continue;
    }

    db::ThrowIfDbError(repository_->DeleteMediaObject(*tx, orphan.object_id), "delete media object " + orphan.object_id);
    tx->Commit();
    ++reaped;

    TAMS_LOG_DEBUG("media object reaped", {observability::StringField("object_id", orphan.object_id),
                                           observability::UintField("size_bytes", orphan.size_bytes)});
  }

  if (reaped > 0) {
    TAMS_LOG_INFO("orphaned media objects reaped", {observability::UintField("count", reaped)});
  }
  return reaped;
}

void ObjectReaper::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    try {
      RunOnce(util::Now());
    } catch (const std::exception& e) {
      TAMS_LOG_ERROR("object reaper pass failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace tams::gc
