#include "ram_object_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"

namespace tams::storage {

RamObjectStore::RamObjectStore(std::string upload_url_base, std::chrono::seconds upload_expiry)
    : upload_url_base_(std::move(upload_url_base)), upload_expiry_(upload_expiry) {
}

bool RamObjectStore::Exists(const std::string& object_id) {
  common::ValidateObjectId(object_id);
  std::shared_lock lock(mutex_);
  return objects_.count(object_id) != 0;
}

std::optional<ObjectStat> RamObjectStore::Stat(const std::string& object_id) {
  common::ValidateObjectId(object_id);
  std::shared_lock lock(mutex_);
  auto it = objects_.find(object_id);
  if (it == objects_.end()) return std::nullopt;
  return it->second;
}

UploadLocator RamObjectStore::IssueUploadLocator(const std::string& object_id) {
  common::ValidateObjectId(object_id);
  return UploadLocator{object_id, common::JoinPath(upload_url_base_, object_id), util::Now() + upload_expiry_};
}

void RamObjectStore::Delete(const std::string& object_id) {
  common::ValidateObjectId(object_id);
  std::unique_lock lock(mutex_);
  objects_.erase(object_id);
}

void RamObjectStore::Put(const std::string& object_id, uint64_t size_bytes, std::string mime_type) {
  common::ValidateObjectId(object_id);
  std::unique_lock lock(mutex_);
  objects_[object_id] = ObjectStat{size_bytes, std::move(mime_type)};
}

std::size_t RamObjectStore::Size() const {
  std::shared_lock lock(mutex_);
  return objects_.size();
}

} // namespace tams::storage
