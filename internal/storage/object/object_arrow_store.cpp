#include "object_arrow_store.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace tams::storage {

using namespace tams::storage::common;

namespace {

constexpr const char* kDefaultMimeType = "application/octet-stream";

} // namespace

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs,
                                   std::string root_path,
                                   std::string upload_url_base,
                                   std::chrono::seconds upload_expiry)
    : fs_(std::move(fs)),
      root_path_(std::move(root_path)),
      upload_url_base_(std::move(upload_url_base)),
      upload_expiry_(upload_expiry) {
}

std::string ObjectArrowStore::ObjectPath(const std::string& object_id) const {
  ValidateObjectId(object_id);
  return JoinPath(root_path_, object_id);
}

bool ObjectArrowStore::Exists(const std::string& object_id) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(object_id)));
  return info.type() == arrow::fs::FileType::File;
}

std::optional<ObjectStat> ObjectArrowStore::Stat(const std::string& object_id) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(object_id)));
  if (info.type() != arrow::fs::FileType::File) return std::nullopt;
  return ObjectStat{static_cast<uint64_t>(info.size()), kDefaultMimeType};
}

UploadLocator ObjectArrowStore::IssueUploadLocator(const std::string& object_id) {
  ValidateObjectId(object_id);

  UploadLocator locator;
  locator.object_id  = object_id;
  locator.put_url    = JoinPath(upload_url_base_, object_id);
  locator.expires_at = util::Now() + upload_expiry_;
  return locator;
}

/*
  Delete object; already-gone objects are ignored
*/
void ObjectArrowStore::Delete(const std::string& object_id) {
  const auto path = ObjectPath(object_id);
  auto       info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() == arrow::fs::FileType::NotFound) return;
  Unwrap(fs_->DeleteFile(path));
}

} // namespace tams::storage
