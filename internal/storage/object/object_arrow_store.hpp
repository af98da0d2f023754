#pragma once

#include <arrow/filesystem/filesystem.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace tams::storage {

/*
  Object store over an Arrow filesystem (local disk, S3 / MinIO, GCS ...).

  Object key layout:

      <root_path>/<object_id>

  Upload locators point at <upload_url_base>/<object_id>; the URL is
  issued, not served, by this process.
*/
class ObjectArrowStore final : public ObjectStore {
public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs,
                   std::string root_path,
                   std::string upload_url_base,
                   std::chrono::seconds upload_expiry);

  bool Exists(const std::string& object_id) override;

  std::optional<ObjectStat> Stat(const std::string& object_id) override;

  UploadLocator IssueUploadLocator(const std::string& object_id) override;

  void Delete(const std::string& object_id) override;

private:
  std::string ObjectPath(const std::string& object_id) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string root_path_;
  std::string upload_url_base_;
  std::chrono::seconds upload_expiry_;
};

}
