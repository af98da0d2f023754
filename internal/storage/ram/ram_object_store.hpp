#pragma once

#include <chrono>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store.hpp"

namespace tams::storage {

/*
  RAM object store.

  Keeps object metadata only; used when no object store URI is configured
  and by tests, which register objects through Put().

  Thread safety:
    - shared reads
    - exclusive writes
*/
class RamObjectStore final : public ObjectStore {
public:
  explicit RamObjectStore(std::string upload_url_base = "mem://objects",
                          std::chrono::seconds upload_expiry = std::chrono::seconds(3600));

  bool Exists(const std::string& object_id) override;

  std::optional<ObjectStat> Stat(const std::string& object_id) override;

  UploadLocator IssueUploadLocator(const std::string& object_id) override;

  void Delete(const std::string& object_id) override;

  // Records an object as if a client had completed its upload.
  void Put(const std::string& object_id, uint64_t size_bytes, std::string mime_type);

  std::size_t Size() const;

private:
  std::string upload_url_base_;
  std::chrono::seconds upload_expiry_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, ObjectStat> objects_;
};

}
