#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace tams::storage {

struct ObjectStat {
  uint64_t    size_bytes = 0;
  std::string mime_type;
};

// Where and until when a client may PUT an object's bytes.
struct UploadLocator {
  std::string    object_id;
  std::string    put_url;
  util::WallTime expires_at{};
};

/*
  Media object byte storage.

  The catalog never reads or writes media bytes; it only needs to know
  whether an object exists, how large it is, where a client may upload it,
  and to reclaim it once no segment references it.

  Implementations:
    RAM    -> in-process map, used when no object store URI is configured
    OBJECT -> Arrow filesystem (local, S3, GCS ...)

  Failures are thrown as util::StorageFailure; malformed ids as
  util::ParseError.
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual bool Exists(const std::string& object_id) = 0;

  // nullopt when the object does not exist.
  virtual std::optional<ObjectStat> Stat(const std::string& object_id) = 0;

  virtual UploadLocator IssueUploadLocator(const std::string& object_id) = 0;

  // Removing an absent object is not an error.
  virtual void Delete(const std::string& object_id) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace tams::storage
