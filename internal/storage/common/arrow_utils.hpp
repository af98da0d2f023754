#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace tams::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageFailure
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageFailure(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageFailure(status.ToString());
}

// Filesystem and in-filesystem root for a URI ("s3://bucket/prefix") or a local path.
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path);

} // namespace tams::storage::common
