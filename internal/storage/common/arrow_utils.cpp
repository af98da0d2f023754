#include "arrow_utils.hpp"

namespace tams::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path) {
  std::string resolved_path;
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path));

  // Objects land directly under the root, so it must exist.
  ARROW_RETURN_NOT_OK(fs->CreateDir(resolved_path, /*recursive=*/true));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace tams::storage::common
