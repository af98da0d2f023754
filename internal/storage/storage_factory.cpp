#include "storage_factory.hpp"

#include <chrono>

#include "common/arrow_utils.hpp"
#include "object/object_arrow_store.hpp"
#include "ram/ram_object_store.hpp"

namespace tams::storage {

ObjectStorePtr StorageFactory::Build(const tams::runtime::config::ObjectStoreConfig& cfg) {
  const auto expiry = std::chrono::seconds(cfg.upload_expiry_seconds());

  if (cfg.uri().empty()) {
    const std::string base = cfg.upload_url_base().empty() ? "mem://objects" : cfg.upload_url_base();
    return std::make_shared<RamObjectStore>(base, expiry);
  }

  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg.uri()));
  const std::string base = cfg.upload_url_base().empty() ? cfg.uri() : cfg.upload_url_base();
  return std::make_shared<ObjectArrowStore>(std::move(fs), std::move(root), base, expiry);
}

} // namespace tams::storage
