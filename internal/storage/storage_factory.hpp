#pragma once

#include "config/config.pb.h"
#include "object_store.hpp"

namespace tams::storage {

/*
  Builds the media object store from configuration.

      object_store.uri empty  -> RamObjectStore
      otherwise               -> ObjectArrowStore over the resolved filesystem
*/

class StorageFactory {
public:
  static ObjectStorePtr Build(const tams::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace tams::storage
