#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace tams::db::model {

/*
  Persistent media object row.

  flow_references maps flow id -> number of that flow's segments pointing
  at the object. Counts change only in the transaction that adds or
  removes the referencing segment.
*/
struct MediaObjectRecord {
  std::string object_id;

  uint64_t    size_bytes = 0;
  std::string mime_type;

  std::map<std::string, uint64_t> flow_references;

  util::WallTime created_at{};

  // Set when flow_references becomes empty; cleared on re-reference.
  std::optional<util::WallTime> unreferenced_since;
};

} // namespace tams::db::model
