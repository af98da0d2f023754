#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/deletion_status.hpp"
#include "internal/model/timerange.hpp"
#include "internal/util/time.hpp"

namespace tams::db::model {

struct DeletionRequestRecord {
  std::string id;  // UUID
  std::string flow_id;

  tams::model::TimeRange timerange;

  tams::model::DeletionStatus status = tams::model::DeletionStatus::kPending;

  // Part of `timerange` not yet cleared. nullopt once nothing remains.
  std::optional<tams::model::TimeRange> remaining;

  uint64_t segments_processed = 0;

  std::string error;

  bool cancel_requested = false;

  util::WallTime created_at{};
  util::WallTime updated_at{};
};

} // namespace tams::db::model
