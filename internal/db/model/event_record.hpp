#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace tams::db::model {

/*
  Outbox row written in the same transaction as the catalog mutation it
  describes. `dispatched` flips once delivery rows exist for every
  matching webhook.
*/
struct EventRecord {
  uint64_t id = 0;  // assigned on append, monotonic

  std::string event_type;
  std::string payload;  // JSON

  util::WallTime created_at{};

  bool dispatched = false;
};

inline constexpr std::string_view kDeliveryPending   = "pending";
inline constexpr std::string_view kDeliveryDelivered = "delivered";
inline constexpr std::string_view kDeliveryFailed    = "failed";

// One row per (event, webhook) pair.
struct DeliveryRecord {
  uint64_t    event_id = 0;
  std::string webhook_url;

  std::string status{kDeliveryPending};
  uint32_t    attempts = 0;
  std::string last_error;

  util::WallTime updated_at{};
};

} // namespace tams::db::model
