#pragma once

#include <google/protobuf/message.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"

namespace tams::events {

/*
  Appends an outbox event inside the caller's transaction.

  The payload message is stored as JSON and becomes the "event" member of
  the webhook body. Returns the assigned event id.
*/
uint64_t AppendEvent(db::Repository& repository, db::Transaction& tx, std::string_view event_type,
                     const google::protobuf::Message& payload);

// {"event_timestamp", "event_type", "event"} body POSTed to subscribers.
std::string BuildWebhookBody(const db::model::EventRecord& event);

} // namespace tams::events
