#include "event_log.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/core/proto_codec.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tams::events {

uint64_t AppendEvent(db::Repository& repository, db::Transaction& tx, std::string_view event_type,
                     const google::protobuf::Message& payload) {
  db::model::EventRecord event;
  event.event_type = std::string(event_type);
  event.payload    = core::ToJson(payload);
  event.created_at = util::Now();

  db::ThrowIfDbError(repository.AppendEvent(tx, event), "append " + event.event_type + " event");
  return event.id;
}

std::string BuildWebhookBody(const db::model::EventRecord& event) {
  google::protobuf::Struct payload;
  auto                     status = google::protobuf::util::JsonStringToMessage(event.payload, &payload);
  if (!status.ok()) {
    throw util::StorageFailure("decode event " + std::to_string(event.id) + ": " + std::string(status.message()));
  }

  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["event_timestamp"].set_string_value(util::FormatIso8601(event.created_at));
  fields["event_type"].set_string_value(event.event_type);
  *fields["event"].mutable_struct_value() = std::move(payload);
  return core::ToJson(body);
}

} // namespace tams::events
