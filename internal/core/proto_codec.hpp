#pragma once

#include <google/protobuf/message.h>

#include <string>

#include "internal/db/model/deletion_request_record.hpp"
#include "internal/db/model/flow_record.hpp"
#include "internal/db/model/media_object_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/db/model/webhook_record.hpp"
#include "internal/storage/object_store.hpp"
#include "tams/v1.hpp"

namespace tams::core {

/*
  Record <-> wire message conversion.

  FromProto functions parse textual time ranges and timestamps and throw
  util::ParseError on malformed input. Ids are copied verbatim; callers
  validate them.
*/

tams::v1::Format             ToProto(tams::model::Format format);
tams::model::Format          FromProto(tams::v1::Format format);
tams::v1::DeletionStatus     ToProto(tams::model::DeletionStatus status);

tams::v1::Source             ToProto(const db::model::SourceRecord& record);
db::model::SourceRecord      FromProto(const tams::v1::Source& source);

tams::v1::Flow               ToProto(const db::model::FlowRecord& record);
db::model::FlowRecord        FromProto(const tams::v1::Flow& flow);

tams::v1::Segment            ToProto(const db::model::SegmentRecord& record);
db::model::SegmentRecord     FromProto(const tams::v1::Segment& segment);

tams::v1::MediaObject        ToProto(const db::model::MediaObjectRecord& record);

// api_key_value is never copied out.
tams::v1::Webhook            ToProto(const db::model::WebhookRecord& record);
db::model::WebhookRecord     FromProto(const tams::v1::Webhook& webhook);

tams::v1::DeletionRequest    ToProto(const db::model::DeletionRequestRecord& record);

tams::v1::StorageLocation    ToProto(const storage::UploadLocator& locator);

// Compact JSON with proto field names; throws util::StorageFailure on failure.
std::string ToJson(const google::protobuf::Message& message);

} // namespace tams::core
