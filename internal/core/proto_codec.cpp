#include "proto_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tams::core {

using tams::model::TimePoint;
using tams::model::TimeRange;

tams::v1::Format ToProto(tams::model::Format format) {
  switch (format) {
    case tams::model::Format::kVideo:
      return tams::v1::FORMAT_VIDEO;
    case tams::model::Format::kImage:
      return tams::v1::FORMAT_IMAGE;
    case tams::model::Format::kAudio:
      return tams::v1::FORMAT_AUDIO;
    case tams::model::Format::kData:
      return tams::v1::FORMAT_DATA;
    case tams::model::Format::kMulti:
    default:
      return tams::v1::FORMAT_MULTI;
  }
}

tams::model::Format FromProto(tams::v1::Format format) {
  switch (format) {
    case tams::v1::FORMAT_VIDEO:
      return tams::model::Format::kVideo;
    case tams::v1::FORMAT_IMAGE:
      return tams::model::Format::kImage;
    case tams::v1::FORMAT_AUDIO:
      return tams::model::Format::kAudio;
    case tams::v1::FORMAT_DATA:
      return tams::model::Format::kData;
    case tams::v1::FORMAT_MULTI:
      return tams::model::Format::kMulti;
    default:
      throw util::ParseError("format must be set");
  }
}

tams::v1::DeletionStatus ToProto(tams::model::DeletionStatus status) {
  switch (status) {
    case tams::model::DeletionStatus::kPending:
      return tams::v1::DELETION_STATUS_PENDING;
    case tams::model::DeletionStatus::kProcessing:
      return tams::v1::DELETION_STATUS_PROCESSING;
    case tams::model::DeletionStatus::kCompleted:
      return tams::v1::DELETION_STATUS_COMPLETED;
    case tams::model::DeletionStatus::kError:
    default:
      return tams::v1::DELETION_STATUS_ERROR;
  }
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

tams::v1::Source ToProto(const db::model::SourceRecord& record) {
  tams::v1::Source source;
  source.set_id(record.id);
  source.set_format(ToProto(record.format));
  source.set_label(record.label);
  source.set_description(record.description);
  source.mutable_tags()->insert(record.tags.begin(), record.tags.end());
  *source.mutable_created_at() = util::ToProto(record.created_at);
  *source.mutable_updated_at() = util::ToProto(record.updated_at);
  return source;
}

db::model::SourceRecord FromProto(const tams::v1::Source& source) {
  db::model::SourceRecord record;
  record.id          = source.id();
  record.format      = FromProto(source.format());
  record.label       = source.label();
  record.description = source.description();
  record.tags.insert(source.tags().begin(), source.tags().end());
  return record;
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

tams::v1::Flow ToProto(const db::model::FlowRecord& record) {
  tams::v1::Flow flow;
  flow.set_id(record.id);
  if (record.source_id) flow.set_source_id(*record.source_id);
  flow.set_format(ToProto(record.format));
  flow.set_label(record.label);
  flow.set_description(record.description);
  flow.mutable_tags()->insert(record.tags.begin(), record.tags.end());
  flow.set_read_only(record.read_only);
  flow.set_max_bit_rate(record.max_bit_rate.value_or(0));
  flow.set_avg_bit_rate(record.avg_bit_rate.value_or(0));
  flow.set_container(record.container);
  flow.set_codec(record.codec);
  flow.set_frame_width(record.frame_width.value_or(0));
  flow.set_frame_height(record.frame_height.value_or(0));
  flow.set_sample_rate(record.sample_rate.value_or(0));
  flow.set_channels(record.channels.value_or(0));
  for (const auto& item : record.flow_collection) {
    auto* out = flow.add_flow_collection();
    out->set_flow_id(item.flow_id);
    out->set_role(item.role);
  }
  for (const auto& piece : record.available.ToStrings()) {
    flow.add_available_timerange(piece);
  }
  if (auto span = record.available.Span()) flow.set_timerange(span->ToString());
  *flow.mutable_created_at() = util::ToProto(record.created_at);
  *flow.mutable_updated_at() = util::ToProto(record.updated_at);
  return flow;
}

db::model::FlowRecord FromProto(const tams::v1::Flow& flow) {
  db::model::FlowRecord record;
  record.id = flow.id();
  if (!flow.source_id().empty()) record.source_id = flow.source_id();
  record.format      = FromProto(flow.format());
  record.label       = flow.label();
  record.description = flow.description();
  record.tags.insert(flow.tags().begin(), flow.tags().end());
  record.read_only = flow.read_only();
  if (flow.max_bit_rate() != 0) record.max_bit_rate = flow.max_bit_rate();
  if (flow.avg_bit_rate() != 0) record.avg_bit_rate = flow.avg_bit_rate();
  record.container = flow.container();
  record.codec     = flow.codec();
  if (flow.frame_width() != 0) record.frame_width = flow.frame_width();
  if (flow.frame_height() != 0) record.frame_height = flow.frame_height();
  if (flow.sample_rate() != 0) record.sample_rate = flow.sample_rate();
  if (flow.channels() != 0) record.channels = flow.channels();
  for (const auto& item : flow.flow_collection()) {
    record.flow_collection.push_back({item.flow_id(), item.role()});
  }
  return record;
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

tams::v1::Segment ToProto(const db::model::SegmentRecord& record) {
  tams::v1::Segment segment;
  segment.set_flow_id(record.flow_id);
  segment.set_object_id(record.object_id);
  segment.set_timerange(record.timerange.ToString());
  segment.set_ts_offset(record.ts_offset.ToString());
  if (record.sample_offset) segment.set_sample_offset(*record.sample_offset);
  if (record.sample_count) segment.set_sample_count(*record.sample_count);
  if (record.key_frame_count) segment.set_key_frame_count(*record.key_frame_count);
  for (const auto& url : record.get_urls) {
    auto* out = segment.add_get_urls();
    out->set_url(url.url);
    out->set_label(url.label);
  }
  *segment.mutable_created_at() = util::ToProto(record.created_at);
  return segment;
}

db::model::SegmentRecord FromProto(const tams::v1::Segment& segment) {
  db::model::SegmentRecord record;
  record.flow_id   = segment.flow_id();
  record.object_id = segment.object_id();
  record.timerange = TimeRange::Parse(segment.timerange());
  if (!segment.ts_offset().empty()) record.ts_offset = TimePoint::Parse(segment.ts_offset());
  if (segment.has_sample_offset()) record.sample_offset = segment.sample_offset();
  if (segment.has_sample_count()) record.sample_count = segment.sample_count();
  if (segment.has_key_frame_count()) record.key_frame_count = segment.key_frame_count();
  for (const auto& url : segment.get_urls()) {
    record.get_urls.push_back({url.url(), url.label()});
  }
  return record;
}

// ------------------------------------------------------------------
// Media objects, webhooks, deletion requests
// ------------------------------------------------------------------

tams::v1::MediaObject ToProto(const db::model::MediaObjectRecord& record) {
  tams::v1::MediaObject object;
  object.set_object_id(record.object_id);
  object.set_size_bytes(record.size_bytes);
  object.set_mime_type(record.mime_type);
  for (const auto& [flow_id, count] : record.flow_references) {
    auto* ref = object.add_flow_references();
    ref->set_flow_id(flow_id);
    ref->set_segment_count(count);
  }
  *object.mutable_created_at() = util::ToProto(record.created_at);
  return object;
}

tams::v1::Webhook ToProto(const db::model::WebhookRecord& record) {
  tams::v1::Webhook webhook;
  webhook.set_url(record.url);
  webhook.set_api_key_name(record.api_key_name);
  for (const auto& event : record.events) {
    webhook.add_events(event);
  }
  return webhook;
}

db::model::WebhookRecord FromProto(const tams::v1::Webhook& webhook) {
  db::model::WebhookRecord record;
  record.url           = webhook.url();
  record.api_key_name  = webhook.api_key_name();
  record.api_key_value = webhook.api_key_value();
  record.events.assign(webhook.events().begin(), webhook.events().end());
  return record;
}

tams::v1::DeletionRequest ToProto(const db::model::DeletionRequestRecord& record) {
  tams::v1::DeletionRequest request;
  request.set_id(record.id);
  request.set_flow_id(record.flow_id);
  request.set_timerange(record.timerange.ToString());
  request.set_status(ToProto(record.status));
  if (record.remaining) request.set_remaining(record.remaining->ToString());
  request.set_segments_processed(record.segments_processed);
  request.set_error(record.error);
  request.set_cancel_requested(record.cancel_requested);
  *request.mutable_created_at() = util::ToProto(record.created_at);
  *request.mutable_updated_at() = util::ToProto(record.updated_at);
  return request;
}

tams::v1::StorageLocation ToProto(const storage::UploadLocator& locator) {
  tams::v1::StorageLocation location;
  location.set_object_id(locator.object_id);
  location.set_put_url(locator.put_url);
  *location.mutable_expires_at() = util::ToProto(locator.expires_at);
  return location;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StorageFailure("encode " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

} // namespace tams::core
