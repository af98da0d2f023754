#include "record_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace tams::db::sql {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw util::StorageFailure("failed to encode column: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json, const char* what) {
  Message message;
  if (json.empty()) return message;
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw util::StorageFailure(std::string("corrupt ") + what + " column: " + std::string(status.message()));
  }
  return message;
}

std::string StringField(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

} // namespace

std::string EncodeTags(const std::map<std::string, std::string>& tags) {
  Struct s;
  for (const auto& [key, value] : tags) {
    (*s.mutable_fields())[key].set_string_value(value);
  }
  return ToJson(s);
}

std::map<std::string, std::string> DecodeTags(const std::string& json) {
  std::map<std::string, std::string> tags;
  for (const auto& [key, value] : FromJson<Struct>(json, "tags").fields()) {
    tags[key] = value.string_value();
  }
  return tags;
}

std::string EncodeStrings(const std::vector<std::string>& values) {
  ListValue list;
  for (const auto& value : values) list.add_values()->set_string_value(value);
  return ToJson(list);
}

std::vector<std::string> DecodeStrings(const std::string& json) {
  std::vector<std::string> out;
  for (const auto& value : FromJson<ListValue>(json, "string list").values()) {
    out.push_back(value.string_value());
  }
  return out;
}

std::string EncodeGetUrls(const std::vector<model::GetUrlRecord>& urls) {
  ListValue list;
  for (const auto& url : urls) {
    auto* fields = list.add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["url"].set_string_value(url.url);
    if (!url.label.empty()) (*fields)["label"].set_string_value(url.label);
  }
  return ToJson(list);
}

std::vector<model::GetUrlRecord> DecodeGetUrls(const std::string& json) {
  std::vector<model::GetUrlRecord> out;
  for (const auto& value : FromJson<ListValue>(json, "get_urls").values()) {
    out.push_back({StringField(value.struct_value(), "url"), StringField(value.struct_value(), "label")});
  }
  return out;
}

std::string EncodeFlowCollection(const std::vector<model::FlowCollectionItem>& items) {
  ListValue list;
  for (const auto& item : items) {
    auto* fields = list.add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["id"].set_string_value(item.flow_id);
    (*fields)["role"].set_string_value(item.role);
  }
  return ToJson(list);
}

std::vector<model::FlowCollectionItem> DecodeFlowCollection(const std::string& json) {
  std::vector<model::FlowCollectionItem> out;
  for (const auto& value : FromJson<ListValue>(json, "flow_collection").values()) {
    out.push_back({StringField(value.struct_value(), "id"), StringField(value.struct_value(), "role")});
  }
  return out;
}

std::string EncodeFlowReferences(const std::map<std::string, uint64_t>& refs) {
  Struct s;
  for (const auto& [flow_id, count] : refs) {
    (*s.mutable_fields())[flow_id].set_number_value(static_cast<double>(count));
  }
  return ToJson(s);
}

std::map<std::string, uint64_t> DecodeFlowReferences(const std::string& json) {
  std::map<std::string, uint64_t> refs;
  for (const auto& [flow_id, value] : FromJson<Struct>(json, "flow_references").fields()) {
    refs[flow_id] = static_cast<uint64_t>(value.number_value());
  }
  return refs;
}

std::string EncodeTimeRangeSet(const tams::model::TimeRangeSet& set) {
  return EncodeStrings(set.ToStrings());
}

tams::model::TimeRangeSet DecodeTimeRangeSet(const std::string& json) {
  tams::model::TimeRangeSet set;
  for (const auto& text : DecodeStrings(json)) set.Add(DecodeTimeRange(text));
  return set;
}

RangeColumns ToColumns(const tams::model::TimeRange& range) {
  RangeColumns cols;
  if (range.start) {
    cols.start_sec  = range.start->seconds;
    cols.start_nsec = range.start->nanoseconds;
  }
  cols.start_excl = range.start_inclusive ? 0 : 1;
  if (range.end) {
    cols.end_sec  = range.end->seconds;
    cols.end_nsec = range.end->nanoseconds;
  }
  return cols;
}

tams::model::TimeRange DecodeTimeRange(const std::string& text) {
  try {
    return tams::model::TimeRange::Parse(text);
  } catch (const util::ParseError& e) {
    throw util::StorageFailure(std::string("corrupt timerange column: ") + e.what());
  }
}

tams::model::TimePoint DecodeTimePoint(const std::string& text) {
  try {
    return tams::model::TimePoint::Parse(text);
  } catch (const util::ParseError& e) {
    throw util::StorageFailure(std::string("corrupt timestamp column: ") + e.what());
  }
}

util::WallTime DecodeTime(const std::string& text) {
  try {
    return util::ParseIso8601(text);
  } catch (const util::ParseError& e) {
    throw util::StorageFailure(std::string("corrupt time column: ") + e.what());
  }
}

tams::model::Format DecodeFormat(const std::string& urn) {
  auto format = tams::model::FormatFromUrn(urn);
  if (!format) throw util::StorageFailure("corrupt format column: " + urn);
  return *format;
}

} // namespace tams::db::sql
