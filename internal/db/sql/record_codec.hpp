#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/flow_record.hpp"
#include "internal/db/model/segment_record.hpp"
#include "internal/model/timerange.hpp"

namespace tams::db::sql {

/*
  Structured column encoding shared by the SQL backends.

  Tag maps, URL lists and reference sets are stored as JSON text.
  Decoders throw util::StorageFailure on malformed column content.
*/

std::string                        EncodeTags(const std::map<std::string, std::string>& tags);
std::map<std::string, std::string> DecodeTags(const std::string& json);

std::string              EncodeStrings(const std::vector<std::string>& values);
std::vector<std::string> DecodeStrings(const std::string& json);

std::string                      EncodeGetUrls(const std::vector<model::GetUrlRecord>& urls);
std::vector<model::GetUrlRecord> DecodeGetUrls(const std::string& json);

std::string                            EncodeFlowCollection(const std::vector<model::FlowCollectionItem>& items);
std::vector<model::FlowCollectionItem> DecodeFlowCollection(const std::string& json);

std::string                     EncodeFlowReferences(const std::map<std::string, uint64_t>& refs);
std::map<std::string, uint64_t> DecodeFlowReferences(const std::string& json);

std::string               EncodeTimeRangeSet(const tams::model::TimeRangeSet& set);
tams::model::TimeRangeSet DecodeTimeRangeSet(const std::string& json);

// Column form of a range's bounds, used for ordering and coarse filtering.
struct RangeColumns {
  std::optional<int64_t> start_sec;
  std::optional<int64_t> start_nsec;
  int                    start_excl = 0;
  std::optional<int64_t> end_sec;
  std::optional<int64_t> end_nsec;
};

RangeColumns ToColumns(const tams::model::TimeRange& range);

// Column decoders for TEXT columns that hold canonical forms.
tams::model::TimeRange DecodeTimeRange(const std::string& text);
tams::model::TimePoint DecodeTimePoint(const std::string& text);
util::WallTime         DecodeTime(const std::string& text);
tams::model::Format    DecodeFormat(const std::string& urn);

} // namespace tams::db::sql
