#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/timerange.hpp"
#include "internal/util/time.hpp"

namespace tams::db::model {

struct GetUrlRecord {
  std::string url;
  std::string label;

  bool operator==(const GetUrlRecord&) const = default;
};

/*
  Persistent segment row. Identity is (flow_id, object_id, timerange).
*/
struct SegmentRecord {
  std::string flow_id;
  std::string object_id;

  tams::model::TimeRange timerange;

  // Position of the segment's first instant inside the object.
  tams::model::TimePoint ts_offset;

  std::optional<uint64_t> sample_offset;
  std::optional<uint64_t> sample_count;
  std::optional<uint64_t> key_frame_count;

  std::vector<GetUrlRecord> get_urls;

  util::WallTime created_at{};
};

/*
  Overlap query over one flow.

  Results are ordered by start ascending. `after` resumes a previous page:
  only segments starting strictly after it are returned.
*/
struct SegmentQuery {
  std::string flow_id;

  tams::model::TimeRange range = tams::model::TimeRange::Eternity();

  std::optional<tams::model::TimeRange> after;

  std::optional<std::size_t> limit;
};

// Exact predicate; backends may pre-filter coarsely but must apply this before paging.
inline bool Matches(const SegmentRecord& segment, const SegmentQuery& query) {
  if (segment.flow_id != query.flow_id) return false;
  if (query.after && tams::model::CompareStarts(segment.timerange, *query.after) <= 0) return false;
  return tams::model::Overlaps(segment.timerange, query.range);
}

} // namespace tams::db::model
