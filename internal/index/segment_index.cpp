#include "segment_index.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tams::index {

using tams::model::TimeRange;
using tams::model::TimeRangeSet;

SegmentIndex::SegmentIndex(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::FlowRecord SegmentIndex::LoadWritableFlow(db::Transaction& tx, const std::string& flow_id) {
  auto flow = repository_->GetFlow(tx, flow_id);
  if (!flow) {
    throw util::NotFound("flow not found: " + flow_id);
  }
  if (flow->read_only) {
    throw util::ReadOnlyFlow("flow is read-only: " + flow_id);
  }
  return *flow;
}

void SegmentIndex::Insert(db::Transaction& tx, const db::model::SegmentRecord& segment, bool replace) {
  auto flow = LoadWritableFlow(tx, segment.flow_id);

  db::model::SegmentQuery overlap;
  overlap.flow_id = segment.flow_id;
  overlap.range   = segment.timerange;
  overlap.limit   = 1;

  const auto existing = repository_->FindSegments(tx, overlap);
  if (!existing.empty()) {
    if (!replace) {
      throw util::OverlapConflict("segment " + segment.timerange.ToString() + " overlaps existing segment " +
                                  existing.front().timerange.ToString() + " of flow " + segment.flow_id);
    }
    ClearRange(tx, segment.flow_id, segment.timerange);
    flow.available = RecomputeAvailable(tx, flow);
  }

  db::ThrowIfDbError(repository_->InsertSegment(tx, segment), "insert segment");
  AdjustReference(tx, segment.object_id, segment.flow_id, 1);

  flow.available.Add(segment.timerange);
  db::ThrowIfDbError(repository_->UpdateFlow(tx, flow), "update flow timerange");
}

QueryPage SegmentIndex::Query(db::Transaction& tx, const std::string& flow_id, const TimeRange& range,
                              const std::optional<TimeRange>& after, std::size_t limit) {
  if (!repository_->GetFlow(tx, flow_id)) {
    throw util::NotFound("flow not found: " + flow_id);
  }

  db::model::SegmentQuery query;
  query.flow_id = flow_id;
  query.range   = range;
  query.after   = after;
  // one extra row tells whether another page exists
  query.limit   = limit + 1;

  QueryPage page;
  page.segments = repository_->FindSegments(tx, query);
  if (page.segments.size() > limit) {
    page.segments.resize(limit);
    if (!page.segments.empty()) page.next = page.segments.back().timerange;
  }
  return page;
}

DeleteRangeResult SegmentIndex::DeleteRange(db::Transaction& tx, const std::string& flow_id, const TimeRange& range) {
  auto flow   = LoadWritableFlow(tx, flow_id);
  auto result = ClearRange(tx, flow_id, range);
  if (result.Affected() > 0) {
    flow.available = RecomputeAvailable(tx, flow);
    db::ThrowIfDbError(repository_->UpdateFlow(tx, flow), "update flow timerange");
  }
  return result;
}

DeleteRangeResult SegmentIndex::ClearRange(db::Transaction& tx, const std::string& flow_id, const TimeRange& range) {
  db::model::SegmentQuery query;
  query.flow_id = flow_id;
  query.range   = range;

  DeleteRangeResult result;
  for (const auto& segment : repository_->FindSegments(tx, query)) {
    db::ThrowIfDbError(repository_->DeleteSegment(tx, segment.flow_id, segment.object_id, segment.timerange), "delete segment");

    const auto pieces = tams::model::Subtract(segment.timerange, range);
    for (const auto& piece : pieces) {
      db::ThrowIfDbError(repository_->InsertSegment(tx, Truncate(segment, piece)), "insert segment remainder");
    }

    if (pieces.empty()) {
      ++result.deleted;
    } else {
      ++result.truncated;
    }
    AdjustReference(tx, segment.object_id, flow_id, static_cast<int64_t>(pieces.size()) - 1);
  }
  return result;
}

TimeRangeSet SegmentIndex::RecomputeAvailable(db::Transaction& tx, db::model::FlowRecord& flow) {
  db::model::SegmentQuery query;
  query.flow_id = flow.id;

  std::vector<TimeRange> ranges;
  for (const auto& segment : repository_->FindSegments(tx, query)) {
    ranges.push_back(segment.timerange);
  }
  flow.available = TimeRangeSet::Of(ranges);
  return flow.available;
}

void SegmentIndex::AdjustReference(db::Transaction& tx, const std::string& object_id, const std::string& flow_id, int64_t delta) {
  if (delta == 0) return;

  auto object = repository_->GetMediaObject(tx, object_id);
  if (!object) {
    if (delta < 0) {
      TAMS_LOG_WARN("reference drop on unknown media object", {tams::observability::StringField("object_id", object_id)});
      return;
    }
    object.emplace();
    object->object_id  = object_id;
    object->created_at = util::Now();
  }

  auto& refs  = object->flow_references;
  auto  count = static_cast<int64_t>(refs.count(flow_id) ? refs[flow_id] : 0) + delta;
  if (count > 0) {
    refs[flow_id] = static_cast<uint64_t>(count);
  } else {
    refs.erase(flow_id);
  }

  if (refs.empty()) {
    if (!object->unreferenced_since) object->unreferenced_since = util::Now();
  } else {
    object->unreferenced_since.reset();
  }

  db::ThrowIfDbError(repository_->UpsertMediaObject(tx, *object), "update media object references");
}

db::model::SegmentRecord SegmentIndex::Truncate(const db::model::SegmentRecord& segment, const TimeRange& piece) {
  db::model::SegmentRecord out = segment;
  out.timerange = piece;

  const bool keeps_start = tams::model::CompareStarts(piece, segment.timerange) == 0;
  if (keeps_start) {
    // head piece: same first sample, fewer samples
    out.sample_count.reset();
    out.key_frame_count.reset();
    return out;
  }

  if (segment.timerange.start && piece.start) {
    out.ts_offset = segment.ts_offset + (*piece.start - *segment.timerange.start);
  }
  out.sample_offset.reset();
  out.sample_count.reset();
  out.key_frame_count.reset();
  return out;
}

} // namespace tams::index
