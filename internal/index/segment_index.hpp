#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/timerange.hpp"

namespace tams::index {

struct QueryPage {
  std::vector<db::model::SegmentRecord> segments;

  // Resume point for the next page; nullopt on the last page.
  std::optional<tams::model::TimeRange> next;
};

struct DeleteRangeResult {
  uint64_t deleted   = 0;  // segments removed outright
  uint64_t truncated = 0;  // segments replaced by their remainder pieces

  uint64_t Affected() const {
    return deleted + truncated;
  }
};

/*
  Overlap, merge and split logic over a flow's segment table.

  Every operation is scoped to one flow and runs inside the caller's
  transaction, so the segment rows, the flow's available timerange and
  the media object reference counts change together or not at all.

  After every call the flow's segments are pairwise non-overlapping and
  its available timerange is their exact union.
*/
class SegmentIndex {
 public:
  explicit SegmentIndex(std::shared_ptr<db::Repository> repository);

  /*
    Adds `segment` to its flow.

    Throws OverlapConflict when the range collides with existing coverage
    and `replace` is false; with `replace` the overlapped coverage is first
    cleared through DeleteRange. The segment's media object row must exist.
  */
  void Insert(db::Transaction& tx, const db::model::SegmentRecord& segment, bool replace);

  // Segments overlapping `range` in start order, resuming after `after`.
  QueryPage Query(db::Transaction& tx, const std::string& flow_id, const tams::model::TimeRange& range,
                  const std::optional<tams::model::TimeRange>& after, std::size_t limit);

  /*
    Removes `range` from the flow's coverage.

    Segments inside `range` are deleted; segments that straddle a bound
    are replaced by the pieces left outside it. Calling it again with the
    same range affects nothing.
  */
  DeleteRangeResult DeleteRange(db::Transaction& tx, const std::string& flow_id, const tams::model::TimeRange& range);

  // Full-scan rebuild of the flow's available timerange.
  tams::model::TimeRangeSet RecomputeAvailable(db::Transaction& tx, db::model::FlowRecord& flow);

  // Applies `delta` to the flow's reference count on the object.
  void AdjustReference(db::Transaction& tx, const std::string& object_id, const std::string& flow_id, int64_t delta);

  // Piece of `segment` restricted to `piece`, with offsets and sample fields adjusted.
  static db::model::SegmentRecord Truncate(const db::model::SegmentRecord& segment, const tams::model::TimeRange& piece);

 private:
  db::model::FlowRecord LoadWritableFlow(db::Transaction& tx, const std::string& flow_id);

  DeleteRangeResult ClearRange(db::Transaction& tx, const std::string& flow_id, const tams::model::TimeRange& range);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace tams::index
