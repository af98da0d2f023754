#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tams::model {

/*
  Exact (seconds, nanoseconds) instant on a flow timeline.

  Normalized so that 0 <= nanoseconds < 1e9; negative instants carry the
  sign in seconds ("-0:500000000" is seconds=-1, nanoseconds=500000000).
*/
struct TimePoint {
  int64_t  seconds     = 0;
  uint32_t nanoseconds = 0;

  static constexpr uint32_t kNanosPerSecond = 1'000'000'000;

  // Throws util::ParseError.
  static TimePoint Parse(std::string_view text);
  std::string      ToString() const;

  TimePoint operator+(const TimePoint& other) const;
  TimePoint operator-(const TimePoint& other) const;

  auto operator<=>(const TimePoint&) const = default;
};

/*
  Interval of TimePoints with per-bound inclusivity.

  Canonical text form: "<[|(><start>_<end><)|]>", start/end empty when
  unbounded. Unbounded bounds are always exclusive. A TimeRange built
  through Parse() or Make() is never empty.
*/
struct TimeRange {
  std::optional<TimePoint> start;
  bool                     start_inclusive = true;
  std::optional<TimePoint> end;
  bool                     end_inclusive = false;

  // Throws util::ParseError on malformed or zero-width input.
  static TimeRange Parse(std::string_view text);

  // Normalizes unbounded inclusivity; nullopt when the interval is empty.
  static std::optional<TimeRange> Make(std::optional<TimePoint> start, bool start_inclusive, std::optional<TimePoint> end, bool end_inclusive);

  // (_) : every instant.
  static TimeRange Eternity();

  std::string ToString() const;

  bool IsEmpty() const;
  bool Contains(const TimePoint& point) const;
  // True when every instant of `other` lies inside this range.
  bool Covers(const TimeRange& other) const;

  bool operator==(const TimeRange&) const = default;
};

// Orders by start (unbounded first, inclusive before exclusive at the same instant).
int CompareStarts(const TimeRange& a, const TimeRange& b);
// Orders by end (unbounded last, exclusive before inclusive at the same instant).
int CompareEnds(const TimeRange& a, const TimeRange& b);

bool operator<(const TimeRange& a, const TimeRange& b);

bool                     Overlaps(const TimeRange& a, const TimeRange& b);
std::optional<TimeRange> Intersect(const TimeRange& a, const TimeRange& b);
// Touching with no gap and no shared instant, e.g. [0:0_5:0) and [5:0_9:0).
bool                     Adjacent(const TimeRange& a, const TimeRange& b);
std::optional<TimeRange> UnionIfAdjacentOrOverlapping(const TimeRange& a, const TimeRange& b);
// a \ b as 0, 1 or 2 pieces in time order.
std::vector<TimeRange>   Subtract(const TimeRange& a, const TimeRange& b);

/*
  Normalized union of ranges: sorted, pairwise disjoint and non-adjacent.
  Used for a flow's available timerange, which may have holes.
*/
class TimeRangeSet {
 public:
  TimeRangeSet() = default;

  static TimeRangeSet Of(const std::vector<TimeRange>& ranges);

  void Add(const TimeRange& range);

  const std::vector<TimeRange>& Ranges() const {
    return ranges_;
  }

  bool Empty() const {
    return ranges_.empty();
  }

  // Smallest single range covering every member.
  std::optional<TimeRange> Span() const;

  std::vector<std::string> ToStrings() const;

  bool operator==(const TimeRangeSet&) const = default;

 private:
  std::vector<TimeRange> ranges_;
};

} // namespace tams::model
