#include "timerange.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace tams::model {

namespace {

template <typename T>
T ParseDigits(std::string_view digits, std::string_view whole) {
  T value{};
  if (digits.empty()) throw util::ParseError("missing digits in timestamp: " + std::string(whole));
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    throw util::ParseError("invalid timestamp: " + std::string(whole));
  }
  return value;
}

int64_t AddSeconds(int64_t a, int64_t b) {
  if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) || (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
    throw util::InvalidArgument("timestamp arithmetic overflows: " + std::to_string(a) + " + " + std::to_string(b));
  }
  return a + b;
}

int64_t SubtractSeconds(int64_t a, int64_t b) {
  if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) || (b > 0 && a < std::numeric_limits<int64_t>::min() + b)) {
    throw util::InvalidArgument("timestamp arithmetic overflows: " + std::to_string(a) + " - " + std::to_string(b));
  }
  return a - b;
}

bool BoundsEmpty(const std::optional<TimePoint>& start, bool start_inclusive, const std::optional<TimePoint>& end, bool end_inclusive) {
  if (!start || !end) return false;
  if (*start < *end) return false;
  if (*end < *start) return true;
  return !(start_inclusive && end_inclusive);
}

} // namespace

// ------------------------------------------------------------------
// TimePoint
// ------------------------------------------------------------------

TimePoint TimePoint::Parse(std::string_view text) {
  std::string_view body     = text;
  bool             negative = false;
  if (!body.empty() && body.front() == '-') {
    negative = true;
    body.remove_prefix(1);
  }

  const auto colon = body.find(':');
  if (colon == std::string_view::npos) throw util::ParseError("timestamp must be <seconds>:<nanoseconds>: " + std::string(text));

  // unsigned parse: a second sign is malformed, not a double negation
  const auto magnitude = ParseDigits<uint64_t>(body.substr(0, colon), text);
  const auto nanos     = ParseDigits<uint32_t>(body.substr(colon + 1), text);
  if (nanos >= kNanosPerSecond) throw util::ParseError("nanoseconds out of range: " + std::string(text));

  constexpr auto kMaxSeconds = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (!negative) {
    if (magnitude > kMaxSeconds) throw util::ParseError("seconds out of range: " + std::string(text));
    return TimePoint{static_cast<int64_t>(magnitude), nanos};
  }
  if (nanos == 0) {
    // -2^63 is representable, +2^63 is not
    if (magnitude > kMaxSeconds + 1) throw util::ParseError("seconds out of range: " + std::string(text));
    if (magnitude == 0) return TimePoint{0, 0};
    return TimePoint{-static_cast<int64_t>(magnitude - 1) - 1, 0};
  }
  if (magnitude > kMaxSeconds) throw util::ParseError("seconds out of range: " + std::string(text));
  return TimePoint{-static_cast<int64_t>(magnitude) - 1, kNanosPerSecond - nanos};
}

std::string TimePoint::ToString() const {
  if (seconds < 0 && nanoseconds > 0) {
    return "-" + std::to_string(-(seconds + 1)) + ":" + std::to_string(kNanosPerSecond - nanoseconds);
  }
  return std::to_string(seconds) + ":" + std::to_string(nanoseconds);
}

TimePoint TimePoint::operator+(const TimePoint& other) const {
  int64_t  secs  = AddSeconds(seconds, other.seconds);
  uint32_t nanos = nanoseconds + other.nanoseconds;
  if (nanos >= kNanosPerSecond) {
    nanos -= kNanosPerSecond;
    secs = AddSeconds(secs, 1);
  }
  return TimePoint{secs, nanos};
}

TimePoint TimePoint::operator-(const TimePoint& other) const {
  int64_t secs  = SubtractSeconds(seconds, other.seconds);
  int64_t nanos = static_cast<int64_t>(nanoseconds) - static_cast<int64_t>(other.nanoseconds);
  if (nanos < 0) {
    nanos += kNanosPerSecond;
    secs = SubtractSeconds(secs, 1);
  }
  return TimePoint{secs, static_cast<uint32_t>(nanos)};
}

// ------------------------------------------------------------------
// TimeRange
// ------------------------------------------------------------------

std::optional<TimeRange> TimeRange::Make(std::optional<TimePoint> start, bool start_inclusive, std::optional<TimePoint> end, bool end_inclusive) {
  if (!start) start_inclusive = false;
  if (!end) end_inclusive = false;
  if (BoundsEmpty(start, start_inclusive, end, end_inclusive)) return std::nullopt;
  return TimeRange{start, start_inclusive, end, end_inclusive};
}

TimeRange TimeRange::Eternity() {
  return TimeRange{std::nullopt, false, std::nullopt, false};
}

TimeRange TimeRange::Parse(std::string_view text) {
  std::string_view body = text;
  bool             start_inclusive = true;
  bool             end_inclusive   = false;
  bool             marked          = false;

  if (!body.empty() && (body.front() == '[' || body.front() == '(')) {
    start_inclusive = body.front() == '[';
    body.remove_prefix(1);
    marked = true;
  }
  if (!body.empty() && (body.back() == ']' || body.back() == ')')) {
    end_inclusive = body.back() == ']';
    body.remove_suffix(1);
    marked = true;
  }
  if (body.empty()) throw util::ParseError("empty time range: " + std::string(text));

  std::optional<TimePoint> start;
  std::optional<TimePoint> end;

  const auto sep = body.find('_');
  if (sep == std::string_view::npos) {
    // instantaneous form "[<ts>]"
    start = end = TimePoint::Parse(body);
    if (!marked) start_inclusive = end_inclusive = true;
  } else {
    if (body.find('_', sep + 1) != std::string_view::npos) throw util::ParseError("too many separators in time range: " + std::string(text));
    const auto start_text = body.substr(0, sep);
    const auto end_text   = body.substr(sep + 1);
    if (!start_text.empty()) start = TimePoint::Parse(start_text);
    if (!end_text.empty()) end = TimePoint::Parse(end_text);
  }

  auto range = Make(start, start_inclusive, end, end_inclusive);
  if (!range) throw util::ParseError("zero-width or inverted time range: " + std::string(text));
  return *range;
}

std::string TimeRange::ToString() const {
  std::string out;
  out += start_inclusive ? '[' : '(';
  if (start) out += start->ToString();
  out += '_';
  if (end) out += end->ToString();
  out += end_inclusive ? ']' : ')';
  return out;
}

bool TimeRange::IsEmpty() const {
  return BoundsEmpty(start, start_inclusive, end, end_inclusive);
}

bool TimeRange::Contains(const TimePoint& point) const {
  const bool after_start = !start || *start < point || (*start == point && start_inclusive);
  const bool before_end  = !end || point < *end || (*end == point && end_inclusive);
  return after_start && before_end;
}

bool TimeRange::Covers(const TimeRange& other) const {
  return CompareStarts(*this, other) <= 0 && CompareEnds(*this, other) >= 0;
}

int CompareStarts(const TimeRange& a, const TimeRange& b) {
  if (!a.start && !b.start) return 0;
  if (!a.start) return -1;
  if (!b.start) return 1;
  if (*a.start != *b.start) return *a.start < *b.start ? -1 : 1;
  if (a.start_inclusive == b.start_inclusive) return 0;
  return a.start_inclusive ? -1 : 1;
}

int CompareEnds(const TimeRange& a, const TimeRange& b) {
  if (!a.end && !b.end) return 0;
  if (!a.end) return 1;
  if (!b.end) return -1;
  if (*a.end != *b.end) return *a.end < *b.end ? -1 : 1;
  if (a.end_inclusive == b.end_inclusive) return 0;
  return a.end_inclusive ? 1 : -1;
}

bool operator<(const TimeRange& a, const TimeRange& b) {
  const int by_start = CompareStarts(a, b);
  if (by_start != 0) return by_start < 0;
  return CompareEnds(a, b) < 0;
}

std::optional<TimeRange> Intersect(const TimeRange& a, const TimeRange& b) {
  const TimeRange& later_start = CompareStarts(a, b) >= 0 ? a : b;
  const TimeRange& earlier_end = CompareEnds(a, b) <= 0 ? a : b;
  return TimeRange::Make(later_start.start, later_start.start_inclusive, earlier_end.end, earlier_end.end_inclusive);
}

bool Overlaps(const TimeRange& a, const TimeRange& b) {
  return Intersect(a, b).has_value();
}

bool Adjacent(const TimeRange& a, const TimeRange& b) {
  auto touches = [](const TimeRange& left, const TimeRange& right) {
    return left.end && right.start && *left.end == *right.start && left.end_inclusive != right.start_inclusive;
  };
  return touches(a, b) || touches(b, a);
}

std::optional<TimeRange> UnionIfAdjacentOrOverlapping(const TimeRange& a, const TimeRange& b) {
  if (!Overlaps(a, b) && !Adjacent(a, b)) return std::nullopt;

  const TimeRange& earlier_start = CompareStarts(a, b) <= 0 ? a : b;
  const TimeRange& later_end     = CompareEnds(a, b) >= 0 ? a : b;
  return TimeRange::Make(earlier_start.start, earlier_start.start_inclusive, later_end.end, later_end.end_inclusive);
}

std::vector<TimeRange> Subtract(const TimeRange& a, const TimeRange& b) {
  if (!Overlaps(a, b)) return {a};

  std::vector<TimeRange> pieces;
  if (b.start) {
    if (auto head = TimeRange::Make(a.start, a.start_inclusive, b.start, !b.start_inclusive)) pieces.push_back(*head);
  }
  if (b.end) {
    if (auto tail = TimeRange::Make(b.end, !b.end_inclusive, a.end, a.end_inclusive)) pieces.push_back(*tail);
  }
  return pieces;
}

// ------------------------------------------------------------------
// TimeRangeSet
// ------------------------------------------------------------------

TimeRangeSet TimeRangeSet::Of(const std::vector<TimeRange>& ranges) {
  TimeRangeSet set;
  for (const auto& range : ranges) set.Add(range);
  return set;
}

void TimeRangeSet::Add(const TimeRange& range) {
  TimeRange              merged = range;
  std::vector<TimeRange> kept;
  kept.reserve(ranges_.size() + 1);

  for (const auto& existing : ranges_) {
    if (auto joined = UnionIfAdjacentOrOverlapping(merged, existing)) {
      merged = *joined;
    } else {
      kept.push_back(existing);
    }
  }

  kept.push_back(merged);
  std::sort(kept.begin(), kept.end());
  ranges_ = std::move(kept);
}

std::optional<TimeRange> TimeRangeSet::Span() const {
  if (ranges_.empty()) return std::nullopt;
  const auto& first = ranges_.front();
  const auto& last  = ranges_.back();
  return TimeRange::Make(first.start, first.start_inclusive, last.end, last.end_inclusive);
}

std::vector<std::string> TimeRangeSet::ToStrings() const {
  std::vector<std::string> out;
  out.reserve(ranges_.size());
  for (const auto& range : ranges_) out.push_back(range.ToString());
  return out;
}

} // namespace tams::model
