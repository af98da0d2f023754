#include "time.hpp"

#include <cstdio>
#include <ctime>

#include "internal/util/errors.hpp"

namespace tams::util {

WallTime Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(WallTime tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

WallTime FromProto(const google::protobuf::Timestamp& ts) {
  return WallTime{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(WallTime tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatIso8601(WallTime tp) {
  const auto sec    = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - sec).count();

  const std::time_t t = Clock::to_time_t(sec);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return buf;
}

WallTime ParseIso8601(const std::string& text) {
  std::tm utc{};
  int     consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min, &utc.tm_sec,
                  &consumed) != 6) {
    throw ParseError("invalid ISO-8601 timestamp: " + text);
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  // optional fraction, up to nanoseconds
  int64_t     fraction_ns = 0;
  std::size_t pos         = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int64_t scale  = 100000000;
    bool    digits = false;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      fraction_ns += (text[pos] - '0') * scale;
      scale /= 10;
      digits = true;
      ++pos;
    }
    if (!digits) throw ParseError("invalid ISO-8601 fraction: " + text);
  }
  if (pos + 1 != text.size() || text[pos] != 'Z') {
    throw ParseError("ISO-8601 timestamp must be UTC: " + text);
  }

  const std::time_t seconds = timegm(&utc);
  return Clock::from_time_t(seconds) + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(fraction_ns));
}

} // namespace tams::util
