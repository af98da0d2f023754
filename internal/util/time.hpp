#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace tams::util {

/*
  Wall clock utilities; single place to control clock source later.

  Catalog timestamps are persisted as ISO-8601 UTC strings with
  microsecond precision, e.g. "2024-05-01T12:00:00.000000Z".
*/

using Clock     = std::chrono::system_clock;
using WallTime  = Clock::time_point;

WallTime Now();

google::protobuf::Timestamp ToProto(WallTime tp);
WallTime                    FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(WallTime tp);

std::string FormatIso8601(WallTime tp);

// Throws ParseError on malformed input.
WallTime ParseIso8601(const std::string& text);

} // namespace tams::util
