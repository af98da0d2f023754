#pragma once

#include <array>
#include <string_view>

namespace tams::model {

/*
  Catalog event types delivered to webhooks. A webhook subscribed to
  kAllEvents receives every type.
*/
inline constexpr std::string_view kSourceCreated   = "source.created";
inline constexpr std::string_view kSourceUpdated   = "source.updated";
inline constexpr std::string_view kSourceDeleted   = "source.deleted";
inline constexpr std::string_view kFlowCreated     = "flow.created";
inline constexpr std::string_view kFlowUpdated     = "flow.updated";
inline constexpr std::string_view kFlowDeleted     = "flow.deleted";
inline constexpr std::string_view kSegmentsAdded   = "segments.added";
inline constexpr std::string_view kSegmentsDeleted = "segments.deleted";

inline constexpr std::string_view kAllEvents = "*";

inline constexpr std::array<std::string_view, 8> kEventTypes = {
    kSourceCreated, kSourceUpdated, kSourceDeleted, kFlowCreated, kFlowUpdated, kFlowDeleted, kSegmentsAdded, kSegmentsDeleted,
};

constexpr bool IsKnownEventType(std::string_view type) {
  if (type == kAllEvents) return true;
  for (auto known : kEventTypes) {
    if (known == type) return true;
  }
  return false;
}

} // namespace tams::model
