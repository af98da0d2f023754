#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/format.hpp"
#include "internal/model/timerange.hpp"
#include "internal/util/time.hpp"

namespace tams::db::model {

struct FlowCollectionItem {
  std::string flow_id;
  std::string role;

  bool operator==(const FlowCollectionItem&) const = default;
};

/*
  Persistent flow row.

  `available` is derived from the flow's segments. It is maintained by the
  segment index inside the same transaction as every segment mutation and
  is never written independently of the segment table.
*/
struct FlowRecord {
  std::string id;  // UUID

  // Weak reference; cleared when the source is deleted.
  std::optional<std::string> source_id;

  tams::model::Format format = tams::model::Format::kVideo;

  std::string label;
  std::string description;

  std::map<std::string, std::string> tags;

  bool read_only = false;

  std::optional<uint64_t> max_bit_rate;
  std::optional<uint64_t> avg_bit_rate;

  std::string container;
  std::string codec;

  std::optional<uint32_t> frame_width;
  std::optional<uint32_t> frame_height;
  std::optional<uint32_t> sample_rate;
  std::optional<uint32_t> channels;

  std::vector<FlowCollectionItem> flow_collection;

  tams::model::TimeRangeSet available;

  util::WallTime created_at{};
  util::WallTime updated_at{};
};

struct FlowFilter {
  std::optional<std::string>         source_id;
  std::optional<tams::model::Format> format;
  std::optional<std::string>         label;
};

} // namespace tams::db::model
