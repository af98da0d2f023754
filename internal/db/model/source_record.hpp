#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/model/format.hpp"
#include "internal/util/time.hpp"

namespace tams::db::model {

struct SourceRecord {
  std::string id;  // UUID

  tams::model::Format format = tams::model::Format::kVideo;

  std::string label;
  std::string description;

  std::map<std::string, std::string> tags;

  util::WallTime created_at{};
  util::WallTime updated_at{};
};

struct SourceFilter {
  std::optional<std::string>         label;
  std::optional<tams::model::Format> format;
};

} // namespace tams::db::model
