#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tams::storage::common {

inline constexpr std::size_t kMaxObjectIdLength = 255;

inline void ValidateObjectId(const std::string& object_id) {
  if (object_id.empty()) {
    throw util::ParseError("object id must not be empty");
  }
  if (object_id.size() > kMaxObjectIdLength) {
    throw util::ParseError("object id longer than 255 characters");
  }
  if (object_id.find("..") != std::string::npos) {
    throw util::ParseError("object id must not contain '..'");
  }
  for (char c : object_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::ParseError("object id contains invalid character");
    }
  }
}

// "<hex unix seconds>-<32 hex uuid digits>"; sorts roughly by allocation time.
inline std::string GenerateObjectId() {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(util::Now().time_since_epoch()).count();
  char       prefix[24];
  std::snprintf(prefix, sizeof(prefix), "%llx", static_cast<unsigned long long>(seconds));
  return std::string(prefix) + "-" + util::ToSimpleString(util::GenerateUUID());
}

inline std::string JoinPath(const std::string& root, const std::string& leaf) {
  if (root.empty()) return leaf;
  if (root.back() == '/') return root + leaf;
  return root + "/" + leaf;
}

} // namespace tams::storage::common
