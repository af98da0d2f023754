#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace tams::util {

/*
  UUID helpers

  Sources, flows and deletion requests are keyed by RFC4122 UUIDs in
  their canonical lowercase hyphenated form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
// 32 hex digits, no hyphens.
std::string ToSimpleString(const UUID& id);

// Throws ParseError on malformed input.
UUID FromString(const std::string& str);

bool IsUUID(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace tams::util
