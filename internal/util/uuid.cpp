#include "uuid.hpp"

#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace tams::util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

std::string ToSimpleString(const UUID& id) {
  std::ostringstream oss;
  for (auto b : id)
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return oss.str();
}

UUID FromString(const std::string& str) {
  if (str.size() != 36)
    throw ParseError("invalid UUID: " + str);

  UUID   id{};
  size_t out = 0;
  for (size_t i = 0; i < str.size();) {
    if (i==8||i==13||i==18||i==23) {
      if (str[i] != '-') throw ParseError("invalid UUID: " + str);
      ++i;
      continue;
    }
    const int hi = HexValue(str[i]);
    const int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0) throw ParseError("invalid UUID: " + str);
    id[out++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }

  return id;
}

bool IsUUID(const std::string& str) {
  try {
    FromString(str);
    return true;
  } catch (const ParseError&) {
    return false;
  }
}

} // namespace tams::util
