#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tams::model {

enum class Format : std::uint8_t {
  kVideo = 0,
  kImage = 1,
  kAudio = 2,
  kData  = 3,
  kMulti = 4,
};

constexpr std::string_view ToUrn(Format format) {
  switch (format) {
    case Format::kVideo:
      return "urn:x-nmos:format:video";
    case Format::kImage:
      return "urn:x-tam:format:image";
    case Format::kAudio:
      return "urn:x-nmos:format:audio";
    case Format::kData:
      return "urn:x-nmos:format:data";
    case Format::kMulti:
    default:
      return "urn:x-nmos:format:multi";
  }
}

constexpr std::optional<Format> FormatFromUrn(std::string_view urn) {
  if (urn == "urn:x-nmos:format:video") return Format::kVideo;
  if (urn == "urn:x-tam:format:image") return Format::kImage;
  if (urn == "urn:x-nmos:format:audio") return Format::kAudio;
  if (urn == "urn:x-nmos:format:data") return Format::kData;
  if (urn == "urn:x-nmos:format:multi") return Format::kMulti;
  return std::nullopt;
}

} // namespace tams::model
