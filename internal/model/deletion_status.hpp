#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tams::model {

enum class DeletionStatus : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kError      = 3,
};

constexpr bool IsTerminal(DeletionStatus status) {
  return status == DeletionStatus::kCompleted || status == DeletionStatus::kError;
}

/*
  pending --> processing --> completed | error
  pending --> error            (cancelled before pickup)
*/
constexpr bool CanTransition(DeletionStatus from, DeletionStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == to) {
    return true;
  }

  switch (from) {
    case DeletionStatus::kPending:
      return to == DeletionStatus::kProcessing || to == DeletionStatus::kError;
    case DeletionStatus::kProcessing:
      return to == DeletionStatus::kCompleted || to == DeletionStatus::kError;
    default:
      return false;
  }
}

constexpr std::string_view ToString(DeletionStatus status) {
  switch (status) {
    case DeletionStatus::kPending:
      return "pending";
    case DeletionStatus::kProcessing:
      return "processing";
    case DeletionStatus::kCompleted:
      return "completed";
    case DeletionStatus::kError:
    default:
      return "error";
  }
}

constexpr std::optional<DeletionStatus> DeletionStatusFromString(std::string_view text) {
  if (text == "pending") return DeletionStatus::kPending;
  if (text == "processing") return DeletionStatus::kProcessing;
  if (text == "completed") return DeletionStatus::kCompleted;
  if (text == "error") return DeletionStatus::kError;
  return std::nullopt;
}

} // namespace tams::model
