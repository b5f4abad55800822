#pragma once

#include "warden/common/result.hpp"

#include <array>
#include <string>
#include <string_view>

namespace warden::worklist {

enum class Priority { Critical, High, Medium, Low };
enum class ItemStatus { Pending, InProgress, Completed };

inline constexpr std::array<Priority, 4> kPriorities = {Priority::Critical, Priority::High,
                                                        Priority::Medium, Priority::Low};

[[nodiscard]] std::string_view priority_to_string(Priority priority);
/// Case-insensitive; accepts `crit`, `med`, and `p0`..`p3`.
[[nodiscard]] common::Result<Priority> priority_from_string(const std::string &value);

[[nodiscard]] std::string_view status_to_string(ItemStatus status);
/// Checkbox marker used in the worklist file: ` `, `~`, `x`.
[[nodiscard]] char status_marker(ItemStatus status);

struct WorkItem {
  std::string id;
  std::string description;
  Priority priority = Priority::Medium;
  ItemStatus status = ItemStatus::Pending;

  [[nodiscard]] bool is_open() const { return status != ItemStatus::Completed; }
};

/// `WL-001` style identifier.
[[nodiscard]] bool looks_like_item_id(const std::string &value);

} // namespace warden::worklist
