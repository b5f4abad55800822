#include "warden/worklist/work_item.hpp"

#include "warden/common/fs.hpp"

#include <cctype>

namespace warden::worklist {

std::string_view priority_to_string(const Priority priority) {
  switch (priority) {
  case Priority::Critical:
    return "Critical";
  case Priority::High:
    return "High";
  case Priority::Medium:
    return "Medium";
  case Priority::Low:
    return "Low";
  }
  return "Medium";
}

common::Result<Priority> priority_from_string(const std::string &value) {
  std::string normalized = common::to_lower(common::trim(value));
  constexpr std::string_view kSuffix = " priority";
  if (normalized.size() > kSuffix.size() &&
      normalized.compare(normalized.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
    normalized = common::trim(normalized.substr(0, normalized.size() - kSuffix.size()));
  }
  if (normalized == "critical" || normalized == "crit" || normalized == "p0") {
    return common::Result<Priority>::success(Priority::Critical);
  }
  if (normalized == "high" || normalized == "p1") {
    return common::Result<Priority>::success(Priority::High);
  }
  if (normalized == "medium" || normalized == "med" || normalized == "p2") {
    return common::Result<Priority>::success(Priority::Medium);
  }
  if (normalized == "low" || normalized == "p3") {
    return common::Result<Priority>::success(Priority::Low);
  }
  return common::Result<Priority>::failure("unknown priority: " + value,
                                           common::ErrorKind::MalformedInput);
}

std::string_view status_to_string(const ItemStatus status) {
  switch (status) {
  case ItemStatus::Pending:
    return "pending";
  case ItemStatus::InProgress:
    return "in progress";
  case ItemStatus::Completed:
    return "completed";
  }
  return "pending";
}

char status_marker(const ItemStatus status) {
  switch (status) {
  case ItemStatus::Pending:
    return ' ';
  case ItemStatus::InProgress:
    return '~';
  case ItemStatus::Completed:
    return 'x';
  }
  return ' ';
}

bool looks_like_item_id(const std::string &value) {
  const auto dash = value.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 >= value.size()) {
    return false;
  }
  for (std::size_t i = 0; i < dash; ++i) {
    if (std::isalpha(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  for (std::size_t i = dash + 1; i < value.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace warden::worklist
