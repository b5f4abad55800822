#include "warden/gate/gate.hpp"

#include "warden/common/fs.hpp"

namespace warden::gate {

std::string_view operation_kind_to_string(const OperationKind kind) {
  switch (kind) {
  case OperationKind::FileWrite:
    return "FileWrite";
  case OperationKind::FileEdit:
    return "FileEdit";
  case OperationKind::ShellCommand:
    return "ShellCommand";
  }
  return "ShellCommand";
}

common::Result<OperationKind> operation_kind_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "filewrite" || normalized == "file_write" || normalized == "write") {
    return common::Result<OperationKind>::success(OperationKind::FileWrite);
  }
  if (normalized == "fileedit" || normalized == "file_edit" || normalized == "edit") {
    return common::Result<OperationKind>::success(OperationKind::FileEdit);
  }
  if (normalized == "shellcommand" || normalized == "shell_command" || normalized == "shell" ||
      normalized == "command") {
    return common::Result<OperationKind>::success(OperationKind::ShellCommand);
  }
  return common::Result<OperationKind>::failure("unknown operation kind: " + value,
                                                common::ErrorKind::MalformedInput);
}

GateDecision GateDecision::allow() { return GateDecision{}; }

GateDecision GateDecision::block(std::string reason, const common::ErrorKind kind,
                                 std::optional<std::string> rule) {
  GateDecision decision;
  decision.allowed = false;
  decision.reason = std::move(reason);
  decision.error_kind = kind;
  if (rule.has_value()) {
    decision.matched_rules.push_back(*rule);
  }
  decision.matched_rule = std::move(rule);
  return decision;
}

std::string GateDecision::message() const {
  if (allowed) {
    if (advisories.empty()) {
      return "allowed";
    }
    std::string out = "allowed with " + std::to_string(advisories.size()) + " advisory";
    out += advisories.size() == 1 ? "" : "s";
    for (const auto &advisory : advisories) {
      out += "; " + advisory;
    }
    return out;
  }

  std::string out = "blocked";
  if (matched_rule.has_value()) {
    out += " by " + *matched_rule;
  } else if (error_kind != common::ErrorKind::None &&
             error_kind != common::ErrorKind::PolicyViolation) {
    out += " (" + std::string(common::error_kind_name(error_kind)) + ")";
  }
  if (reason.has_value()) {
    out += ": " + *reason;
  }
  return out;
}

} // namespace warden::gate
