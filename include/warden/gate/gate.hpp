#pragma once

#include "warden/common/result.hpp"
#include "warden/common/time.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::gate {

enum class OperationKind { FileWrite, FileEdit, ShellCommand };

[[nodiscard]] std::string_view operation_kind_to_string(OperationKind kind);
[[nodiscard]] common::Result<OperationKind> operation_kind_from_string(const std::string &value);

struct ToolInvocation {
  OperationKind kind = OperationKind::ShellCommand;
  std::string target;
  common::TimePoint requested_at{};
  // Directory relative targets are resolved against; empty means the process cwd.
  std::filesystem::path working_dir;
};

struct GateDecision {
  bool allowed = true;
  std::optional<std::string> reason;
  std::optional<std::string> matched_rule;
  // Every rule id that matched, first match first.
  std::vector<std::string> matched_rules;
  std::vector<std::string> advisories;
  common::ErrorKind error_kind = common::ErrorKind::None;

  [[nodiscard]] static GateDecision allow();
  [[nodiscard]] static GateDecision block(std::string reason, common::ErrorKind kind,
                                          std::optional<std::string> rule = std::nullopt);

  /// One-line text for the host to show the operator.
  [[nodiscard]] std::string message() const;
};

/// The synchronous capability a host runtime calls before performing an operation.
/// Implementations never throw; every outcome is a decision.
class IGate {
public:
  virtual ~IGate() = default;

  [[nodiscard]] virtual GateDecision evaluate(const ToolInvocation &invocation) const = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace warden::gate
