#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/gate/command_gate.hpp"
#include "warden/gate/file_gate.hpp"
#include "warden/gate/gate.hpp"

#include <filesystem>
#include <string>

namespace warden::gate {

struct GateRules {
  policy::RuleSet protected_files;
  policy::RuleSet hard_block_commands;
  policy::RuleSet caution_commands;
};

/// Compile the three rule sets. Built-in defaults come first when enabled, so their ids
/// stay stable regardless of what the operator adds.
[[nodiscard]] common::Result<GateRules> build_gate_rules(const config::GateConfig &config);

/// Routes file kinds to the file gate and shell commands to the command gate. Holds only
/// immutable rule sets, so concurrent evaluate() calls are safe.
class GuardrailGate final : public IGate {
public:
  GuardrailGate(GateRules rules, std::filesystem::path project_root);

  [[nodiscard]] GateDecision evaluate(const ToolInvocation &invocation) const override;
  [[nodiscard]] std::string_view name() const override { return "guardrail"; }

  [[nodiscard]] const FileMutationGate &file_gate() const { return file_gate_; }
  [[nodiscard]] const CommandGate &command_gate() const { return command_gate_; }
  [[nodiscard]] const std::filesystem::path &project_root() const { return project_root_; }

private:
  FileMutationGate file_gate_;
  CommandGate command_gate_;
  std::filesystem::path project_root_;
};

/// Installed when the rules cannot be loaded: nothing is allowed through.
class FailClosedGate final : public IGate {
public:
  explicit FailClosedGate(std::string error);

  [[nodiscard]] GateDecision evaluate(const ToolInvocation &invocation) const override;
  [[nodiscard]] std::string_view name() const override { return "fail-closed"; }

private:
  std::string error_;
};

} // namespace warden::gate
