#include "warden/gate/guardrail.hpp"

#include <vector>

namespace warden::gate {

namespace {

std::vector<std::string> with_defaults(const std::vector<std::string> &defaults,
                                       const std::vector<std::string> &configured,
                                       const bool use_defaults) {
  std::vector<std::string> out;
  if (use_defaults) {
    out = defaults;
  }
  out.insert(out.end(), configured.begin(), configured.end());
  return out;
}

} // namespace

common::Result<GateRules> build_gate_rules(const config::GateConfig &config) {
  auto protected_files = policy::RuleSet::compile(
      policy::kProtectedFilesRuleSet,
      with_defaults(policy::default_protected_file_patterns(), config.protected_files,
                    config.use_default_rules),
      policy::Severity::Block);
  if (!protected_files.ok()) {
    return common::Result<GateRules>::failure(protected_files.status());
  }

  auto hard_block = policy::RuleSet::compile(
      policy::kDangerousCommandsRuleSet,
      with_defaults(policy::default_dangerous_command_patterns(), config.hard_block_commands,
                    config.use_default_rules),
      policy::Severity::Block);
  if (!hard_block.ok()) {
    return common::Result<GateRules>::failure(hard_block.status());
  }

  auto caution = policy::RuleSet::compile(
      policy::kCautionCommandsRuleSet,
      with_defaults(policy::default_caution_command_patterns(), config.caution_commands,
                    config.use_default_rules),
      policy::Severity::Caution);
  if (!caution.ok()) {
    return common::Result<GateRules>::failure(caution.status());
  }

  return common::Result<GateRules>::success(GateRules{
      .protected_files = std::move(protected_files.value()),
      .hard_block_commands = std::move(hard_block.value()),
      .caution_commands = std::move(caution.value()),
  });
}

GuardrailGate::GuardrailGate(GateRules rules, std::filesystem::path project_root)
    : file_gate_(std::move(rules.protected_files), project_root),
      command_gate_(std::move(rules.hard_block_commands), std::move(rules.caution_commands)),
      project_root_(std::move(project_root)) {}

GateDecision GuardrailGate::evaluate(const ToolInvocation &invocation) const {
  switch (invocation.kind) {
  case OperationKind::FileWrite:
  case OperationKind::FileEdit: {
    const std::filesystem::path base =
        invocation.working_dir.empty() ? project_root_ : invocation.working_dir;
    return file_gate_.evaluate(invocation.target, project_root_.string(), base);
  }
  case OperationKind::ShellCommand:
    return command_gate_.evaluate(invocation.target);
  }
  return GateDecision::block("unknown operation kind", common::ErrorKind::MalformedInput);
}

FailClosedGate::FailClosedGate(std::string error) : error_(std::move(error)) {}

GateDecision FailClosedGate::evaluate(const ToolInvocation &invocation) const {
  (void)invocation;
  return GateDecision::block("guardrail configuration error: " + error_,
                             common::ErrorKind::ConfigurationError);
}

} // namespace warden::gate
