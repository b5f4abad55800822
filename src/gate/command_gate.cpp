#include "warden/gate/command_gate.hpp"

#include "warden/common/fs.hpp"

#include <cctype>

namespace warden::gate {

CommandGate::CommandGate(policy::RuleSet hard_block, policy::RuleSet caution)
    : hard_block_(std::move(hard_block)), caution_(std::move(caution)) {}

std::string CommandGate::normalize(const std::string &command) {
  std::string out;
  out.reserve(command.size());
  bool pending_space = false;
  for (const char ch : command) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

GateDecision CommandGate::evaluate(const std::string &command) const {
  if (command.find('\0') != std::string::npos) {
    return GateDecision::block("command contains a NUL byte", common::ErrorKind::MalformedInput);
  }

  const std::string normalized = normalize(command);
  if (normalized.empty()) {
    return GateDecision::allow();
  }

  const auto blocked = policy::match_all(normalized, hard_block_);
  if (!blocked.empty()) {
    const auto &first = *blocked.front().rule;
    auto decision = GateDecision::block("dangerous pattern '" + first.pattern +
                                            "' in command: " + common::trim(command),
                                        common::ErrorKind::PolicyViolation, first.id);
    for (std::size_t i = 1; i < blocked.size(); ++i) {
      decision.matched_rules.push_back(blocked[i].rule->id);
    }
    return decision;
  }

  auto decision = GateDecision::allow();
  for (const auto &hit : policy::match_all(normalized, caution_)) {
    decision.matched_rules.push_back(hit.rule->id);
    decision.advisories.push_back("caution: '" + hit.rule->pattern +
                                  "' matched in: " + common::trim(command));
  }
  return decision;
}

} // namespace warden::gate
