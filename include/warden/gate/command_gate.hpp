#pragma once

#include "warden/gate/gate.hpp"
#include "warden/policy/rule_set.hpp"

#include <string>

namespace warden::gate {

/// Two-tier shell command policy. The hard-block tier is evaluated in full first and a
/// match short-circuits; otherwise every caution match adds an advisory to an allow.
class CommandGate {
public:
  CommandGate(policy::RuleSet hard_block, policy::RuleSet caution);

  [[nodiscard]] GateDecision evaluate(const std::string &command) const;

  [[nodiscard]] const policy::RuleSet &hard_block_rules() const { return hard_block_; }
  [[nodiscard]] const policy::RuleSet &caution_rules() const { return caution_; }

  /// Whitespace runs collapsed to one space, ends trimmed.
  [[nodiscard]] static std::string normalize(const std::string &command);

private:
  policy::RuleSet hard_block_;
  policy::RuleSet caution_;
};

} // namespace warden::gate
