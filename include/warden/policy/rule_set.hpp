#pragma once

#include "warden/common/result.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::policy {

enum class Severity { Block, Caution };
enum class PatternKind { Substring, Regex };

[[nodiscard]] std::string_view severity_to_string(Severity severity);

/// Prefix that marks a pattern string as a regular expression.
inline constexpr std::string_view kRegexPrefix = "re:";

struct PolicyRule {
  std::string id;
  std::string pattern;
  PatternKind kind = PatternKind::Substring;
  Severity severity = Severity::Block;
  // Shared so copies of a compiled RuleSet reuse one compiled expression.
  std::shared_ptr<const std::regex> compiled;

  [[nodiscard]] bool matches(const std::string &candidate) const;
};

struct MatchResult {
  const PolicyRule *rule = nullptr;
  Severity severity = Severity::Block;
};

class RuleSet {
public:
  RuleSet() = default;

  /// Compiles every pattern once. A malformed regex or an empty pattern fails the whole set.
  [[nodiscard]] static common::Result<RuleSet>
  compile(std::string name, const std::vector<std::string> &patterns, Severity severity);

  [[nodiscard]] const std::string &name() const { return name_; }
  [[nodiscard]] const std::vector<PolicyRule> &rules() const { return rules_; }
  [[nodiscard]] bool empty() const { return rules_.empty(); }
  [[nodiscard]] std::size_t size() const { return rules_.size(); }

private:
  std::string name_;
  std::vector<PolicyRule> rules_;
};

/// First rule in declaration order whose pattern matches, if any.
[[nodiscard]] std::optional<MatchResult> matches(const std::string &candidate,
                                                 const RuleSet &rule_set);

/// Every matching rule in declaration order.
[[nodiscard]] std::vector<MatchResult> match_all(const std::string &candidate,
                                                 const RuleSet &rule_set);

inline constexpr const char *kProtectedFilesRuleSet = "protected-files";
inline constexpr const char *kDangerousCommandsRuleSet = "dangerous-commands";
inline constexpr const char *kCautionCommandsRuleSet = "caution-commands";

[[nodiscard]] const std::vector<std::string> &default_protected_file_patterns();
[[nodiscard]] const std::vector<std::string> &default_dangerous_command_patterns();
[[nodiscard]] const std::vector<std::string> &default_caution_command_patterns();

} // namespace warden::policy
