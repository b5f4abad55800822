#include "warden/policy/rule_set.hpp"

namespace warden::policy {

std::string_view severity_to_string(const Severity severity) {
  switch (severity) {
  case Severity::Block:
    return "block";
  case Severity::Caution:
    return "caution";
  }
  return "block";
}

bool PolicyRule::matches(const std::string &candidate) const {
  if (kind == PatternKind::Regex) {
    return compiled != nullptr && std::regex_search(candidate, *compiled);
  }
  return candidate.find(pattern) != std::string::npos;
}

common::Result<RuleSet> RuleSet::compile(std::string name,
                                         const std::vector<std::string> &patterns,
                                         const Severity severity) {
  RuleSet set;
  set.name_ = std::move(name);
  set.rules_.reserve(patterns.size());

  for (std::size_t i = 0; i < patterns.size(); ++i) {
    const std::string &text = patterns[i];
    const std::string where = set.name_ + "#" + std::to_string(i + 1);
    if (text.empty()) {
      return common::Result<RuleSet>::failure("empty pattern in " + where,
                                              common::ErrorKind::ConfigurationError);
    }

    PolicyRule rule;
    rule.id = where;
    rule.severity = severity;
    rule.pattern = text;

    if (text.rfind(kRegexPrefix, 0) == 0) {
      const std::string expression = text.substr(kRegexPrefix.size());
      if (expression.empty()) {
        return common::Result<RuleSet>::failure("empty regular expression in " + where,
                                                common::ErrorKind::ConfigurationError);
      }
      try {
        rule.compiled = std::make_shared<const std::regex>(expression, std::regex::ECMAScript);
      } catch (const std::regex_error &err) {
        return common::Result<RuleSet>::failure("invalid regular expression in " + where + " (" +
                                                    text + "): " + err.what(),
                                                common::ErrorKind::ConfigurationError);
      }
      rule.kind = PatternKind::Regex;
    }

    set.rules_.push_back(std::move(rule));
  }

  return common::Result<RuleSet>::success(std::move(set));
}

std::optional<MatchResult> matches(const std::string &candidate, const RuleSet &rule_set) {
  for (const auto &rule : rule_set.rules()) {
    if (rule.matches(candidate)) {
      return MatchResult{.rule = &rule, .severity = rule.severity};
    }
  }
  return std::nullopt;
}

std::vector<MatchResult> match_all(const std::string &candidate, const RuleSet &rule_set) {
  std::vector<MatchResult> out;
  for (const auto &rule : rule_set.rules()) {
    if (rule.matches(candidate)) {
      out.push_back(MatchResult{.rule = &rule, .severity = rule.severity});
    }
  }
  return out;
}

} // namespace warden::policy
