#include "warden/session/classifier.hpp"

#include "warden/common/fs.hpp"

#include <cctype>
#include <optional>
#include <unordered_set>
#include <vector>

namespace warden::session {

namespace {

std::optional<ChangeCategory> category_for_type(const std::string &type) {
  if (type == "security" || type == "sec") {
    return ChangeCategory::Security;
  }
  if (type == "fix" || type == "bugfix" || type == "hotfix" || type == "bug") {
    return ChangeCategory::Fix;
  }
  if (type == "feat" || type == "feature") {
    return ChangeCategory::Feature;
  }
  if (type == "docs" || type == "doc") {
    return ChangeCategory::Docs;
  }
  if (type == "refactor") {
    return ChangeCategory::Refactor;
  }
  return std::nullopt;
}

// The leading type word when the subject uses one of the recognised prefix shapes.
std::optional<std::string> leading_type(const std::string &lowered) {
  if (lowered.empty()) {
    return std::nullopt;
  }
  if (lowered.front() == '[') {
    const auto close = lowered.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    return common::trim(lowered.substr(1, close - 1));
  }

  std::size_t end = 0;
  while (end < lowered.size() && std::isalpha(static_cast<unsigned char>(lowered[end])) != 0) {
    ++end;
  }
  if (end == 0) {
    return std::nullopt;
  }
  const std::string word = lowered.substr(0, end);

  std::size_t pos = end;
  if (pos < lowered.size() && lowered[pos] == '(') {
    const auto close = lowered.find(')', pos);
    if (close == std::string::npos) {
      return std::nullopt;
    }
    pos = close + 1;
  }
  if (pos < lowered.size() && lowered[pos] == '!') {
    ++pos;
  }
  if (pos < lowered.size() && lowered[pos] == ':') {
    return word;
  }

  // `DOCS - text`
  while (pos < lowered.size() && lowered[pos] == ' ') {
    ++pos;
  }
  if (pos > end && pos < lowered.size() && lowered[pos] == '-') {
    return word;
  }
  return std::nullopt;
}

std::vector<std::string> words(const std::string &lowered) {
  std::vector<std::string> out;
  std::string current;
  for (const char ch : lowered) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0) {
      current.push_back(ch);
      continue;
    }
    if (!current.empty()) {
      out.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

const std::unordered_set<std::string> &keywords(const ChangeCategory category) {
  static const std::unordered_set<std::string> security = {
      "security", "vulnerability", "vulnerabilities", "vuln", "cve", "xss", "csrf",
      "injection", "exploit", "sanitize", "sanitise", "secret", "secrets"};
  static const std::unordered_set<std::string> fix = {
      "fix", "fixes", "fixed", "bug", "bugs", "bugfix", "hotfix", "patch",
      "repair", "resolve", "resolves", "crash", "regression"};
  static const std::unordered_set<std::string> feature = {
      "feat", "feature", "features", "add", "adds", "added", "implement",
      "implements", "implemented", "introduce", "introduces", "support", "new"};
  static const std::unordered_set<std::string> docs = {
      "doc", "docs", "documentation", "document", "readme", "changelog", "typo", "typos"};
  static const std::unordered_set<std::string> refactor = {
      "refactor", "refactors", "refactored", "refactoring", "restructure", "cleanup",
      "simplify", "simplifies", "rename", "renames", "reorganize", "extract", "tidy"};
  static const std::unordered_set<std::string> none;

  switch (category) {
  case ChangeCategory::Security:
    return security;
  case ChangeCategory::Fix:
    return fix;
  case ChangeCategory::Feature:
    return feature;
  case ChangeCategory::Docs:
    return docs;
  case ChangeCategory::Refactor:
    return refactor;
  case ChangeCategory::Other:
    return none;
  }
  return none;
}

} // namespace

std::string_view category_to_string(const ChangeCategory category) {
  switch (category) {
  case ChangeCategory::Security:
    return "SECURITY";
  case ChangeCategory::Fix:
    return "FIX";
  case ChangeCategory::Feature:
    return "FEATURE";
  case ChangeCategory::Docs:
    return "DOCS";
  case ChangeCategory::Refactor:
    return "REFACTOR";
  case ChangeCategory::Other:
    return "OTHER";
  }
  return "OTHER";
}

ChangeCategory classify_commit(const std::string &message) {
  const std::string lowered = common::to_lower(common::trim(message));
  if (const auto type = leading_type(lowered); type.has_value()) {
    if (const auto category = category_for_type(*type); category.has_value()) {
      return *category;
    }
  }

  const auto tokens = words(lowered);
  for (const ChangeCategory category : kCategories) {
    const auto &set = keywords(category);
    for (const auto &token : tokens) {
      if (set.contains(token)) {
        return category;
      }
    }
  }
  return ChangeCategory::Other;
}

} // namespace warden::session
