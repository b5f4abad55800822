#include "warden/gate/file_gate.hpp"

#include "warden/common/fs.hpp"

#include <optional>

namespace warden::gate {

namespace {

std::optional<std::filesystem::path> absolute_lexical(const std::string &raw,
                                                      const std::filesystem::path &base) {
  std::filesystem::path expanded(common::expand_path(raw));
  if (expanded.empty()) {
    return std::nullopt;
  }
  if (expanded.is_relative()) {
    if (base.empty()) {
      return std::nullopt;
    }
    expanded = base / expanded;
  }
  return expanded.lexically_normal();
}

std::optional<std::filesystem::path> resolve(const std::filesystem::path &path) {
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(path, ec);
  if (ec || resolved.empty()) {
    return std::nullopt;
  }
  return resolved;
}

} // namespace

FileMutationGate::FileMutationGate(policy::RuleSet protected_files, std::filesystem::path base_dir)
    : protected_files_(std::move(protected_files)), base_dir_(std::move(base_dir)) {}

GateDecision FileMutationGate::evaluate(const std::string &path,
                                        const std::string &project_root) const {
  return evaluate(path, project_root, base_dir_);
}

GateDecision FileMutationGate::evaluate(const std::string &path, const std::string &project_root,
                                        const std::filesystem::path &base_dir) const {
  if (common::trim(path).empty() || path.find('\0') != std::string::npos) {
    return GateDecision::block(kReasonUnresolvablePath, common::ErrorKind::MalformedInput);
  }

  std::filesystem::path base = base_dir;
  if (base.empty()) {
    std::error_code ec;
    base = std::filesystem::current_path(ec);
    if (ec) {
      base.clear();
    }
  }

  const auto lexical = absolute_lexical(path, base);
  if (!lexical.has_value()) {
    return GateDecision::block(kReasonUnresolvablePath, common::ErrorKind::MalformedInput);
  }
  const auto resolved = resolve(*lexical);
  if (!resolved.has_value()) {
    return GateDecision::block(kReasonUnresolvablePath, common::ErrorKind::MalformedInput);
  }

  // Both spellings are checked so a symlink cannot hide a protected target.
  for (const auto *candidate : {&*lexical, &*resolved}) {
    const auto hits = policy::match_all(candidate->string(), protected_files_);
    if (!hits.empty()) {
      auto decision = GateDecision::block(hits.front().rule->pattern,
                                          common::ErrorKind::PolicyViolation,
                                          hits.front().rule->id);
      for (std::size_t i = 1; i < hits.size(); ++i) {
        decision.matched_rules.push_back(hits[i].rule->id);
      }
      return decision;
    }
  }

  if (common::trim(project_root).empty() || project_root.find('\0') != std::string::npos) {
    return GateDecision::block(kReasonUnresolvableRoot, common::ErrorKind::MalformedInput);
  }
  const auto root_lexical = absolute_lexical(project_root, base);
  const auto root = root_lexical.has_value() ? resolve(*root_lexical) : std::nullopt;
  if (!root.has_value()) {
    return GateDecision::block(kReasonUnresolvableRoot, common::ErrorKind::MalformedInput);
  }

  if (!common::is_subpath(*resolved, *root)) {
    return GateDecision::block(kReasonOutsideProject, common::ErrorKind::PolicyViolation);
  }

  return GateDecision::allow();
}

} // namespace warden::gate
