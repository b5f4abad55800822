#pragma once

#include "warden/gate/gate.hpp"
#include "warden/policy/rule_set.hpp"

#include <filesystem>
#include <string>

namespace warden::gate {

inline constexpr const char *kReasonUnresolvablePath = "unresolvable path";
inline constexpr const char *kReasonUnresolvableRoot = "unresolvable project root";
inline constexpr const char *kReasonOutsideProject = "outside project directory";

/// Decides whether a proposed write or edit of a file may proceed.
///
/// Order: normalization, protected-file patterns, then project-root containment. The
/// pattern check runs before containment so a protected file outside the root reports the
/// pattern. Symlinks are resolved before containment is compared.
class FileMutationGate {
public:
  /// `base_dir` resolves relative paths; empty means the process working directory.
  explicit FileMutationGate(policy::RuleSet protected_files, std::filesystem::path base_dir = {});

  [[nodiscard]] GateDecision evaluate(const std::string &path,
                                      const std::string &project_root) const;
  [[nodiscard]] GateDecision evaluate(const std::string &path, const std::string &project_root,
                                      const std::filesystem::path &base_dir) const;

  [[nodiscard]] const policy::RuleSet &rules() const { return protected_files_; }

private:
  policy::RuleSet protected_files_;
  std::filesystem::path base_dir_;
};

} // namespace warden::gate
