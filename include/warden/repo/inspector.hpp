#pragma once

#include "warden/common/time.hpp"
#include "warden/repo/process.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace warden::repo {

inline constexpr const char *kDetachedBranch = "(detached)";
inline constexpr const char *kUnknownBranch = "(unknown)";

enum class ChangeKind { Added, Modified, Deleted, Renamed, Copied, Untracked, Conflicted, Other };

[[nodiscard]] std::string_view change_kind_to_string(ChangeKind kind);

struct UncommittedChange {
  std::string path;
  ChangeKind kind = ChangeKind::Other;
};

struct FileChange {
  std::string path;
  std::uint64_t added = 0;
  std::uint64_t removed = 0;
  bool binary = false;
};

struct CommitRecord {
  std::string hash;
  std::string author;
  std::string message;
  common::TimePoint authored_at{};
  std::vector<FileChange> files_changed;
};

struct InspectorOptions {
  std::string git_binary = "git";
  std::chrono::milliseconds timeout{10'000};
  // Relative to the repository path. Kept out of uncommitted_changes(); a directory
  // excludes everything beneath it.
  std::vector<std::filesystem::path> ignored_paths;
};

/// Read-only view of a git working tree. No query throws or fails: a missing repository,
/// a failing git, or a timeout yields the empty result (or a branch sentinel) and a note in
/// diagnostics().
class RepositoryInspector {
public:
  RepositoryInspector(std::filesystem::path repo_path, IProcessRunner &runner,
                      InspectorOptions options = {});

  [[nodiscard]] bool is_available();
  [[nodiscard]] std::string current_branch();
  [[nodiscard]] std::vector<UncommittedChange> uncommitted_changes();
  /// Oldest first.
  [[nodiscard]] std::vector<CommitRecord> commits_since(common::TimePoint since);
  [[nodiscard]] std::vector<FileChange> diff_stats(const std::string &hash);

  [[nodiscard]] const std::vector<std::string> &diagnostics() const { return diagnostics_; }
  [[nodiscard]] bool degraded() const { return !diagnostics_.empty(); }
  [[nodiscard]] const std::filesystem::path &path() const { return repo_path_; }

private:
  [[nodiscard]] common::Result<ProcessResult> git(const std::vector<std::string> &args,
                                                  bool allow_failure = false);
  void note(const std::string &operation, const std::string &message);

  std::filesystem::path repo_path_;
  IProcessRunner &runner_;
  InspectorOptions options_;
  std::vector<std::string> diagnostics_;
};

/// Parse one `--numstat` line. Renamed paths (`a => b`, `dir/{a => b}/f`) report the new path.
[[nodiscard]] bool parse_numstat_line(const std::string &line, FileChange &out);

/// Parse `git status --porcelain -z` output.
[[nodiscard]] std::vector<UncommittedChange> parse_porcelain(const std::string &output);

[[nodiscard]] bool is_commit_hash(const std::string &value);

} // namespace warden::repo
