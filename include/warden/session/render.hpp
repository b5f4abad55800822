#pragma once

#include "warden/common/time.hpp"
#include "warden/repo/inspector.hpp"
#include "warden/session/metrics.hpp"
#include "warden/worklist/store.hpp"

#include <string>
#include <vector>

namespace warden::session {

inline constexpr const char *kSummaryFile = "SESSION_SUMMARY.md";
inline constexpr const char *kTodoSnapshotFile = "TODO_SNAPSHOT.md";
inline constexpr const char *kChangelogFile = "CHANGELOG.md";
inline constexpr const char *kMetricsFile = "METRICS.txt";
inline constexpr const char *kNoCommits = "no commits this session";

struct SessionArtifact {
  std::string name;
  std::string content;
};

struct SessionArtifactSet {
  std::string summary;
  std::string todo_snapshot;
  std::string changelog;
  std::string metrics;

  /// Fixed order: summary, snapshot, changelog, metrics.
  [[nodiscard]] std::vector<SessionArtifact> artifacts() const;
};

/// Everything the documents are rendered from. The worklist is the post-merge state.
struct SessionRecord {
  std::string project_name;
  common::TimePoint window_start{};
  common::TimePoint closed_at{};
  std::string branch;
  bool repository_available = true;
  std::vector<std::string> diagnostics;
  std::vector<repo::UncommittedChange> uncommitted;
  std::vector<ClassifiedCommit> commits;
  SessionMetrics metrics;
  const worklist::WorklistStore *worklist = nullptr;
  // Ids that became Completed, and ids appended, during this close.
  std::vector<std::string> completed_ids;
  std::vector<std::string> added_ids;
};

[[nodiscard]] std::string render_summary(const SessionRecord &record);
[[nodiscard]] std::string render_changelog(const SessionRecord &record);
[[nodiscard]] std::string render_metrics(const SessionMetrics &metrics);
[[nodiscard]] SessionArtifactSet render_artifacts(const SessionRecord &record);

[[nodiscard]] std::string short_hash(const std::string &hash);

} // namespace warden::session
