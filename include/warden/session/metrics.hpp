#pragma once

#include "warden/repo/inspector.hpp"
#include "warden/session/classifier.hpp"
#include "warden/worklist/store.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace warden::session {

struct ClassifiedCommit {
  repo::CommitRecord record;
  ChangeCategory category = ChangeCategory::Other;
};

/// Hours of remaining work assumed per open item of each priority.
struct EffortRates {
  double critical_hours = 4.0;
  double high_hours = 3.0;
  double medium_hours = 2.0;
  double low_hours = 1.0;

  [[nodiscard]] double hours_for(worklist::Priority priority) const;
};

struct EffortEstimate {
  double critical_hours = 0.0;
  double high_hours = 0.0;
  double medium_hours = 0.0;
  double low_hours = 0.0;

  [[nodiscard]] double total_hours() const {
    return critical_hours + high_hours + medium_hours + low_hours;
  }
};

struct FileTotals {
  std::string path;
  std::uint64_t added = 0;
  std::uint64_t removed = 0;
};

struct SessionMetrics {
  std::size_t commits = 0;
  std::array<std::size_t, kCategories.size()> per_category{};
  // First-seen order across the window.
  std::vector<FileTotals> files;
  std::uint64_t lines_added = 0;
  std::uint64_t lines_removed = 0;
  std::size_t uncommitted_changes = 0;
  worklist::WorklistCounts tasks;
  EffortEstimate effort_remaining;
  std::chrono::seconds duration{0};

  [[nodiscard]] std::size_t files_changed() const { return files.size(); }
  [[nodiscard]] std::size_t count_for(ChangeCategory category) const;
};

[[nodiscard]] std::vector<ClassifiedCommit> classify_commits(std::vector<repo::CommitRecord> commits);

[[nodiscard]] SessionMetrics compute_metrics(const std::vector<ClassifiedCommit> &commits,
                                             std::size_t uncommitted_changes,
                                             const worklist::WorklistStore &worklist,
                                             const EffortRates &rates,
                                             std::chrono::seconds duration);

} // namespace warden::session
