#include "warden/session/metrics.hpp"

#include <unordered_map>

namespace warden::session {

double EffortRates::hours_for(const worklist::Priority priority) const {
  switch (priority) {
  case worklist::Priority::Critical:
    return critical_hours;
  case worklist::Priority::High:
    return high_hours;
  case worklist::Priority::Medium:
    return medium_hours;
  case worklist::Priority::Low:
    return low_hours;
  }
  return medium_hours;
}

std::size_t SessionMetrics::count_for(const ChangeCategory category) const {
  return per_category[static_cast<std::size_t>(category)];
}

std::vector<ClassifiedCommit> classify_commits(std::vector<repo::CommitRecord> commits) {
  std::vector<ClassifiedCommit> out;
  out.reserve(commits.size());
  for (auto &commit : commits) {
    const ChangeCategory category = classify_commit(commit.message);
    out.push_back(ClassifiedCommit{.record = std::move(commit), .category = category});
  }
  return out;
}

SessionMetrics compute_metrics(const std::vector<ClassifiedCommit> &commits,
                               const std::size_t uncommitted_changes,
                               const worklist::WorklistStore &worklist, const EffortRates &rates,
                               const std::chrono::seconds duration) {
  SessionMetrics metrics;
  metrics.commits = commits.size();
  metrics.uncommitted_changes = uncommitted_changes;
  metrics.duration = duration < std::chrono::seconds::zero() ? std::chrono::seconds::zero()
                                                             : duration;

  std::unordered_map<std::string, std::size_t> file_index;
  for (const auto &commit : commits) {
    ++metrics.per_category[static_cast<std::size_t>(commit.category)];
    for (const auto &change : commit.record.files_changed) {
      auto [it, inserted] = file_index.emplace(change.path, metrics.files.size());
      if (inserted) {
        metrics.files.push_back(FileTotals{.path = change.path});
      }
      auto &totals = metrics.files[it->second];
      totals.added += change.added;
      totals.removed += change.removed;
      metrics.lines_added += change.added;
      metrics.lines_removed += change.removed;
    }
  }

  metrics.tasks = worklist.counts();
  for (const auto &item : worklist.items()) {
    if (!item.is_open()) {
      continue;
    }
    const double hours = rates.hours_for(item.priority);
    switch (item.priority) {
    case worklist::Priority::Critical:
      metrics.effort_remaining.critical_hours += hours;
      break;
    case worklist::Priority::High:
      metrics.effort_remaining.high_hours += hours;
      break;
    case worklist::Priority::Medium:
      metrics.effort_remaining.medium_hours += hours;
      break;
    case worklist::Priority::Low:
      metrics.effort_remaining.low_hours += hours;
      break;
    }
  }
  return metrics;
}

} // namespace warden::session
