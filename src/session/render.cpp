#include "warden/session/render.hpp"

#include "warden/common/fs.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace warden::session {

namespace {

constexpr std::size_t kMaxRecommendedItems = 5;

std::string fixed(const double value, const int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string plural(const std::size_t count, const std::string &noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

std::string line_delta(const std::uint64_t added, const std::uint64_t removed) {
  return "(+" + std::to_string(added) + "/-" + std::to_string(removed) + ")";
}

const worklist::WorkItem *lookup(const SessionRecord &record, const std::string &id) {
  return record.worklist == nullptr ? nullptr : record.worklist->find(id);
}

void write_session_section(std::ostringstream &out, const SessionRecord &record) {
  out << "## Session\n\n";
  out << "- Date: " << common::date_key(record.closed_at) << "\n";
  out << "- Window start: " << common::format_rfc3339(record.window_start) << "\n";
  out << "- Closed at: " << common::format_rfc3339(record.closed_at) << "\n";
  out << "- Duration: " << common::format_duration(record.metrics.duration) << "\n";
  out << "- Branch: " << record.branch << "\n";
}

void write_repository_section(std::ostringstream &out, const SessionRecord &record) {
  out << "\n## Repository\n\n";
  out << "- Repository data: " << (record.repository_available ? "available" : "unavailable")
      << "\n";
  out << "- Uncommitted changes: " << record.uncommitted.size() << "\n";
  for (const auto &change : record.uncommitted) {
    out << "  - " << repo::change_kind_to_string(change.kind) << " " << change.path << "\n";
  }
  for (const auto &note : record.diagnostics) {
    out << "- Note: " << note << "\n";
  }
  if (!record.uncommitted.empty()) {
    out << "\nWARNING: " << plural(record.uncommitted.size(), "uncommitted change")
        << " not captured in any commit\n";
  }
}

void write_tasks_section(std::ostringstream &out, const SessionRecord &record) {
  out << "\n## Completed Tasks\n\n";
  if (record.completed_ids.empty()) {
    out << "- none\n";
  }
  for (const auto &id : record.completed_ids) {
    if (const auto *item = lookup(record, id); item != nullptr) {
      out << "- " << item->id << " " << item->description << "\n";
    }
  }

  out << "\n## In Progress\n\n";
  bool any = false;
  if (record.worklist != nullptr) {
    for (const auto &item : record.worklist->items()) {
      if (item.status == worklist::ItemStatus::InProgress) {
        out << "- " << item.id << " " << item.description << " ["
            << worklist::priority_to_string(item.priority) << "]\n";
        any = true;
      }
    }
  }
  if (!any) {
    out << "- none\n";
  }
}

void write_files_section(std::ostringstream &out, const SessionMetrics &metrics) {
  out << "\n## Files Changed\n\n";
  if (metrics.files.empty()) {
    out << "- none\n";
    return;
  }
  for (const auto &file : metrics.files) {
    out << "- " << file.path << " " << line_delta(file.added, file.removed) << "\n";
  }
  out << "\nTotal: " << plural(metrics.files_changed(), "file") << ", "
      << line_delta(metrics.lines_added, metrics.lines_removed) << "\n";
}

void write_commits_section(std::ostringstream &out, const SessionRecord &record) {
  out << "\n## Commits\n\n";
  if (record.commits.empty()) {
    out << kNoCommits << "\n";
    return;
  }
  for (const auto &commit : record.commits) {
    out << "- " << short_hash(commit.record.hash) << " [" << category_to_string(commit.category)
        << "] " << commit.record.message;
    if (!commit.record.author.empty()) {
      out << " (" << commit.record.author << ")";
    }
    out << "\n";
  }
}

void write_accomplishments(std::ostringstream &out, const SessionRecord &record) {
  out << "\n## Key Accomplishments\n\n";
  std::vector<std::string> lines;
  for (const auto &id : record.completed_ids) {
    if (const auto *item = lookup(record, id); item != nullptr) {
      lines.push_back("Completed " + item->id + ": " + item->description);
    }
  }
  for (const ChangeCategory category :
       {ChangeCategory::Security, ChangeCategory::Feature, ChangeCategory::Fix}) {
    for (const auto &commit : record.commits) {
      if (commit.category == category) {
        lines.push_back(std::string(category_to_string(category)) + ": " +
                        commit.record.message);
      }
    }
  }
  if (record.metrics.commits > 0) {
    std::string breakdown;
    for (const ChangeCategory category : kCategories) {
      const std::size_t count = record.metrics.count_for(category);
      if (count == 0) {
        continue;
      }
      if (!breakdown.empty()) {
        breakdown += ", ";
      }
      breakdown += std::to_string(count) + " " + std::string(category_to_string(category));
    }
    lines.push_back(plural(record.metrics.commits, "commit") + " (" + breakdown + ") touching " +
                    plural(record.metrics.files_changed(), "file"));
  }

  if (lines.empty()) {
    out << "- No commits or task completions recorded this session\n";
    return;
  }
  for (const auto &line : lines) {
    out << "- " << line << "\n";
  }
}

void write_recommendations(std::ostringstream &out, const SessionRecord &record) {
  out << "\n## Next Session Recommendations\n\n";
  std::vector<std::string> lines;

  if (!record.repository_available) {
    lines.push_back("Restore repository access; this record has no git data" +
                    (record.diagnostics.empty() ? std::string()
                                                : " (" + record.diagnostics.front() + ")"));
  }
  if (!record.uncommitted.empty()) {
    lines.push_back("Commit or stash " + plural(record.uncommitted.size(), "uncommitted change"));
  }

  if (record.worklist != nullptr) {
    for (const auto &item : record.worklist->items()) {
      if (item.status == worklist::ItemStatus::InProgress) {
        lines.push_back("Resume " + item.id + ": " + item.description);
      }
    }
    std::size_t suggested = 0;
    for (const worklist::Priority priority : worklist::kPriorities) {
      for (const auto *item : record.worklist->items_by_priority(priority)) {
        if (suggested >= kMaxRecommendedItems) {
          break;
        }
        if (item->status == worklist::ItemStatus::Pending) {
          lines.push_back("Start " + item->id + " [" +
                          std::string(worklist::priority_to_string(priority)) +
                          "]: " + item->description);
          ++suggested;
        }
      }
    }
  }

  const double remaining = record.metrics.effort_remaining.total_hours();
  if (remaining > 0.0) {
    lines.push_back("Estimated remaining effort: " + fixed(remaining, 1) + "h across " +
                    plural(record.metrics.tasks.pending + record.metrics.tasks.in_progress,
                           "open item"));
  }

  if (lines.empty()) {
    out << "- No open work items\n";
    return;
  }
  for (const auto &line : lines) {
    out << "- " << line << "\n";
  }
}

} // namespace

std::vector<SessionArtifact> SessionArtifactSet::artifacts() const {
  return {
      SessionArtifact{.name = kSummaryFile, .content = summary},
      SessionArtifact{.name = kTodoSnapshotFile, .content = todo_snapshot},
      SessionArtifact{.name = kChangelogFile, .content = changelog},
      SessionArtifact{.name = kMetricsFile, .content = metrics},
  };
}

std::string short_hash(const std::string &hash) {
  return hash.substr(0, std::min<std::size_t>(7, hash.size()));
}

std::string render_summary(const SessionRecord &record) {
  std::ostringstream out;
  out << "# Session Summary";
  if (!record.project_name.empty()) {
    out << ": " << record.project_name;
  }
  out << "\n\n";
  write_session_section(out, record);
  write_repository_section(out, record);
  write_tasks_section(out, record);
  write_files_section(out, record.metrics);
  write_commits_section(out, record);
  write_accomplishments(out, record);
  write_recommendations(out, record);
  return out.str();
}

std::string render_changelog(const SessionRecord &record) {
  std::ostringstream out;
  out << "# Changelog";
  if (!record.project_name.empty()) {
    out << ": " << record.project_name;
  }
  out << "\n\n";
  out << "Window: " << common::format_rfc3339(record.window_start) << " to "
      << common::format_rfc3339(record.closed_at) << "\n";

  if (record.commits.empty()) {
    out << "\n" << kNoCommits << "\n";
    return out.str();
  }

  for (const ChangeCategory category : kCategories) {
    if (record.metrics.count_for(category) == 0) {
      continue;
    }
    out << "\n## " << category_to_string(category) << "\n\n";
    for (const auto &commit : record.commits) {
      if (commit.category != category) {
        continue;
      }
      out << "- " << short_hash(commit.record.hash) << " " << commit.record.message << "\n";
      for (const auto &file : commit.record.files_changed) {
        out << "  - " << file.path << " " << line_delta(file.added, file.removed) << "\n";
      }
    }
  }
  return out.str();
}

std::string render_metrics(const SessionMetrics &metrics) {
  std::ostringstream out;
  out << "commits: " << metrics.commits << "\n";
  out << "files_changed: " << metrics.files_changed() << "\n";
  out << "lines_added: " << metrics.lines_added << "\n";
  out << "lines_removed: " << metrics.lines_removed << "\n";
  out << "uncommitted_changes: " << metrics.uncommitted_changes << "\n";
  for (const ChangeCategory category : kCategories) {
    out << "commits." << common::to_lower(std::string(category_to_string(category))) << ": "
        << metrics.count_for(category) << "\n";
  }
  out << "tasks.total: " << metrics.tasks.total << "\n";
  out << "tasks.completed: " << metrics.tasks.completed << "\n";
  out << "tasks.in_progress: " << metrics.tasks.in_progress << "\n";
  out << "tasks.pending: " << metrics.tasks.pending << "\n";
  out << "tasks.completion_rate: " << fixed(metrics.tasks.completion_rate(), 2) << "\n";
  out << "effort.critical_hours: " << fixed(metrics.effort_remaining.critical_hours, 1) << "\n";
  out << "effort.high_hours: " << fixed(metrics.effort_remaining.high_hours, 1) << "\n";
  out << "effort.medium_hours: " << fixed(metrics.effort_remaining.medium_hours, 1) << "\n";
  out << "effort.low_hours: " << fixed(metrics.effort_remaining.low_hours, 1) << "\n";
  out << "effort.total_hours: " << fixed(metrics.effort_remaining.total_hours(), 1) << "\n";
  out << "duration_minutes: " << metrics.duration.count() / 60 << "\n";
  return out.str();
}

SessionArtifactSet render_artifacts(const SessionRecord &record) {
  SessionArtifactSet set;
  set.summary = render_summary(record);
  set.todo_snapshot = record.worklist == nullptr ? std::string() : record.worklist->render();
  set.changelog = render_changelog(record);
  set.metrics = render_metrics(record.metrics);
  return set;
}

} // namespace warden::session
