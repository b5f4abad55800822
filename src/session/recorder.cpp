#include "warden/session/recorder.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"
#include "warden/worklist/notes.hpp"

#include <algorithm>

namespace warden::session {

namespace {

void push_unique(std::vector<std::string> &values, const std::string &value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

// A mentioned task is already tracked when it names an item id or repeats a description.
bool already_tracked(const worklist::WorklistStore &store, const std::string &description) {
  const auto *item = store.find(description);
  if (item == nullptr) {
    return false;
  }
  const std::string lowered = common::to_lower(description);
  return lowered == common::to_lower(item->description) ||
         common::starts_with(lowered, common::to_lower(item->id));
}

void mark_completed(worklist::WorklistStore &store, const std::string &ref,
                    SessionCloseReport &report) {
  const auto *item = store.find(ref);
  if (item == nullptr) {
    push_unique(report.unresolved, ref);
    return;
  }
  if (item->status == worklist::ItemStatus::Completed) {
    return;
  }
  const std::string id = item->id;
  if (store.set_status(id, worklist::ItemStatus::Completed).ok()) {
    push_unique(report.completed_ids, id);
  }
}

// Never demotes a completed item.
void mark_in_progress(worklist::WorklistStore &store, const std::string &ref,
                      SessionCloseReport &report) {
  const auto *item = store.find(ref);
  if (item == nullptr) {
    push_unique(report.unresolved, ref);
    return;
  }
  if (item->status != worklist::ItemStatus::Pending) {
    return;
  }
  const std::string id = item->id;
  if (store.set_status(id, worklist::ItemStatus::InProgress).ok()) {
    push_unique(report.started_ids, id);
  }
}

void merge_worklist(const SessionContext &context, const std::vector<ClassifiedCommit> &commits,
                    worklist::WorklistStore &store, SessionCloseReport &report) {
  const auto findings = worklist::scan_notes(context.notes);

  // New tasks first so a note can add and finish the same task.
  for (const auto &task : findings.new_tasks) {
    if (already_tracked(store, task.description)) {
      continue;
    }
    const auto id = store.add(task.description, task.priority);
    if (id.ok()) {
      report.added_ids.push_back(id.value());
    } else {
      report.diagnostics.push_back("worklist: " + id.error());
    }
  }

  for (const auto &ref : context.completed) {
    mark_completed(store, ref, report);
  }
  for (const auto &ref : findings.completed) {
    mark_completed(store, ref, report);
  }
  for (const auto &commit : commits) {
    for (const auto &ref : worklist::closed_item_refs(commit.record.message)) {
      mark_completed(store, ref, report);
    }
  }

  for (const auto &ref : context.in_progress) {
    mark_in_progress(store, ref, report);
  }
  for (const auto &ref : findings.in_progress) {
    mark_in_progress(store, ref, report);
  }
}

} // namespace

std::vector<std::string> SessionCloseReport::failures() const {
  std::vector<std::string> out;
  for (const auto &artifact : archive.artifacts) {
    if (!artifact.status.ok()) {
      out.push_back(artifact.name + ": " + artifact.status.error());
    }
  }
  if (succeeded() && !archive.manifest.ok()) {
    out.push_back(std::string(kManifestFile) + ": " + archive.manifest.error());
  }
  if (!worklist_saved.ok()) {
    out.push_back("worklist: " + worklist_saved.error());
  }
  return out;
}

SessionRecorder::SessionRecorder(repo::RepositoryInspector &inspector, ArchiveWriter &archive)
    : inspector_(inspector), archive_(archive) {}

SessionCloseReport SessionRecorder::close_session(const SessionContext &context,
                                                  worklist::WorklistStore &worklist) {
  SessionCloseReport report;
  const auto duration =
      std::chrono::duration_cast<std::chrono::seconds>(context.now - context.window_start);

  std::vector<repo::UncommittedChange> uncommitted;
  std::vector<ClassifiedCommit> commits;
  report.repository_available = inspector_.is_available();
  if (report.repository_available) {
    report.branch = inspector_.current_branch();
    uncommitted = inspector_.uncommitted_changes();
    commits = classify_commits(inspector_.commits_since(context.window_start));
  } else {
    report.branch = repo::kUnknownBranch;
  }

  merge_worklist(context, commits, worklist, report);
  worklist.touch(context.now);

  report.metrics =
      compute_metrics(commits, uncommitted.size(), worklist, context.effort, duration);

  for (const auto &note : inspector_.diagnostics()) {
    report.diagnostics.push_back(note);
  }

  SessionRecord record;
  record.project_name = context.project_name;
  record.window_start = context.window_start;
  record.closed_at = context.now;
  record.branch = report.branch;
  record.repository_available = report.repository_available;
  record.diagnostics = report.diagnostics;
  record.uncommitted = std::move(uncommitted);
  record.commits = std::move(commits);
  record.metrics = report.metrics;
  record.worklist = &worklist;
  record.completed_ids = report.completed_ids;
  record.added_ids = report.added_ids;

  report.artifacts = render_artifacts(record);
  report.archive = archive_.write(report.artifacts, context.now);

  for (const auto &artifact : report.archive.artifacts) {
    observability::record_artifact(artifact.name, artifact.path.string(), artifact.status.ok(),
                                   artifact.status.error());
  }

  if (!context.worklist_path.empty()) {
    report.worklist_saved = worklist.save(context.worklist_path);
    if (!report.worklist_saved.ok()) {
      observability::record_error("session.worklist", report.worklist_saved.error());
    }
  }

  observability::record_commits_archived(report.metrics.commits);
  observability::record_session_closed(report.archive.directory.string(),
                                       report.archive.written(), report.archive.failed(),
                                       report.metrics.duration);
  return report;
}

} // namespace warden::session
