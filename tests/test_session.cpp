#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/common/digest.hpp"
#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"
#include "warden/session/archive.hpp"
#include "warden/session/classifier.hpp"
#include "warden/session/metrics.hpp"
#include "warden/session/recorder.hpp"
#include "warden/session/render.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

namespace {

namespace session = warden::session;
namespace wl = warden::worklist;

const warden::common::TimePoint kStart = warden::common::from_unix_seconds(1'700'000'000);
const warden::common::TimePoint kNow = warden::common::from_unix_seconds(1'700'005'400);

warden::repo::CommitRecord commit(std::string hash, std::string message,
                                  std::vector<warden::repo::FileChange> files) {
  warden::repo::CommitRecord record;
  record.hash = std::move(hash);
  record.author = "Ada";
  record.message = std::move(message);
  record.authored_at = kStart;
  record.files_changed = std::move(files);
  return record;
}

warden::repo::FileChange file(std::string path, std::uint64_t added, std::uint64_t removed) {
  return warden::repo::FileChange{.path = std::move(path), .added = added, .removed = removed};
}

warden::repo::ProcessResult output(std::string text) {
  warden::repo::ProcessResult result;
  result.stdout_text = std::move(text);
  return result;
}

std::string without_duration(const std::string &metrics) {
  std::string out;
  for (const auto &line : warden::common::split_lines(metrics)) {
    if (!warden::common::starts_with(line, "duration_minutes:")) {
      out += line + "\n";
    }
  }
  return out;
}

session::SessionArtifactSet simple_artifacts() {
  session::SessionArtifactSet set;
  set.summary = "# summary\n";
  set.todo_snapshot = "# todo\n";
  set.changelog = "# changelog\n";
  set.metrics = "commits: 0\n";
  return set;
}

class FlakyArchiveWriter final : public session::ArchiveWriter {
public:
  FlakyArchiveWriter(std::filesystem::path root, std::string failing)
      : ArchiveWriter(std::move(root)), failing_(std::move(failing)) {}

protected:
  warden::common::Status write_artifact(const std::filesystem::path &path,
                                        const std::string &content) override {
    if (path.filename() == failing_) {
      return warden::common::Status::error("disk full");
    }
    return ArchiveWriter::write_artifact(path, content);
  }

private:
  std::string failing_;
};

wl::WorklistStore seeded_worklist() {
  wl::WorklistStore store("Worklist");
  (void)store.add("Add login form", wl::Priority::High);
  (void)store.add("Fix crash on empty input", wl::Priority::Critical);
  (void)store.add("Write onboarding guide", wl::Priority::Low);
  return store;
}

} // namespace

void register_session_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  // Classification

  tests.push_back({"classifier_prefers_conventional_prefix", [] {
                     require(session::classify_commit("feat(auth): add token refresh") ==
                                 session::ChangeCategory::Feature,
                             "feat scope");
                     require(session::classify_commit("[SECURITY] rotate signing keys") ==
                                 session::ChangeCategory::Security,
                             "bracket prefix");
                     require(session::classify_commit("DOCS - fix typo in readme") ==
                                 session::ChangeCategory::Docs,
                             "dash prefix beats the fix keyword");
                     require(session::classify_commit("refactor!: drop legacy loader") ==
                                 session::ChangeCategory::Refactor,
                             "breaking marker");
                     require(session::classify_commit("hotfix: null check") ==
                                 session::ChangeCategory::Fix,
                             "alias");
                   }});

  tests.push_back({"classifier_falls_back_to_keywords", [] {
                     require(session::classify_commit("Fix crash on empty input") ==
                                 session::ChangeCategory::Fix,
                             "fix keyword");
                     require(session::classify_commit("Patch XSS in comment renderer") ==
                                 session::ChangeCategory::Security,
                             "security outranks fix");
                     require(session::classify_commit("Implement archive manifest") ==
                                 session::ChangeCategory::Feature,
                             "feature keyword");
                     require(session::classify_commit("chore: bump dependencies") ==
                                 session::ChangeCategory::Other,
                             "unknown prefix without keywords");
                     require(session::classify_commit("") == session::ChangeCategory::Other,
                             "empty message");
                   }});

  // Metrics

  tests.push_back({"metrics_aggregate_commits_and_files", [] {
                     const auto commits = session::classify_commits({
                         commit("aaaa111", "feat: gate", {file("src/gate.cpp", 40, 2)}),
                         commit("bbbb222", "fix: gate edge",
                                {file("src/gate.cpp", 3, 1), file("tests/gate.cpp", 20, 0)}),
                     });
                     const auto store = seeded_worklist();
                     const auto metrics = session::compute_metrics(
                         commits, 2, store, session::EffortRates{}, std::chrono::seconds(5400));
                     require(metrics.commits == 2, "commit count");
                     require(metrics.count_for(session::ChangeCategory::Feature) == 1, "feature");
                     require(metrics.count_for(session::ChangeCategory::Fix) == 1, "fix");
                     require(metrics.files_changed() == 2, "distinct files");
                     require(metrics.files[0].path == "src/gate.cpp" && metrics.files[0].added == 43,
                             "per-file totals in first-seen order");
                     require(metrics.lines_added == 63 && metrics.lines_removed == 3, "line totals");
                     require(metrics.uncommitted_changes == 2, "uncommitted");
                     require(metrics.effort_remaining.total_hours() == 8.0,
                             "high 3 + critical 4 + low 1");
                   }});

  tests.push_back({"metrics_skip_completed_items_and_clamp_duration", [] {
                     auto store = seeded_worklist();
                     (void)store.set_status("WL-002", wl::ItemStatus::Completed);
                     const auto metrics = session::compute_metrics(
                         {}, 0, store, session::EffortRates{.critical_hours = 10.0},
                         std::chrono::seconds(-30));
                     require(metrics.effort_remaining.critical_hours == 0.0,
                             "completed items carry no effort");
                     require(metrics.effort_remaining.total_hours() == 4.0, "high 3 + low 1");
                     require(metrics.duration.count() == 0, "negative duration clamps to zero");
                     require(metrics.tasks.completed == 1, "task counts");
                   }});

  // Rendering

  tests.push_back({"render_empty_session_says_no_commits", [] {
                     const auto store = seeded_worklist();
                     session::SessionRecord record;
                     record.project_name = "demo";
                     record.window_start = kStart;
                     record.closed_at = kNow;
                     record.branch = "main";
                     record.worklist = &store;
                     record.metrics = session::compute_metrics({}, 0, store, {},
                                                               std::chrono::seconds(5400));
                     const auto set = session::render_artifacts(record);
                     require(set.summary.find("# Session Summary: demo") == 0, "summary title");
                     require(set.summary.find(session::kNoCommits) != std::string::npos,
                             "summary should state no commits");
                     require(set.changelog.find(session::kNoCommits) != std::string::npos,
                             "changelog should state no commits");
                     require(set.summary.find("- Duration: 1h 30m") != std::string::npos,
                             "duration line");
                     require(set.summary.find("Start WL-002 [Critical]") != std::string::npos,
                             "critical work recommended first");
                     require(set.metrics.find("commits: 0\n") == 0, "metrics start with commits");
                     require(set.metrics.find("effort.total_hours: 8.0") != std::string::npos,
                             "effort total");
                     require(set.todo_snapshot == store.render(), "snapshot is the worklist");
                   }});

  tests.push_back({"render_changelog_groups_by_category", [] {
                     const auto store = seeded_worklist();
                     session::SessionRecord record;
                     record.window_start = kStart;
                     record.closed_at = kNow;
                     record.commits = session::classify_commits({
                         commit("1234567890ab", "fix: handle EOF", {file("src/io.cpp", 2, 1)}),
                         commit("abcdef123456", "feat: add audit log", {}),
                     });
                     record.metrics = session::compute_metrics(record.commits, 0, store, {},
                                                               std::chrono::seconds(0));
                     const auto changelog = session::render_changelog(record);
                     const auto feature = changelog.find("## FEATURE");
                     const auto fix = changelog.find("## FIX");
                     require(feature != std::string::npos && fix != std::string::npos,
                             "both sections present");
                     require(fix < feature, "sections follow category order");
                     require(changelog.find("## DOCS") == std::string::npos,
                             "empty categories are omitted");
                     require(changelog.find("- 1234567 fix: handle EOF") != std::string::npos,
                             "short hash line");
                     require(changelog.find("  - src/io.cpp (+2/-1)") != std::string::npos,
                             "file line");
                   }});

  tests.push_back({"render_summary_warns_about_uncommitted_work", [] {
                     session::SessionRecord record;
                     record.window_start = kStart;
                     record.closed_at = kNow;
                     record.branch = "main";
                     record.uncommitted = {{.path = "a.txt", .kind = warden::repo::ChangeKind::Modified},
                                           {.path = "b.txt", .kind = warden::repo::ChangeKind::Untracked}};
                     const auto summary = session::render_summary(record);
                     require(summary.find("WARNING: 2 uncommitted changes not captured in any commit") !=
                                 std::string::npos,
                             summary);
                     require(summary.find("  - untracked b.txt") != std::string::npos, "listed");
                   }});

  // Archive

  tests.push_back({"archive_writes_artifacts_and_manifest", [] {
                     warden::testing::TempWorkspace ws;
                     session::ArchiveWriter writer(ws.path() / "sessions");
                     const auto set = simple_artifacts();
                     const auto result = writer.write(set, kNow);
                     require(result.written() == 4 && result.failed() == 0, "all written");
                     require(result.manifest.ok(), result.manifest.error());
                     require(result.directory ==
                                 ws.path() / "sessions" / warden::common::date_key(kNow),
                             "dated directory");
                     for (const char *name : {session::kSummaryFile, session::kTodoSnapshotFile,
                                              session::kChangelogFile, session::kMetricsFile,
                                              session::kManifestFile}) {
                       require(std::filesystem::exists(result.directory / name),
                               std::string(name) + " should exist");
                     }
                     const auto manifest =
                         warden::common::read_file(result.directory / session::kManifestFile);
                     require(manifest.ok(), manifest.error());
                     require(manifest.value().find(warden::common::sha256_hex(set.metrics) + "  " +
                                                   session::kMetricsFile) != std::string::npos,
                             manifest.value());
                   }});

  tests.push_back({"archive_same_day_gets_suffix", [] {
                     warden::testing::TempWorkspace ws;
                     session::ArchiveWriter writer(ws.path());
                     const auto first = writer.write(simple_artifacts(), kNow);
                     const auto second = writer.write(simple_artifacts(), kNow);
                     const auto third = writer.write(simple_artifacts(), kNow);
                     const std::string date = warden::common::date_key(kNow);
                     require(first.directory.filename() == date, "first uses the date");
                     require(second.directory.filename() == date + "-2", "second gets -2");
                     require(third.directory.filename() == date + "-3", "third gets -3");
                     require(warden::common::read_file(first.directory / session::kSummaryFile)
                                     .value() == "# summary\n",
                             "first archive untouched");
                   }});

  tests.push_back({"archive_partial_failure_keeps_other_artifacts", [] {
                     warden::testing::TempWorkspace ws;
                     FlakyArchiveWriter writer(ws.path(), session::kChangelogFile);
                     const auto result = writer.write(simple_artifacts(), kNow);
                     require(result.written() == 3 && result.failed() == 1, "one failure");
                     const auto failed = std::find_if(
                         result.artifacts.begin(), result.artifacts.end(),
                         [](const auto &artifact) { return !artifact.status.ok(); });
                     require(failed->name == session::kChangelogFile, "changelog failed");
                     require(failed->status.kind() ==
                                 warden::common::ErrorKind::ArtifactWriteFailure,
                             "failure kind");
                     require(std::filesystem::exists(result.directory / session::kMetricsFile),
                             "later artifact still written");
                     const auto manifest =
                         warden::common::read_file(result.directory / session::kManifestFile);
                     require(manifest.ok() &&
                                 manifest.value().find(session::kChangelogFile) == std::string::npos,
                             "manifest lists only written artifacts");
                   }});

  tests.push_back({"archive_unusable_root_fails_every_artifact", [] {
                     warden::testing::TempWorkspace ws;
                     ws.create_file("blocked", "not a directory");
                     session::ArchiveWriter writer(ws.path() / "blocked");
                     const auto result = writer.write(simple_artifacts(), kNow);
                     require(result.written() == 0 && result.failed() == 4, "nothing written");
                     require(!result.manifest.ok(), "no manifest");
                   }});

  // Recorder

  tests.push_back({"recorder_closes_session_end_to_end", [] {
                     warden::testing::TempWorkspace ws;
                     warden::testing::FakeProcessRunner runner;
                     runner.respond("rev-parse", output("true\n"));
                     runner.respond("symbolic-ref", output("main\n"));
                     runner.respond("status", output(std::string(" M src/app.cpp\0", 15)));
                     runner.respond(
                         "log",
                         output("\x1e" "aaaa1111bbbb2222cccc3333dddd4444eeee5555\x1f" "Ada\x1f"
                                "1700001000\x1f" "feat: add login form, closes WL-001\n\n"
                                "30\t4\tsrc/login.cpp\n"));
                     warden::repo::RepositoryInspector inspector(ws.path(), runner);
                     session::ArchiveWriter archive(ws.path() / "sessions");
                     session::SessionRecorder recorder(inspector, archive);

                     auto store = seeded_worklist();
                     session::SessionContext context;
                     context.window_start = kStart;
                     context.now = kNow;
                     context.project_name = "demo";
                     context.notes = "TODO(critical): rotate API tokens\nDONE: Fix crash\n"
                                     "WIP: WL-003\nDONE: WL-999\n";
                     context.worklist_path = ws.path() / "TODO.md";

                     const auto report = recorder.close_session(context, store);
                     require(report.succeeded(), "artifacts should be written");
                     require(report.failures().empty(), "no failures expected");
                     require(report.branch == "main", "branch");
                     require(report.repository_available, "repository available");
                     require(report.added_ids == std::vector<std::string>{"WL-004"}, "new task");
                     require(report.completed_ids == std::vector<std::string>{"WL-002", "WL-001"},
                             "notes first, then commit references");
                     require(report.started_ids == std::vector<std::string>{"WL-003"}, "started");
                     require(report.unresolved == std::vector<std::string>{"WL-999"},
                             "unknown reference reported");
                     require(report.metrics.commits == 1 && report.metrics.uncommitted_changes == 1,
                             "metrics");
                     require(store.find("WL-004")->priority == wl::Priority::Critical,
                             "priority from note");

                     const auto saved = wl::WorklistStore::load(context.worklist_path, "x");
                     require(saved.ok(), saved.error());
                     require(saved.value().counts().completed == 2, "saved worklist");
                     require(saved.value().last_updated() == kNow, "timestamp from context");

                     const auto summary = warden::common::read_file(report.archive.directory /
                                                                    session::kSummaryFile);
                     require(summary.ok(), summary.error());
                     require(summary.value().find("- WL-001 Add login form") != std::string::npos,
                             "completed task listed");
                     require(summary.value().find("WARNING: 1 uncommitted change ") !=
                                 std::string::npos,
                             "uncommitted warning");
                   }});

  tests.push_back({"recorder_repeated_close_gives_same_aggregates", [] {
                     warden::testing::TempWorkspace ws;
                     warden::testing::FakeProcessRunner runner;
                     runner.respond("rev-parse", output("true\n"));
                     runner.respond("symbolic-ref", output("main\n"));
                     runner.respond("status", output(""));
                     runner.respond(
                         "log",
                         output("\x1e" "aaaa1111bbbb2222cccc3333dddd4444eeee5555\x1f" "Ada\x1f"
                                "1700001000\x1f" "fix: handle empty payload\n\n"
                                "3\t1\tsrc/gate.cpp\n"));
                     warden::repo::RepositoryInspector inspector(ws.path(), runner);
                     session::ArchiveWriter archive(ws.path() / "sessions");
                     session::SessionRecorder recorder(inspector, archive);
                     const auto worklist_path = ws.path() / "TODO.md";
                     require(seeded_worklist().save(worklist_path).ok(), "seed worklist");

                     std::vector<std::string> metrics;
                     for (const auto now : std::vector<warden::common::TimePoint>{
                              kNow, kNow + std::chrono::minutes(7)}) {
                       auto store = wl::WorklistStore::load(worklist_path, "Worklist");
                       require(store.ok(), store.error());
                       session::SessionContext context;
                       context.window_start = kStart;
                       context.now = now;
                       context.worklist_path = worklist_path;
                       const auto report = recorder.close_session(context, store.value());
                       require(report.succeeded() && report.failures().empty(), "clean close");
                       const auto text = warden::common::read_file(report.archive.directory /
                                                                   session::kMetricsFile);
                       require(text.ok(), text.error());
                       metrics.push_back(without_duration(text.value()));
                     }
                     require(metrics[0] == metrics[1],
                             "aggregates differ:\n" + metrics[0] + "---\n" + metrics[1]);
                     require(metrics[0].find("uncommitted_changes: 0") != std::string::npos,
                             "clean tree");
                   }});

  tests.push_back({"recorder_never_demotes_completed_items", [] {
                     warden::testing::TempWorkspace ws;
                     warden::testing::FakeProcessRunner runner;
                     warden::repo::RepositoryInspector inspector(ws.path() / "missing", runner);
                     session::ArchiveWriter archive(ws.path() / "sessions");
                     session::SessionRecorder recorder(inspector, archive);

                     auto store = seeded_worklist();
                     (void)store.set_status("WL-001", wl::ItemStatus::Completed);
                     session::SessionContext context;
                     context.window_start = kStart;
                     context.now = kNow;
                     context.in_progress = {"WL-001"};
                     const auto report = recorder.close_session(context, store);
                     require(store.find("WL-001")->status == wl::ItemStatus::Completed,
                             "completed item stays completed");
                     require(report.started_ids.empty(), "nothing started");
                   }});

  tests.push_back({"recorder_degrades_without_repository", [] {
                     warden::testing::TempWorkspace ws;
                     auto recording = std::make_unique<warden::testing::RecordingObserver>();
                     auto *observer = recording.get();
                     warden::observability::set_global_observer(std::move(recording));

                     warden::testing::FakeProcessRunner runner;
                     warden::repo::RepositoryInspector inspector(ws.path() / "not-a-repo", runner);
                     session::ArchiveWriter archive(ws.path() / "sessions");
                     session::SessionRecorder recorder(inspector, archive);
                     auto store = seeded_worklist();
                     session::SessionContext context;
                     context.window_start = kStart;
                     context.now = kNow;
                     context.completed = {"Write onboarding guide"};

                     const auto report = recorder.close_session(context, store);
                     const auto events = observer->events();
                     warden::observability::set_global_observer(nullptr);

                     require(report.succeeded(), "archive should still be written");
                     require(!report.repository_available, "repository unavailable");
                     require(report.branch == warden::repo::kUnknownBranch, "unknown branch");
                     require(report.completed_ids == std::vector<std::string>{"WL-003"},
                             "worklist merge still runs");
                     require(report.artifacts.summary.find("- Repository data: unavailable") !=
                                 std::string::npos,
                             "summary should say repository data is unavailable");
                     require(report.artifacts.summary.find("Restore repository access") !=
                                 std::string::npos,
                             "recommendation");
                     require(report.artifacts.changelog.find(session::kNoCommits) !=
                                 std::string::npos,
                             "changelog without commits");

                     const bool closed = std::any_of(events.begin(), events.end(), [](const auto &e) {
                       return std::holds_alternative<warden::observability::SessionClosedEvent>(e);
                     });
                     require(closed, "session close should be observable");
                   }});

  tests.push_back({"recorder_reports_total_archive_failure", [] {
                     warden::testing::TempWorkspace ws;
                     ws.create_file("sessions", "file in the way");
                     warden::testing::FakeProcessRunner runner;
                     warden::repo::RepositoryInspector inspector(ws.path() / "missing", runner);
                     session::ArchiveWriter archive(ws.path() / "sessions");
                     session::SessionRecorder recorder(inspector, archive);
                     auto store = seeded_worklist();
                     session::SessionContext context;
                     context.window_start = kStart;
                     context.now = kNow;
                     const auto report = recorder.close_session(context, store);
                     require(!report.succeeded(), "nothing written");
                     require(report.failures().size() == 4, "every artifact reported");
                   }});

  tests.push_back({"sha256_known_vector", [] {
                     require(warden::common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                   }});
}
