#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/worklist/lock.hpp"
#include "warden/worklist/notes.hpp"
#include "warden/worklist/store.hpp"

#include <filesystem>

namespace {

namespace wl = warden::worklist;

const warden::common::TimePoint kUpdated = warden::common::from_unix_seconds(1'700'000'000);

wl::WorklistStore sample_store() {
  wl::WorklistStore store("Project Worklist");
  const wl::Priority priorities[] = {wl::Priority::Critical, wl::Priority::High,
                                     wl::Priority::Medium, wl::Priority::Low};
  for (int i = 0; i < 18; ++i) {
    const auto id = store.add("Task number " + std::to_string(i + 1), priorities[i % 4]);
    if (!id.ok()) {
      throw std::runtime_error(id.error());
    }
  }
  for (const char *id : {"WL-002", "WL-007", "WL-015"}) {
    const auto status = store.set_status(id, wl::ItemStatus::Completed);
    if (!status.ok()) {
      throw std::runtime_error(status.error());
    }
  }
  store.touch(kUpdated);
  return store;
}

} // namespace

void register_worklist_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  using warden::common::ErrorKind;

  tests.push_back({"priority_parsing_accepts_aliases", [] {
                     require(wl::priority_from_string("CRITICAL").value() == wl::Priority::Critical,
                             "upper case");
                     require(wl::priority_from_string("crit").value() == wl::Priority::Critical,
                             "crit");
                     require(wl::priority_from_string("med").value() == wl::Priority::Medium, "med");
                     require(wl::priority_from_string("p3").value() == wl::Priority::Low, "p3");
                     require(wl::priority_from_string("High Priority").value() == wl::Priority::High,
                             "heading form");
                     const auto bad = wl::priority_from_string("urgent");
                     require(!bad.ok() && bad.kind() == ErrorKind::MalformedInput, "unknown");
                   }});

  tests.push_back({"worklist_add_assigns_sequential_ids", [] {
                     wl::WorklistStore store;
                     require(store.add("First", wl::Priority::High).value() == "WL-001", "first");
                     require(store.add("Second", wl::Priority::Low).value() == "WL-002", "second");
                     require(store.next_id() == "WL-003", "next id");
                     require(!store.add("   ", wl::Priority::Low).ok(), "empty description");
                     require(!store.add("two\nlines", wl::Priority::Low).ok(), "multi-line");
                   }});

  tests.push_back({"worklist_round_trip_preserves_counts", [] {
                     const auto store = sample_store();
                     const auto counts = store.counts();
                     require(counts.total == 18 && counts.completed == 3 && counts.pending == 15,
                             "sample counts");

                     const std::string rendered = store.render();
                     require(rendered.find("- Total: 18") != std::string::npos, "total line");
                     require(rendered.find("- Completed: 3") != std::string::npos, "completed line");
                     require(rendered.find("- Pending: 15") != std::string::npos, "pending line");
                     require(rendered.find("Last updated: 2023-11-14T22:13:20Z") !=
                                 std::string::npos,
                             "timestamp line");

                     const auto parsed = wl::WorklistStore::parse(rendered);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().counts() == counts, "counts should survive");
                     require(parsed.value().title() == "Project Worklist", "title");
                     require(parsed.value().last_updated() == kUpdated, "last updated");
                     require(parsed.value().find("WL-007")->status == wl::ItemStatus::Completed,
                             "status should survive");
                     require(parsed.value().render() == rendered, "render should be idempotent");
                   }});

  tests.push_back({"worklist_render_groups_by_priority", [] {
                     const auto rendered = sample_store().render();
                     const auto critical = rendered.find("## Critical");
                     const auto high = rendered.find("## High");
                     const auto medium = rendered.find("## Medium");
                     const auto low = rendered.find("## Low");
                     require(critical < high && high < medium && medium < low,
                             "sections in priority order");
                     require(rendered.find("- [x] WL-002 Task number 2") != std::string::npos,
                             "completed marker");
                     require(rendered.find("- [ ] WL-001 Task number 1") != std::string::npos,
                             "pending marker");
                   }});

  tests.push_back({"worklist_empty_store_renders_every_section", [] {
                     const wl::WorklistStore store;
                     const auto rendered = store.render();
                     require(rendered.find("- Total: 0") != std::string::npos, "zero total");
                     require(rendered.find("## Low") != std::string::npos, "empty section kept");
                     const auto parsed = wl::WorklistStore::parse(rendered);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().counts().total == 0, "still empty");
                   }});

  tests.push_back({"worklist_summary_mismatch_is_rejected", [] {
                     std::string rendered = sample_store().render();
                     const auto pos = rendered.find("- Completed: 3");
                     rendered.replace(pos, 14, "- Completed: 4");
                     const auto parsed = wl::WorklistStore::parse(rendered);
                     require(!parsed.ok(), "mismatch should fail");
                     require(parsed.kind() == ErrorKind::MalformedInput, parsed.error());
                     require(parsed.error().find("do not match") != std::string::npos,
                             parsed.error());
                   }});

  tests.push_back({"worklist_hand_written_lines_get_ids", [] {
                     const auto parsed = wl::WorklistStore::parse(R"(# Notes

## High

- [ ] WL-004 Existing task
- [~] Sketch the release notes

## Low

- [x] Clean the attic
)");
                     require(parsed.ok(), parsed.error());
                     const auto &store = parsed.value();
                     require(store.items().size() == 3, "three items");
                     require(store.find("Sketch the release notes")->id == "WL-005",
                             "first unnumbered line");
                     require(store.find("clean the attic")->id == "WL-006",
                             "second unnumbered line");
                     require(store.find("WL-005")->status == wl::ItemStatus::InProgress,
                             "in-progress marker");
                   }});

  tests.push_back({"worklist_rejects_malformed_documents", [] {
                     const auto duplicate =
                         wl::WorklistStore::parse("## High\n- [ ] WL-001 a\n- [ ] WL-001 b\n");
                     require(!duplicate.ok(), "duplicate id should fail");
                     const auto marker = wl::WorklistStore::parse("## High\n- [?] WL-001 a\n");
                     require(!marker.ok(), "unknown marker should fail");
                     const auto stamp = wl::WorklistStore::parse("Last updated: yesterday\n");
                     require(!stamp.ok(), "bad timestamp should fail");
                     require(stamp.kind() == ErrorKind::MalformedInput, stamp.error());
                   }});

  tests.push_back({"worklist_find_lookup_order", [] {
                     wl::WorklistStore store;
                     (void)store.add("Write migration guide", wl::Priority::High);
                     (void)store.add("Review migration script", wl::Priority::Medium);
                     (void)store.add("Ship release", wl::Priority::Low);
                     require(store.find("wl-003")->description == "Ship release", "id ignores case");
                     require(store.find("WL-002 review script")->id == "WL-002", "leading id");
                     require(store.find("ship release")->id == "WL-003", "exact description");
                     require(store.find("guide")->id == "WL-001", "unique substring");
                     require(store.find("migration") == nullptr, "ambiguous substring");
                     require(store.find("") == nullptr, "empty reference");
                   }});

  tests.push_back({"worklist_load_missing_file_is_empty", [] {
                     warden::testing::TempWorkspace ws;
                     const auto loaded =
                         wl::WorklistStore::load(ws.path() / "TODO.md", "Fresh Worklist");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().items().empty(), "no items");
                     require(loaded.value().title() == "Fresh Worklist", "default title");
                   }});

  tests.push_back({"worklist_save_and_load_round_trip", [] {
                     warden::testing::TempWorkspace ws;
                     const auto path = ws.path() / "docs" / "TODO.md";
                     const auto store = sample_store();
                     const auto saved = store.save(path);
                     require(saved.ok(), saved.error());
                     const auto loaded = wl::WorklistStore::load(path, "ignored");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().counts() == store.counts(), "counts after reload");
                     require(loaded.value().title() == "Project Worklist", "title from file");
                   }});

  tests.push_back({"worklist_load_reports_path_on_error", [] {
                     warden::testing::TempWorkspace ws;
                     ws.create_file("TODO.md", "## Summary\n- Total: 1\n");
                     const auto loaded = wl::WorklistStore::load(ws.path() / "TODO.md", "x");
                     require(!loaded.ok(), "mismatch should fail");
                     require(loaded.error().find("TODO.md") != std::string::npos, loaded.error());
                   }});

  tests.push_back({"worklist_lock_is_exclusive", [] {
                     warden::testing::TempWorkspace ws;
                     const auto path = ws.path() / "TODO.md";
                     wl::WorklistLock first(path);
                     require(first.acquire().ok(), "first lock should succeed");
                     require(first.held(), "first should hold");

                     wl::WorklistLock second(path);
                     const auto contended = second.acquire();
                     require(!contended.ok(), "second lock should fail");
                     require(contended.error().find("locked by another session") !=
                                 std::string::npos,
                             contended.error());

                     first.release();
                     require(second.acquire().ok(), "lock should be free after release");
                   }});

  tests.push_back({"worklist_lock_released_on_destruction", [] {
                     warden::testing::TempWorkspace ws;
                     const auto path = ws.path() / "TODO.md";
                     {
                       wl::WorklistLock scoped(path);
                       require(scoped.acquire().ok(), "scoped lock");
                     }
                     wl::WorklistLock next(path);
                     require(next.acquire().ok(), "destructor should release");
                     require(next.path() == ws.path() / "TODO.md.lock", "lock file location");
                   }});

  // Notes

  tests.push_back({"notes_scan_recognises_markers", [] {
                     const auto findings = wl::scan_notes(R"(Session notes
TODO(high): add retry to the uploader
- TODO: document the archive layout
DONE: WL-003
wip: WL-004
- [x] Ship release
- [~] Review migration script
- [ ] Benchmark the gate
plain text line
)");
                     require(findings.new_tasks.size() == 3, "three new tasks");
                     require(findings.new_tasks[0].priority == wl::Priority::High, "priority");
                     require(findings.new_tasks[0].description == "add retry to the uploader",
                             findings.new_tasks[0].description);
                     require(findings.new_tasks[1].priority == wl::Priority::Medium,
                             "default priority");
                     require(findings.new_tasks[2].description == "Benchmark the gate",
                             "checkbox task");
                     require(findings.completed ==
                                 std::vector<std::string>{"WL-003", "Ship release"},
                             "completed refs");
                     require(findings.in_progress ==
                                 std::vector<std::string>{"WL-004", "Review migration script"},
                             "in-progress refs");
                   }});

  tests.push_back({"notes_scan_empty_text", [] {
                     require(wl::scan_notes("").empty(), "nothing to find");
                     require(wl::scan_notes("just a thought\nanother").empty(), "plain prose");
                   }});

  tests.push_back({"closed_refs_from_commit_subjects", [] {
                     const auto refs = wl::closed_item_refs("fix: retry uploads, closes wl-012");
                     require(refs == std::vector<std::string>{"WL-012"}, "closes ref");
                     const auto many =
                         wl::closed_item_refs("Completes WL-1 and closed WL-22; mentions WL-3");
                     require(many.size() == 2, "only closing verbs count");
                     require(wl::closed_item_refs("update docs").empty(), "no refs");
                   }});

  tests.push_back({"worklist_keeps_items_under_unrecognised_headings", [] {
                     warden::testing::TempWorkspace ws;
                     const auto path = ws.path() / "TODO.md";
                     ws.create_file("TODO.md", R"(# Worklist

## High Priority

- [ ] WL-001 Harden the gate

## Backlog

- [ ] WL-002 keep me
- [ ] hand written idea
)");
                     auto loaded = wl::WorklistStore::load(path, "Worklist");
                     require(loaded.ok(), loaded.error());
                     auto &store = loaded.value();
                     require(store.items().size() == 3, "nothing dropped on load");
                     require(store.find("WL-001")->priority == wl::Priority::High,
                             "'High Priority' heading names a priority");
                     require(store.find("WL-002")->priority == wl::Priority::Medium,
                             "unknown heading files items as Medium");

                     const auto added = store.add("new thing", wl::Priority::Low);
                     require(added.ok(), added.error());
                     require(added.value() == "WL-004", "fresh id, got " + added.value());
                     require(store.save(path).ok(), "save");

                     const auto reloaded = wl::WorklistStore::load(path, "Worklist");
                     require(reloaded.ok(), reloaded.error());
                     require(reloaded.value().counts().total == 4, "every item survives");
                     for (const char *id : {"WL-001", "WL-002", "WL-003", "WL-004"}) {
                       require(reloaded.value().find(id) != nullptr, std::string("missing ") + id);
                     }
                     require(reloaded.value().find("WL-002")->description == "keep me",
                             "description kept");
                     require(reloaded.value().find("WL-003")->description == "hand written idea",
                             "hand-written line numbered");
                   }});
}
