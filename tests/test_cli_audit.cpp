#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/cli/commands.hpp"
#include "warden/config/config.hpp"
#include "warden/gate/audit_log.hpp"
#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"
#include "warden/repo/process.hpp"
#include "warden/session/render.hpp"
#include "warden/worklist/store.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

/// Points the CLI at a workspace and restores global state afterwards.
struct CliEnvironment {
  EnvGuard project;
  EnvGuard config_path;
  EnvGuard backend;

  explicit CliEnvironment(const warden::testing::TempWorkspace &ws)
      : project("WARDEN_PROJECT_DIR", ws.path().string()),
        config_path("WARDEN_CONFIG_PATH", std::nullopt),
        backend("WARDEN_OBSERVABILITY", "none") {
    warden::config::clear_config_path_override();
  }

  ~CliEnvironment() {
    warden::config::clear_config_path_override();
    warden::observability::set_global_observer(nullptr);
  }
};

bool git(const std::filesystem::path &dir, std::vector<std::string> args) {
  args.insert(args.begin(), {"git", "-c", "user.name=warden", "-c", "user.email=warden@localhost",
                             "-c", "commit.gpgsign=false"});
  warden::repo::ProcessOptions options;
  options.working_dir = dir;
  options.env = {{"GIT_CONFIG_NOSYSTEM", "1"}, {"GIT_TERMINAL_PROMPT", "0"}};
  warden::repo::PosixProcessRunner runner;
  return runner.run(args, options).ok();
}

std::string read_metrics(const std::filesystem::path &archive) {
  const auto text = warden::common::read_file(archive / warden::session::kMetricsFile);
  if (!text.ok()) {
    throw std::runtime_error(text.error());
  }
  std::string out;
  for (const auto &line : warden::common::split_lines(text.value())) {
    if (!warden::common::starts_with(line, "duration_minutes:")) {
      out += line + "\n";
    }
  }
  return out;
}

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "warden");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return warden::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

warden::gate::ToolInvocation shell(std::string command) {
  warden::gate::ToolInvocation invocation;
  invocation.kind = warden::gate::OperationKind::ShellCommand;
  invocation.target = std::move(command);
  invocation.requested_at = warden::common::from_unix_seconds(1'700'000'000);
  return invocation;
}

} // namespace

void register_cli_audit_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace gate = warden::gate;
  namespace cli = warden::cli;

  // Audit log

  tests.push_back({"audit_log_records_and_lists_newest_first", [] {
                     warden::testing::TempWorkspace ws;
                     gate::AuditLog audit(ws.path() / ".warden" / "audit.db");
                     require(audit.is_open(), "audit db should open");

                     auto blocked = gate::GateDecision::block(
                         "dangerous", warden::common::ErrorKind::PolicyViolation,
                         "dangerous-commands#1");
                     require(audit.record(shell("rm -rf /"), blocked).ok(), "record block");

                     auto advised = gate::GateDecision::allow();
                     advised.advisories = {"caution: 'git rebase' matched", "second note"};
                     auto later = shell("git rebase main");
                     later.requested_at = warden::common::from_unix_seconds(1'700'000'060);
                     require(audit.record(later, advised).ok(), "record allow");

                     const auto count = audit.count();
                     require(count.ok() && count.value() == 2, "two entries");

                     const auto entries = audit.recent(10);
                     require(entries.ok(), entries.error());
                     require(entries.value().size() == 2, "both entries listed");
                     const auto &newest = entries.value()[0];
                     require(newest.target == "git rebase main" && newest.allowed, "newest first");
                     require(newest.advisories.size() == 2, "advisories survive");
                     require(!newest.rule_id.has_value(), "allow has no rule");
                     const auto &oldest = entries.value()[1];
                     require(!oldest.allowed && oldest.rule_id == std::string("dangerous-commands#1"),
                             "block keeps its rule");
                     require(oldest.reason == std::string("dangerous"), "reason kept");

                     const auto limited = audit.recent(1);
                     require(limited.ok() && limited.value().size() == 1, "limit honoured");
                   }});

  tests.push_back({"audit_log_unwritable_location_reports_error", [] {
                     warden::testing::TempWorkspace ws;
                     ws.create_file("occupied", "file");
                     gate::AuditLog audit(ws.path() / "occupied" / "audit.db");
                     require(!audit.is_open(), "db under a file cannot open");
                     require(!audit.record(shell("ls"), gate::GateDecision::allow()).ok(),
                             "record should fail");
                     require(!audit.recent(5).ok(), "recent should fail");
                   }});

  // CLI

  tests.push_back({"cli_version_and_help_exit_ok", [] {
                     require(run({"version"}) == cli::kExitOk, "version");
                     require(run({"--help"}) == cli::kExitOk, "help");
                     require(run({"no-such-command"}) == cli::kExitError, "unknown command");
                   }});

  tests.push_back({"cli_check_command_exit_codes", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     require(run({"check-command", "rm", "-rf", "/"}) == cli::kExitBlocked,
                             "dangerous command should exit 2");
                     require(run({"check-command", "git", "push", "origin", "main", "--force"}) ==
                                 cli::kExitBlocked,
                             "trailing --force should exit 2");
                     require(run({"check-command", "git", "status"}) == cli::kExitOk,
                             "safe command should exit 0");
                     require(run({"check-command"}) == cli::kExitError, "missing command");
                   }});

  tests.push_back({"cli_check_file_exit_codes", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     require(run({"check-file", (ws.path() / ".env").string()}) == cli::kExitBlocked,
                             ".env should be blocked");
                     require(run({"check-file", (ws.path() / "src" / "a.cpp").string()}) ==
                                 cli::kExitOk,
                             "source file should be allowed");
                   }});

  tests.push_back({"cli_invalid_rules_fail_closed", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     ws.create_file(".warden/config.toml",
                                    "[gate]\nhard_block_commands = [\"re:(unclosed\"]\n");
                     require(run({"check-command", "ls"}) == cli::kExitBlocked,
                             "broken rules should block everything");
                   }});

  tests.push_back({"cli_global_config_flag", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     ws.create_file("custom.toml",
                                    "[gate]\nhard_block_commands = [\"terraform destroy\"]\n");
                     require(run({"--config", (ws.path() / "custom.toml").string(), "check-command",
                                  "terraform", "destroy"}) == cli::kExitBlocked,
                             "rule from --config file should apply");
                     require(run({"--config"}) == cli::kExitError, "missing flag value");
                   }});

  tests.push_back({"cli_worklist_add_and_complete", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     require(run({"worklist", "add", "--priority", "high", "Ship", "the", "gate"}) ==
                                 cli::kExitOk,
                             "add");
                     require(run({"worklist", "add", "--priority", "someday", "x"}) ==
                                 cli::kExitError,
                             "bad priority");
                     require(run({"worklist", "start", "WL-001"}) == cli::kExitOk, "start");
                     require(run({"worklist", "done", "ship the gate"}) == cli::kExitOk, "done");
                     require(run({"worklist", "done", "WL-404"}) == cli::kExitError, "unknown id");
                     require(run({"worklist", "list"}) == cli::kExitOk, "list");

                     const auto store =
                         warden::worklist::WorklistStore::load(ws.path() / "TODO.md", "x");
                     require(store.ok(), store.error());
                     require(store.value().items().size() == 1, "one item");
                     require(store.value().items()[0].priority == warden::worklist::Priority::High,
                             "priority");
                     require(store.value().items()[0].status ==
                                 warden::worklist::ItemStatus::Completed,
                             "completed");
                   }});

  tests.push_back({"cli_session_start_and_close", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     const EnvGuard timeout("WARDEN_GIT_TIMEOUT_MS", "5000");
                     require(run({"session-start"}) == cli::kExitOk, "session-start");
                     const auto marker = ws.path() / ".warden" / "session.start";
                     require(std::filesystem::exists(marker), "marker written");

                     ws.create_file("notes.md", "TODO(low): tidy fixtures\n");
                     require(run({"close-session", "--notes", (ws.path() / "notes.md").string()}) ==
                                 cli::kExitOk,
                             "close-session");
                     require(!std::filesystem::exists(marker), "marker removed after close");

                     const auto sessions = ws.path() / ".warden" / "sessions";
                     std::size_t archives = 0;
                     for (const auto &entry : std::filesystem::directory_iterator(sessions)) {
                       require(std::filesystem::exists(entry.path() / "SESSION_SUMMARY.md"),
                               "summary in archive");
                       ++archives;
                     }
                     require(archives == 1, "one archive directory");
                     const auto store =
                         warden::worklist::WorklistStore::load(ws.path() / "TODO.md", "x");
                     require(store.ok() && store.value().items().size() == 1,
                             "note task added to the worklist");
                   }});

  tests.push_back({"cli_repeated_close_ignores_own_state_in_git", [] {
                     warden::testing::TempWorkspace ws;
                     if (!git(ws.path(), {"--version"})) {
                       return;
                     }
                     require(git(ws.path(), {"init", "-q"}), "git init");
                     ws.create_file("README.md", "hello\n");
                     require(git(ws.path(), {"add", "README.md"}), "git add");
                     require(git(ws.path(), {"commit", "-q", "-m", "docs: add readme"}),
                             "git commit");

                     const CliEnvironment env(ws);
                     require(run({"close-session", "--since", "1d"}) == cli::kExitOk, "first");
                     require(run({"close-session", "--since", "1d"}) == cli::kExitOk, "second");

                     std::vector<std::filesystem::path> archives;
                     for (const auto &entry :
                          std::filesystem::directory_iterator(ws.path() / ".warden" / "sessions")) {
                       archives.push_back(entry.path());
                     }
                     std::sort(archives.begin(), archives.end());
                     require(archives.size() == 2, "two archives");

                     const auto first = read_metrics(archives[0]);
                     const auto second = read_metrics(archives[1]);
                     require(first == second, "aggregates differ:\n" + first + "---\n" + second);
                     require(first.find("uncommitted_changes: 0") != std::string::npos, first);
                     require(first.find("commits: 1\n") != std::string::npos, first);

                     const auto summary = warden::common::read_file(
                         archives[0] / warden::session::kSummaryFile);
                     require(summary.ok(), summary.error());
                     require(summary.value().find("WARNING:") == std::string::npos,
                             "no unsaved-work warning on a clean tree");
                   }});

  tests.push_back({"cli_close_session_rejects_bad_since", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     require(run({"close-session", "--since", "last tuesday"}) == cli::kExitError,
                             "unparseable --since");
                     require(run({"close-session", "stray"}) == cli::kExitError, "stray argument");
                   }});

  tests.push_back({"cli_audit_lists_nothing_when_empty", [] {
                     warden::testing::TempWorkspace ws;
                     const CliEnvironment env(ws);
                     require(run({"audit"}) == cli::kExitOk, "empty audit");
                     require(run({"audit", "--limit", "zero"}) == cli::kExitError, "bad limit");
                   }});
}
