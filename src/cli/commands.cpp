#include "warden/cli/commands.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"
#include "warden/common/time.hpp"
#include "warden/config/config.hpp"
#include "warden/gate/audit_log.hpp"
#include "warden/gate/guardrail.hpp"
#include "warden/gate/invocation.hpp"
#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"
#include "warden/observability/log_observer.hpp"
#include "warden/repo/inspector.hpp"
#include "warden/repo/process.hpp"
#include "warden/session/archive.hpp"
#include "warden/session/recorder.hpp"
#include "warden/worklist/lock.hpp"
#include "warden/worklist/store.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace warden::cli {

namespace {

constexpr std::size_t kDefaultAuditLimit = 20;

std::string version_string() {
#ifdef WARDEN_VERSION
  return std::string("warden ") + WARDEN_VERSION;
#else
  return "warden 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Load, validate and install the observer. Warnings go to stderr.
common::Result<config::Config> load_runtime_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return loaded;
}

std::filesystem::path marker_path(const config::Config &config) {
  return config::resolve_path(config, config.session.marker_path);
}

std::filesystem::path worklist_path(const config::Config &config) {
  return config::resolve_path(config, config.session.worklist_path);
}

std::filesystem::path without_trailing_slash(const std::filesystem::path &path) {
  const auto normal = path.lexically_normal();
  return normal.has_filename() ? normal : normal.parent_path();
}

// State warden writes itself, relative to the repository. Paths outside it are skipped.
std::vector<std::filesystem::path> owned_paths(const config::Config &config,
                                               const std::filesystem::path &repo_root,
                                               const std::filesystem::path &lock_path) {
  std::vector<std::filesystem::path> absolute{
      config.project_root / ".warden",
      config::resolve_path(config, config.session.archive_dir),
      config::resolve_path(config, config.gate.audit_db),
      marker_path(config),
      worklist_path(config),
      lock_path,
  };
  if (!common::trim(config.observability.log_file).empty()) {
    absolute.push_back(config::resolve_path(config, config.observability.log_file));
  }

  const auto root = without_trailing_slash(repo_root);
  std::vector<std::filesystem::path> out;
  for (const auto &path : absolute) {
    const auto relative = without_trailing_slash(path).lexically_relative(root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
      continue;
    }
    if (std::find(out.begin(), out.end(), relative) == out.end()) {
      out.push_back(relative);
    }
  }
  return out;
}

common::Status write_marker(const config::Config &config, const common::TimePoint at) {
  return common::write_file_atomic(marker_path(config), common::format_rfc3339(at) + "\n");
}

std::optional<common::TimePoint> read_marker(const config::Config &config) {
  const auto path = marker_path(config);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return std::nullopt;
  }
  const auto at = common::parse_rfc3339(common::trim(content.value()));
  if (!at.ok()) {
    std::cerr << "warning: ignoring unreadable session marker " << path.string() << "\n";
    return std::nullopt;
  }
  return at.value();
}

std::unique_ptr<gate::IGate> build_gate(const common::Result<config::Config> &config) {
  if (!config.ok()) {
    return std::make_unique<gate::FailClosedGate>(config.error());
  }
  auto rules = gate::build_gate_rules(config.value().gate);
  if (!rules.ok()) {
    observability::record_error("gate", rules.error());
    return std::make_unique<gate::FailClosedGate>(rules.error());
  }
  return std::make_unique<gate::GuardrailGate>(std::move(rules.value()),
                                               config.value().project_root);
}

gate::GateDecision evaluate_observed(const gate::IGate &gate,
                                     const gate::ToolInvocation &invocation) {
  const auto started = std::chrono::steady_clock::now();
  auto decision = gate.evaluate(invocation);
  observability::record_gate_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));
  observability::record_gate_decision(std::string(gate::operation_kind_to_string(invocation.kind)),
                                      invocation.target, decision.allowed,
                                      decision.reason.value_or(""),
                                      decision.matched_rule.value_or(""));
  for (const auto &advisory : decision.advisories) {
    observability::record_advisory(invocation.target, advisory);
  }
  return decision;
}

std::string decision_json(const gate::GateDecision &decision) {
  std::ostringstream out;
  out << "{\"allowed\":" << (decision.allowed ? "true" : "false") << ",\"message\":\""
      << common::json_escape(decision.message()) << "\"";
  if (decision.matched_rule.has_value()) {
    out << ",\"rule\":\"" << common::json_escape(*decision.matched_rule) << "\"";
  }
  if (!decision.advisories.empty()) {
    out << ",\"advisories\":[";
    for (std::size_t i = 0; i < decision.advisories.size(); ++i) {
      if (i > 0) {
        out << ',';
      }
      out << "\"" << common::json_escape(decision.advisories[i]) << "\"";
    }
    out << "]";
  }
  out << "}";
  return out.str();
}

int report_decision(const gate::GateDecision &decision) {
  if (decision.allowed) {
    for (const auto &advisory : decision.advisories) {
      std::cerr << advisory << "\n";
    }
    return kExitOk;
  }
  std::cerr << decision.message() << "\n";
  return kExitBlocked;
}

void audit_decision(const config::Config &config, const gate::ToolInvocation &invocation,
                    const gate::GateDecision &decision) {
  if (!config.gate.audit || common::trim(config.gate.audit_db).empty()) {
    return;
  }
  gate::AuditLog audit(config::resolve_path(config, config.gate.audit_db));
  const auto status = audit.record(invocation, decision);
  if (!status.ok()) {
    observability::record_error("gate.audit", status.error());
  }
}

int run_gate() {
  const std::string payload = read_stdin_all();
  const auto now = common::Clock::now();
  const auto config = load_runtime_config();
  if (!config.ok()) {
    observability::set_global_observer(std::make_unique<observability::LogObserver>());
    observability::record_error("config", config.error());
  }
  const auto gate = build_gate(config);

  const auto parsed = gate::parse_invocation(payload, now);
  if (!parsed.ok()) {
    const auto decision = gate::GateDecision::block(parsed.error(), parsed.kind());
    observability::record_error("gate.payload", parsed.error());
    std::cout << decision_json(decision) << "\n";
    return report_decision(decision);
  }
  if (!parsed.value().has_value()) {
    std::cout << "{\"allowed\":true,\"message\":\"not gated\"}\n";
    return kExitOk;
  }

  const auto &invocation = *parsed.value();
  const auto decision = evaluate_observed(*gate, invocation);

  if (config.ok()) {
    audit_decision(config.value(), invocation, decision);
    // The first gated operation opens the session.
    std::error_code ec;
    if (!std::filesystem::exists(marker_path(config.value()), ec)) {
      const auto status = write_marker(config.value(), now);
      if (!status.ok()) {
        observability::record_error("session.marker", status.error());
      }
    }
  }

  std::cout << decision_json(decision) << "\n";
  return report_decision(decision);
}

int run_check(const gate::OperationKind kind, std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "missing " << (kind == gate::OperationKind::ShellCommand ? "command" : "path")
              << "\n";
    return kExitError;
  }
  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
  }
  const auto gate = build_gate(config);

  gate::ToolInvocation invocation;
  invocation.kind = kind;
  invocation.target = kind == gate::OperationKind::ShellCommand ? join_tokens(args) : args[0];
  invocation.requested_at = common::Clock::now();
  std::error_code ec;
  invocation.working_dir = std::filesystem::current_path(ec);

  const auto decision = evaluate_observed(*gate, invocation);
  std::cout << decision.message() << "\n";
  return decision.allowed ? kExitOk : kExitBlocked;
}

int run_session_start() {
  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
    return kExitError;
  }
  const auto now = common::Clock::now();
  const auto status = write_marker(config.value(), now);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return kExitError;
  }
  std::cout << "session started at " << common::format_rfc3339(now) << "\n";
  return kExitOk;
}

int run_close_session(std::vector<std::string> args) {
  std::string since;
  std::string notes_path;
  const bool has_since = take_option(args, "--since", "", since);
  const bool has_notes = take_option(args, "--notes", "", notes_path);
  const auto done = take_repeated_option(args, "--done");
  const auto wip = take_repeated_option(args, "--wip");
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return kExitError;
  }

  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
    return kExitError;
  }
  const auto &cfg = config.value();
  const auto now = common::Clock::now();

  session::SessionContext context;
  context.now = now;
  if (has_since) {
    const auto start = common::parse_time_spec(since, now);
    if (!start.ok()) {
      std::cerr << "invalid --since: " << start.error() << "\n";
      return kExitError;
    }
    context.window_start = start.value();
  } else if (const auto marker = read_marker(cfg); marker.has_value()) {
    context.window_start = *marker;
  } else {
    context.window_start = now - std::chrono::hours(cfg.session.default_window_hours);
  }

  if (has_notes) {
    if (notes_path == "-") {
      context.notes = read_stdin_all();
    } else {
      const auto notes = common::read_file(common::expand_path(notes_path));
      if (!notes.ok()) {
        std::cerr << notes.error() << "\n";
        return kExitError;
      }
      context.notes = notes.value();
    }
  }
  context.completed = done;
  context.in_progress = wip;
  context.project_name = cfg.project_root.filename().string();
  context.effort = session::EffortRates{.critical_hours = cfg.effort.critical_hours,
                                        .high_hours = cfg.effort.high_hours,
                                        .medium_hours = cfg.effort.medium_hours,
                                        .low_hours = cfg.effort.low_hours};
  context.worklist_path = worklist_path(cfg);

  worklist::WorklistLock lock(context.worklist_path);
  if (const auto locked = lock.acquire(); !locked.ok()) {
    std::cerr << locked.error() << "\n";
    return kExitError;
  }
  auto store = worklist::WorklistStore::load(context.worklist_path, cfg.session.worklist_title);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return kExitError;
  }

  repo::PosixProcessRunner runner;
  const auto repo_root = config::resolve_path(cfg, cfg.repository.path);
  repo::RepositoryInspector inspector(
      repo_root, runner,
      repo::InspectorOptions{.git_binary = cfg.repository.git_binary,
                             .timeout = std::chrono::milliseconds(cfg.repository.timeout_ms),
                             .ignored_paths = owned_paths(cfg, repo_root, lock.path())});
  session::ArchiveWriter archive(config::resolve_path(cfg, cfg.session.archive_dir));
  session::SessionRecorder recorder(inspector, archive);

  const auto report = recorder.close_session(context, store.value());
  lock.release();

  for (const auto &note : report.diagnostics) {
    std::cerr << "note: " << note << "\n";
  }
  for (const auto &ref : report.unresolved) {
    std::cerr << "warning: no work item matches '" << ref << "'\n";
  }
  for (const auto &failure : report.failures()) {
    std::cerr << "failed: " << failure << "\n";
  }

  if (!report.succeeded()) {
    std::cerr << "session close failed: no artifacts were written\n";
    return kExitError;
  }

  std::cout << "session archived to " << report.archive.directory.string() << "\n";
  for (const auto &artifact : report.archive.artifacts) {
    if (artifact.status.ok()) {
      std::cout << "  " << artifact.name << "\n";
    }
  }
  std::cout << "commits: " << report.metrics.commits
            << ", tasks completed: " << report.completed_ids.size()
            << ", tasks added: " << report.added_ids.size() << "\n";

  std::error_code ec;
  std::filesystem::remove(marker_path(cfg), ec);
  return kExitOk;
}

void print_item(const worklist::WorkItem &item) {
  std::cout << "[" << worklist::status_marker(item.status) << "] " << item.id << " ("
            << worklist::priority_to_string(item.priority) << ") " << item.description << "\n";
}

int run_worklist(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: warden worklist list|add|done|start\n";
    return kExitError;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
    return kExitError;
  }
  const auto &cfg = config.value();
  const auto path = worklist_path(cfg);

  if (action == "list") {
    const auto store = worklist::WorklistStore::load(path, cfg.session.worklist_title);
    if (!store.ok()) {
      std::cerr << store.error() << "\n";
      return kExitError;
    }
    for (const worklist::Priority priority : worklist::kPriorities) {
      for (const auto *item : store.value().items_by_priority(priority)) {
        print_item(*item);
      }
    }
    const auto counts = store.value().counts();
    std::cout << counts.total << " items: " << counts.completed << " completed, "
              << counts.in_progress << " in progress, " << counts.pending << " pending\n";
    return kExitOk;
  }

  if (action != "add" && action != "done" && action != "start") {
    std::cerr << "unknown worklist action: " << action << "\n";
    return kExitError;
  }

  std::string priority_raw = "medium";
  (void)take_option(args, "--priority", "-p", priority_raw);
  if (args.empty()) {
    std::cerr << "missing " << (action == "add" ? "description" : "item id") << "\n";
    return kExitError;
  }

  worklist::WorklistLock lock(path);
  if (const auto locked = lock.acquire(); !locked.ok()) {
    std::cerr << locked.error() << "\n";
    return kExitError;
  }
  auto store = worklist::WorklistStore::load(path, cfg.session.worklist_title);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return kExitError;
  }

  std::string message;
  if (action == "add") {
    const auto priority = worklist::priority_from_string(priority_raw);
    if (!priority.ok()) {
      std::cerr << priority.error() << "\n";
      return kExitError;
    }
    const auto id = store.value().add(join_tokens(args), priority.value());
    if (!id.ok()) {
      std::cerr << id.error() << "\n";
      return kExitError;
    }
    message = "added " + id.value();
  } else {
    const auto target =
        action == "done" ? worklist::ItemStatus::Completed : worklist::ItemStatus::InProgress;
    const std::string ref = join_tokens(args);
    const auto *item = store.value().find(ref);
    if (item == nullptr) {
      std::cerr << "no work item matches '" << ref << "'\n";
      return kExitError;
    }
    const std::string id = item->id;
    const auto status = store.value().set_status(id, target);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return kExitError;
    }
    message = id + " " + std::string(worklist::status_to_string(target));
  }

  store.value().touch(common::Clock::now());
  const auto saved = store.value().save(path);
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return kExitError;
  }
  std::cout << message << "\n";
  return kExitOk;
}

int run_audit(std::vector<std::string> args) {
  std::string limit_raw;
  std::size_t limit = kDefaultAuditLimit;
  if (take_option(args, "--limit", "-n", limit_raw)) {
    const auto *end = limit_raw.data() + limit_raw.size();
    const auto [ptr, ec] = std::from_chars(limit_raw.data(), end, limit);
    if (ec != std::errc() || ptr != end || limit == 0) {
      std::cerr << "invalid --limit: " << limit_raw << "\n";
      return kExitError;
    }
  }

  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
    return kExitError;
  }
  const auto db_path = config::resolve_path(config.value(), config.value().gate.audit_db);
  std::error_code ec;
  if (!std::filesystem::exists(db_path, ec)) {
    std::cout << "no gate decisions recorded\n";
    return kExitOk;
  }

  gate::AuditLog audit(db_path);
  const auto entries = audit.recent(limit);
  if (!entries.ok()) {
    std::cerr << entries.error() << "\n";
    return kExitError;
  }
  for (const auto &entry : entries.value()) {
    std::cout << common::format_rfc3339(entry.recorded_at) << "  "
              << (entry.allowed ? "ALLOW" : "BLOCK") << "  "
              << gate::operation_kind_to_string(entry.kind) << "  " << entry.target;
    if (entry.rule_id.has_value()) {
      std::cout << "  [" << *entry.rule_id << "]";
    }
    if (entry.reason.has_value()) {
      std::cout << "  " << *entry.reason;
    }
    std::cout << "\n";
    for (const auto &advisory : entry.advisories) {
      std::cout << "    " << advisory << "\n";
    }
  }
  return kExitOk;
}

int run_rules() {
  const auto config = load_runtime_config();
  if (!config.ok()) {
    std::cerr << "configuration error: " << config.error() << "\n";
    return kExitError;
  }
  const auto rules = gate::build_gate_rules(config.value().gate);
  if (!rules.ok()) {
    std::cerr << rules.error() << "\n";
    return kExitError;
  }
  for (const auto *set : {&rules.value().protected_files, &rules.value().hard_block_commands,
                          &rules.value().caution_commands}) {
    std::cout << set->name() << " (" << set->size() << ")\n";
    for (const auto &rule : set->rules()) {
      std::cout << "  " << rule.id << "  " << rule.pattern << "\n";
    }
  }
  return kExitOk;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: warden [--config PATH] <command> [options]\n\n";
  std::cout << "gate\n";
  std::cout << "  gate                       Evaluate a tool invocation read from stdin\n";
  std::cout << "  check-file PATH            Evaluate a file write\n";
  std::cout << "  check-command CMD...       Evaluate a shell command\n";
  std::cout << "  rules                      List the loaded rule sets\n";
  std::cout << "  audit [--limit N]          Show recent gate decisions\n\n";
  std::cout << "session\n";
  std::cout << "  session-start              Mark the start of a session\n";
  std::cout << "  close-session [--since SPEC] [--notes FILE] [--done ID]... [--wip ID]...\n";
  std::cout << "                             Archive the session and update the worklist\n\n";
  std::cout << "worklist\n";
  std::cout << "  worklist list\n";
  std::cout << "  worklist add [--priority P] TEXT\n";
  std::cout << "  worklist done ID\n";
  std::cout << "  worklist start ID\n\n";
  std::cout << "other\n";
  std::cout << "  config-path                Print the config file location\n";
  std::cout << "  version                    Print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return kExitOk;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return kExitError;
  }
  if (args.empty()) {
    print_help();
    return kExitOk;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return kExitOk;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return kExitOk;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return kExitError;
    }
    std::cout << path_result.value().string() << "\n";
    return kExitOk;
  }
  if (subcommand == "gate") {
    return run_gate();
  }
  if (subcommand == "check-file") {
    return run_check(gate::OperationKind::FileWrite, std::move(args));
  }
  if (subcommand == "check-command") {
    return run_check(gate::OperationKind::ShellCommand, std::move(args));
  }
  if (subcommand == "session-start") {
    return run_session_start();
  }
  if (subcommand == "close-session") {
    return run_close_session(std::move(args));
  }
  if (subcommand == "worklist") {
    return run_worklist(std::move(args));
  }
  if (subcommand == "audit") {
    return run_audit(std::move(args));
  }
  if (subcommand == "rules") {
    return run_rules();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return kExitError;
}

} // namespace warden::cli
