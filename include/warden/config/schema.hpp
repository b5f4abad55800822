#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden::config {

struct GateConfig {
  // Built-in rules are placed before the configured ones when enabled.
  bool use_default_rules = true;
  std::vector<std::string> protected_files;
  std::vector<std::string> hard_block_commands;
  std::vector<std::string> caution_commands;
  bool audit = true;
  std::string audit_db = ".warden/audit.db";
};

struct RepositoryConfig {
  std::string path = ".";
  std::string git_binary = "git";
  std::uint64_t timeout_ms = 10'000;
};

struct SessionConfig {
  std::string archive_dir = ".warden/sessions";
  std::string worklist_path = "TODO.md";
  std::string worklist_title = "Worklist";
  std::string marker_path = ".warden/session.start";
  std::int64_t default_window_hours = 8;
};

struct EffortConfig {
  double critical_hours = 4.0;
  double high_hours = 3.0;
  double medium_hours = 2.0;
  double low_hours = 1.0;
};

struct ObservabilityConfig {
  std::string backend = "log";
  // Relative to the project root; empty logs to stderr.
  std::string log_file = ".warden/warden.log";
};

struct Config {
  std::filesystem::path project_root;
  GateConfig gate;
  RepositoryConfig repository;
  SessionConfig session;
  EffortConfig effort;
  ObservabilityConfig observability;
};

} // namespace warden::config
