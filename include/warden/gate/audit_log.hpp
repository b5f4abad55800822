#pragma once

#include "warden/common/result.hpp"
#include "warden/common/time.hpp"
#include "warden/gate/gate.hpp"

#include <filesystem>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace warden::gate {

struct AuditEntry {
  std::int64_t id = 0;
  common::TimePoint recorded_at{};
  OperationKind kind = OperationKind::ShellCommand;
  std::string target;
  bool allowed = true;
  std::optional<std::string> reason;
  std::optional<std::string> rule_id;
  std::vector<std::string> advisories;
};

/// Append-only journal of gate decisions.
class AuditLog {
public:
  explicit AuditLog(std::filesystem::path db_path);
  ~AuditLog();

  AuditLog(const AuditLog &) = delete;
  AuditLog &operator=(const AuditLog &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  [[nodiscard]] common::Status record(const ToolInvocation &invocation,
                                      const GateDecision &decision);
  /// Newest first.
  [[nodiscard]] common::Result<std::vector<AuditEntry>> recent(std::size_t limit);
  [[nodiscard]] common::Result<std::size_t> count();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
};

} // namespace warden::gate
