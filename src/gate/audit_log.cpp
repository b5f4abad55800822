#include "warden/gate/audit_log.hpp"

#include "warden/common/fs.hpp"

namespace warden::gate {

namespace {

constexpr const char *kNotOpen = "audit db not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (const auto &line : lines) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += line;
  }
  return out;
}

std::optional<std::string> column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return std::nullopt;
  }
  return std::string(text);
}

void bind_optional(sqlite3_stmt *stmt, const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

} // namespace

AuditLog::AuditLog(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  if (!init_schema().ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

AuditLog::~AuditLog() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status AuditLog::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotOpen);
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS gate_decisions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  recorded_at INTEGER NOT NULL,
  kind TEXT NOT NULL,
  target TEXT NOT NULL,
  allowed INTEGER NOT NULL,
  reason TEXT,
  rule_id TEXT,
  advisories TEXT NOT NULL DEFAULT ''
);
)");
}

common::Status AuditLog::record(const ToolInvocation &invocation, const GateDecision &decision) {
  if (db_ == nullptr) {
    return common::Status::error(kNotOpen);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO gate_decisions(recorded_at, kind, target, allowed, reason, "
                    "rule_id, advisories) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const auto recorded_at = invocation.requested_at == common::TimePoint{}
                               ? common::Clock::now()
                               : invocation.requested_at;
  const std::string kind(operation_kind_to_string(invocation.kind));
  const std::string advisories = join_lines(decision.advisories);
  sqlite3_bind_int64(stmt, 1, common::to_unix_seconds(recorded_at));
  sqlite3_bind_text(stmt, 2, kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, invocation.target.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 4, decision.allowed ? 1 : 0);
  bind_optional(stmt, 5, decision.reason);
  bind_optional(stmt, 6, decision.matched_rule);
  sqlite3_bind_text(stmt, 7, advisories.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<AuditEntry>> AuditLog::recent(const std::size_t limit) {
  if (db_ == nullptr) {
    return common::Result<std::vector<AuditEntry>>::failure(kNotOpen);
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id, recorded_at, kind, target, allowed, reason, rule_id, advisories "
                    "FROM gate_decisions ORDER BY id DESC LIMIT ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<AuditEntry>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<AuditEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    AuditEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.recorded_at = common::from_unix_seconds(sqlite3_column_int64(stmt, 1));
    const auto kind = operation_kind_from_string(column_text(stmt, 2).value_or(""));
    entry.kind = kind.ok() ? kind.value() : OperationKind::ShellCommand;
    entry.target = column_text(stmt, 3).value_or("");
    entry.allowed = sqlite3_column_int(stmt, 4) != 0;
    entry.reason = column_text(stmt, 5);
    entry.rule_id = column_text(stmt, 6);
    const std::string advisories = column_text(stmt, 7).value_or("");
    if (!advisories.empty()) {
      entry.advisories = common::split_lines(advisories);
    }
    out.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<AuditEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<AuditEntry>>::success(std::move(out));
}

common::Result<std::size_t> AuditLog::count() {
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(kNotOpen);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM gate_decisions", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace warden::gate
