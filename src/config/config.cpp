#include "warden/config/config.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/toml.hpp"

#include <cstdlib>
#include <sstream>
#include <utility>

namespace warden::config {

namespace {

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("WARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

common::Result<Config> config_failure(const std::string &message) {
  return common::Result<Config>::failure(message, common::ErrorKind::ConfigurationError);
}

} // namespace

common::Result<std::filesystem::path> project_root() {
  if (const auto env = env_value("WARDEN_PROJECT_DIR"); env.has_value()) {
    std::filesystem::path root(common::expand_path(*env));
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
      return common::Result<std::filesystem::path>::failure(
          "WARDEN_PROJECT_DIR is not a directory: " + root.string(),
          common::ErrorKind::ConfigurationError);
    }
    return common::Result<std::filesystem::path>::success(
        std::filesystem::absolute(root, ec).lexically_normal());
  }

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        "unable to resolve current directory: " + ec.message(),
        common::ErrorKind::ConfigurationError);
  }
  return common::Result<std::filesystem::path>::success(cwd);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / kConfigFilename);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto root = project_root();
  if (!root.ok()) {
    return root;
  }
  return common::Result<std::filesystem::path>::success(root.value() / kConfigFolder /
                                                        kConfigFilename);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path resolve_path(const Config &config, const std::string &value) {
  return common::resolve_against(value, config.project_root);
}

void apply_env_overrides(Config &config) {
  if (const auto dir = env_value("WARDEN_PROJECT_DIR"); dir.has_value()) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(common::expand_path(*dir), ec);
    if (!ec) {
      config.project_root = absolute.lexically_normal();
    }
  }

  if (const auto timeout = env_value("WARDEN_GIT_TIMEOUT_MS"); timeout.has_value()) {
    char *end = nullptr;
    const unsigned long long parsed = std::strtoull(timeout->c_str(), &end, 10);
    if (end != nullptr && *end == '\0' && timeout->front() != '-') {
      config.repository.timeout_ms = static_cast<std::uint64_t>(parsed);
    }
  }

  if (const auto backend = env_value("WARDEN_OBSERVABILITY"); backend.has_value()) {
    config.observability.backend = common::to_lower(common::trim(*backend));
  }

  if (const auto log_file = env_value("WARDEN_LOG_FILE"); log_file.has_value()) {
    config.observability.log_file = *log_file;
  }
}

common::Result<Config> parse_config(const std::string &toml_text,
                                    const std::filesystem::path &root) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return config_failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.project_root = root;

  config.gate.use_default_rules = doc.get_bool("gate.use_default_rules", true);
  config.gate.protected_files = doc.get_string_array("gate.protected_files");
  config.gate.hard_block_commands = doc.get_string_array("gate.hard_block_commands");
  config.gate.caution_commands = doc.get_string_array("gate.caution_commands");
  config.gate.audit = doc.get_bool("gate.audit", config.gate.audit);
  config.gate.audit_db = doc.get_string("gate.audit_db", config.gate.audit_db);

  config.repository.path = doc.get_string("repository.path", config.repository.path);
  config.repository.git_binary =
      doc.get_string("repository.git_binary", config.repository.git_binary);
  const std::int64_t timeout = doc.get_int(
      "repository.timeout_ms", static_cast<std::int64_t>(config.repository.timeout_ms));
  if (timeout < 0) {
    return config_failure("repository.timeout_ms must not be negative");
  }
  config.repository.timeout_ms = static_cast<std::uint64_t>(timeout);

  config.session.archive_dir = doc.get_string("session.archive_dir", config.session.archive_dir);
  config.session.worklist_path =
      doc.get_string("session.worklist_path", config.session.worklist_path);
  config.session.worklist_title =
      doc.get_string("session.worklist_title", config.session.worklist_title);
  config.session.marker_path = doc.get_string("session.marker_path", config.session.marker_path);
  config.session.default_window_hours =
      doc.get_int("session.default_window_hours", config.session.default_window_hours);

  config.effort.critical_hours = doc.get_double("effort.critical_hours", config.effort.critical_hours);
  config.effort.high_hours = doc.get_double("effort.high_hours", config.effort.high_hours);
  config.effort.medium_hours = doc.get_double("effort.medium_hours", config.effort.medium_hours);
  config.effort.low_hours = doc.get_double("effort.low_hours", config.effort.low_hours);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.log_file =
      doc.get_string("observability.log_file", config.observability.log_file);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto root = project_root();
  if (!root.ok()) {
    return common::Result<Config>::failure(root.status());
  }

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.project_root = root.value();
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return config_failure(content.error());
  }

  auto config = parse_config(content.value(), root.value());
  if (!config.ok()) {
    return config_failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  std::ostringstream file;
  file << "[gate]\n";
  file << "use_default_rules = " << bool_to_toml(config.gate.use_default_rules) << "\n";
  file << "protected_files = " << string_array_to_toml(config.gate.protected_files) << "\n";
  file << "hard_block_commands = " << string_array_to_toml(config.gate.hard_block_commands)
       << "\n";
  file << "caution_commands = " << string_array_to_toml(config.gate.caution_commands) << "\n";
  file << "audit = " << bool_to_toml(config.gate.audit) << "\n";
  file << "audit_db = " << common::quote_toml_string(config.gate.audit_db) << "\n";

  file << "\n[repository]\n";
  file << "path = " << common::quote_toml_string(config.repository.path) << "\n";
  file << "git_binary = " << common::quote_toml_string(config.repository.git_binary) << "\n";
  file << "timeout_ms = " << config.repository.timeout_ms << "\n";

  file << "\n[session]\n";
  file << "archive_dir = " << common::quote_toml_string(config.session.archive_dir) << "\n";
  file << "worklist_path = " << common::quote_toml_string(config.session.worklist_path) << "\n";
  file << "worklist_title = " << common::quote_toml_string(config.session.worklist_title) << "\n";
  file << "marker_path = " << common::quote_toml_string(config.session.marker_path) << "\n";
  file << "default_window_hours = " << config.session.default_window_hours << "\n";

  file << "\n[effort]\n";
  file << "critical_hours = " << config.effort.critical_hours << "\n";
  file << "high_hours = " << config.effort.high_hours << "\n";
  file << "medium_hours = " << config.effort.medium_hours << "\n";
  file << "low_hours = " << config.effort.low_hours << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_file = " << common::quote_toml_string(config.observability.log_file) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.repository.timeout_ms == 0) {
    return ValidationResult::failure("repository.timeout_ms must be greater than zero",
                                     common::ErrorKind::ConfigurationError);
  }
  if (common::trim(config.repository.git_binary).empty()) {
    return ValidationResult::failure("repository.git_binary must not be empty",
                                     common::ErrorKind::ConfigurationError);
  }
  if (common::trim(config.session.archive_dir).empty()) {
    return ValidationResult::failure("session.archive_dir must not be empty",
                                     common::ErrorKind::ConfigurationError);
  }
  if (common::trim(config.session.worklist_path).empty()) {
    return ValidationResult::failure("session.worklist_path must not be empty",
                                     common::ErrorKind::ConfigurationError);
  }
  if (config.session.default_window_hours <= 0) {
    return ValidationResult::failure("session.default_window_hours must be positive",
                                     common::ErrorKind::ConfigurationError);
  }

  std::stringstream backends(config.observability.backend);
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::to_lower(common::trim(backend));
    if (backend != "log" && backend != "none" && backend != "noop") {
      return ValidationResult::failure("Invalid observability.backend: " +
                                           config.observability.backend,
                                       common::ErrorKind::ConfigurationError);
    }
  }

  const std::pair<const char *, double> efforts[] = {
      {"effort.critical_hours", config.effort.critical_hours},
      {"effort.high_hours", config.effort.high_hours},
      {"effort.medium_hours", config.effort.medium_hours},
      {"effort.low_hours", config.effort.low_hours},
  };
  for (const auto &[key, hours] : efforts) {
    if (hours < 0.0) {
      return ValidationResult::failure(std::string(key) + " must not be negative",
                                       common::ErrorKind::ConfigurationError);
    }
  }

  if (!config.gate.use_default_rules && config.gate.protected_files.empty() &&
      config.gate.hard_block_commands.empty() && config.gate.caution_commands.empty()) {
    warnings.push_back("gate.use_default_rules is false and no rules are configured; every "
                       "operation will be allowed");
  }
  if (config.gate.audit && common::trim(config.gate.audit_db).empty()) {
    warnings.push_back("gate.audit is enabled but gate.audit_db is empty; auditing is skipped");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace warden::config
