#pragma once

#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

inline constexpr const char *kConfigFolder = ".warden";
inline constexpr const char *kConfigFilename = "config.toml";

/// `WARDEN_PROJECT_DIR`, else the process working directory.
[[nodiscard]] common::Result<std::filesystem::path> project_root();

/// `--config`, else `WARDEN_CONFIG_PATH`, else `<project>/.warden/config.toml`.
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text,
                                                  const std::filesystem::path &root);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Resolve a configured path against the project root.
[[nodiscard]] std::filesystem::path resolve_path(const Config &config, const std::string &value);

} // namespace warden::config
